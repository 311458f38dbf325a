#pragma once

#include <string>

#include "wl/model.hpp"

namespace wl
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct Progress;

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_header_text(const Options &opt);

std::string format_progress_text(const Progress &p);

std::string format_outcome_text(const CallOutcome &o);

std::string format_summary_text(const AggregateResult &r);

// "Total: N | Success: x.x% | Avg Time: Nms | RPS: x.x" (no newline)
std::string format_summary_line(const AggregateResult &r);

// NDJSON builders (single-line JSON strings without trailing newline)
std::string build_ndjson_outcome(const CallOutcome &o);

// Final JSON (single object string without trailing newline).
// Carries the request and parameters so the run can be replayed elsewhere.
std::string build_final_json(const AggregateResult &r);

// Milliseconds since the Unix epoch.
long long epoch_ms(WallClock::time_point t);
} // namespace wl
