#pragma once

#include <utility>
#include <vector>

#include "wl/model.hpp"

namespace wl {

// Nearest rank over an ascending list: index = floor(p * n) clamped to [0, n-1].
// p is a fraction (0.95 for p95). Empty input gives 0.
double percentile_nearest_rank(const std::vector<double>& sorted, double p);

// min/max/average/median/p95/p99 over response times in ms; all zero when empty
ResponseTimeStats response_time_stats(const std::vector<double>& times_ms);

// Extra percentiles pctl (0..100, clamped) using the same rank rule.
std::vector<std::pair<int,double>> percentiles_of(const std::vector<double>& times_ms,
                                                  const std::vector<int>& pctl);

// Rates come from the wall-clock span of the run, not the sum of call times.
ThroughputStats throughput_stats(long long total_requests,
                                 size_t total_bytes,
                                 size_t response_count,
                                 double elapsed_ms);

// What the coordinator knows about a run besides its outcomes.
struct RunInfo {
    RequestDescriptor     request;
    int                   thread_count{};
    int                   iterations{};
    WallClock::time_point start_time{};
    WallClock::time_point end_time{};
    double                elapsed_ms{};
    RunStatus             status = RunStatus::Completed;
    bool                  budget_exhausted = false;
    std::vector<int>      pctl;
};

// Pure: the same outcomes and info always give the same result.
AggregateResult aggregate_outcomes(std::vector<CallOutcome> outcomes, const RunInfo& info);

} // namespace wl
