#include "wl/output.hpp"

#include <sstream>
#include <iomanip>

#include "wl/engine.hpp"
#include "wl/options.hpp"
#include "wl/request.hpp"

namespace wl {

static const char* on_off(bool b) { return b ? "on" : "off"; }

long long epoch_ms(WallClock::time_point t)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::string format_header_text(const Options& opt)
{
    const RequestDescriptor req = resolve_request(to_descriptor(opt));
    std::ostringstream os;
    os << "Target: " << method_str(opt.method) << ' ' << req.url << '\n';
    os << "Threads: " << opt.threads
       << "  Iterations: " << opt.iterations
       << "  Total calls: " << to_parameters(opt).total_calls() << '\n';
    os << "Timeout: " << opt.timeout_ms << " ms"
       << "  Follow redirects: " << on_off(opt.follow_redirects)
       << "  Budget: ";
    if (opt.max_duration_ms > 0) os << opt.max_duration_ms << " ms";
    else os << "(none)";
    os << '\n';
    os << "Headers: " << opt.headers.size()
       << "  Body: ";
    if (opt.body) os << opt.body->size() << " bytes";
    else os << "(none)";
    os << '\n';
    return os.str();
}

std::string format_progress_text(const Progress& p)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);
    const double pct = p.total > 0 ? 100.0 * static_cast<double>(p.completed) / static_cast<double>(p.total) : 0.0;
    os << "progress: " << p.completed << '/' << p.total << " (" << pct << "%)"
       << " ok=" << p.succeeded << " failed=" << p.failed;
    if (p.average_ms) os << std::setprecision(3) << " avg=" << *p.average_ms << " ms";
    os << '\n';
    return os.str();
}

std::string format_outcome_text(const CallOutcome& o)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    if (const auto* ok = std::get_if<CallSuccess>(&o))
    {
        os << "call " << ok->call_index << ": " << ok->status_code;
        if (!ok->status_text.empty()) os << ' ' << ok->status_text;
        os << " - " << ok->response_ms << " ms, " << ok->body_bytes << " bytes\n";
    }
    else
    {
        const auto& e = std::get<ExecutionError>(o);
        os << "call " << e.call_index << ": " << error_kind_str(e.kind) << " - " << e.message << '\n';
        if (!e.cause.empty() && e.cause != e.message) os << "  cause: " << e.cause << '\n';
    }
    return os.str();
}

std::string format_summary_line(const AggregateResult& r)
{
    std::ostringstream os;
    os << "Total: " << r.total_requests
       << " | Success: " << std::fixed << std::setprecision(1) << r.success_rate() << '%'
       << " | Avg Time: " << std::setprecision(0) << r.response_times.average << "ms"
       << " | RPS: " << std::setprecision(1) << r.throughput.requests_per_second;
    return os.str();
}

std::string format_summary_text(const AggregateResult& r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "status: " << run_status_str(r.status);
    if (r.budget_exhausted) os << " (time budget exhausted)";
    os << '\n';
    os << "requests: total=" << r.total_requests
       << " ok=" << r.successful_requests
       << " failed=" << r.failed_requests
       << std::setprecision(1)
       << " (success " << r.success_rate() << "%, failure " << r.failure_rate() << "%)\n";
    os << std::setprecision(3);
    os << "elapsed: " << r.elapsed_ms << " ms\n";

    const auto& rt = r.response_times;
    os << "response time: min=" << rt.min
       << " ms, avg=" << rt.average
       << " ms, median=" << rt.median
       << " ms, p95=" << rt.p95
       << " ms, p99=" << rt.p99
       << " ms, max=" << rt.max << " ms\n";

    if (!r.percentiles.empty())
    {
        os << "percentiles: ";
        for (size_t i = 0; i < r.percentiles.size(); ++i)
        {
            if (i) os << ", ";
            os << 'p' << r.percentiles[i].first << '=' << r.percentiles[i].second;
        }
        os << '\n';
    }

    const auto& tp = r.throughput;
    os << std::setprecision(1);
    os << "throughput: " << tp.requests_per_second << " req/s, "
       << tp.bytes_per_second << " B/s, total " << tp.total_bytes
       << " B, avg response " << tp.average_response_size << " B\n";

    if (!r.status_codes.empty())
    {
        os << "status codes:";
        for (const auto& [code, n] : r.status_codes) os << ' ' << code << '=' << n;
        os << '\n';
    }
    if (r.failed_requests > 0)
    {
        os << "errors by kind:";
        for (const auto& [kind, n] : r.error_kinds)
        {
            if (n > 0) os << ' ' << error_kind_str(kind) << '=' << n;
        }
        os << '\n';
        for (const auto& [msg, n] : r.error_messages) os << "  " << n << "x " << msg << '\n';
    }
    os << format_summary_line(r) << '\n';
    return os.str();
}

} // namespace wl
