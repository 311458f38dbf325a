#include "wl/aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace wl {

double percentile_nearest_rank(const std::vector<double>& sorted, double p)
{
    if (sorted.empty()) return 0.0;
    const size_t n = sorted.size();
    const double raw = std::floor(std::clamp(p, 0.0, 1.0) * static_cast<double>(n));
    const size_t idx = std::min(static_cast<size_t>(raw), n - 1);
    return sorted[idx];
}

ResponseTimeStats response_time_stats(const std::vector<double>& times_ms)
{
    ResponseTimeStats st{};
    if (times_ms.empty()) return st;

    std::vector<double> sorted = times_ms;
    std::ranges::sort(sorted);
    st.min = sorted.front();
    st.max = sorted.back();
    st.average = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
                 static_cast<double>(sorted.size());
    st.median = percentile_nearest_rank(sorted, 0.50);
    st.p95 = percentile_nearest_rank(sorted, 0.95);
    st.p99 = percentile_nearest_rank(sorted, 0.99);
    return st;
}

std::vector<std::pair<int,double>> percentiles_of(const std::vector<double>& times_ms,
                                                  const std::vector<int>& pctl)
{
    std::vector<std::pair<int,double>> out;
    if (times_ms.empty()) return out;

    std::vector<double> sorted = times_ms;
    std::ranges::sort(sorted);
    out.reserve(pctl.size());
    for (int p : pctl)
    {
        const int pc = std::clamp(p, 0, 100);
        out.emplace_back(p, percentile_nearest_rank(sorted, pc / 100.0));
    }
    return out;
}

ThroughputStats throughput_stats(long long total_requests,
                                 size_t total_bytes,
                                 size_t response_count,
                                 double elapsed_ms)
{
    ThroughputStats tp{};
    tp.total_bytes = total_bytes;
    const double secs = elapsed_ms / 1000.0;
    if (secs > 0.0)
    {
        tp.requests_per_second = static_cast<double>(total_requests) / secs;
        tp.bytes_per_second = static_cast<double>(total_bytes) / secs;
    }
    tp.average_response_size = response_count ? total_bytes / response_count : 0;
    return tp;
}

AggregateResult aggregate_outcomes(std::vector<CallOutcome> outcomes, const RunInfo& info)
{
    AggregateResult r{};
    r.request = info.request;
    r.thread_count = info.thread_count;
    r.iterations = info.iterations;
    r.start_time = info.start_time;
    r.end_time = std::max(info.end_time, info.start_time);
    r.elapsed_ms = std::max(info.elapsed_ms, 0.0);
    r.status = info.status;
    r.budget_exhausted = info.budget_exhausted;
    for (ErrorKind k : kAllErrorKinds) r.error_kinds[k] = 0;

    for (auto& o : outcomes)
    {
        if (auto* ok = std::get_if<CallSuccess>(&o))
        {
            r.status_codes[ok->status_code]++;
            r.successes.push_back(std::move(*ok));
        }
        else
        {
            auto& err = std::get<ExecutionError>(o);
            r.error_messages[err.message]++;
            r.error_kinds[err.kind]++;
            r.failures.push_back(std::move(err));
        }
    }
    r.successful_requests = static_cast<long long>(r.successes.size());
    r.failed_requests = static_cast<long long>(r.failures.size());
    r.total_requests = r.successful_requests + r.failed_requests;

    std::vector<double> times;
    times.reserve(r.successes.size());
    size_t total_bytes = 0;
    for (const auto& s : r.successes)
    {
        times.push_back(s.response_ms);
        total_bytes += s.body_bytes;
    }

    r.response_times = response_time_stats(times);
    r.percentiles = percentiles_of(times, info.pctl);
    r.throughput = throughput_stats(r.total_requests, total_bytes, r.successes.size(), r.elapsed_ms);
    return r;
}

} // namespace wl
