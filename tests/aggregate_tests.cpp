#include <cstdlib>
#include <vector>
#include <string>
#include <string_view>
#include <iostream>
#include <cmath>
#include <iterator>
#include <limits>

#include "wl/aggregate.hpp"

using namespace wl;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool approx(double a, double b, double eps = 1e-9)
{
    return std::fabs(a - b) <= eps;
}

static double get_pct_value(const std::vector<std::pair<int,double>>& v, int p)
{
    for (const auto& kv : v)
    {
        if (kv.first == p) return kv.second;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

static CallOutcome ok(long long idx, double ms, int status = 200, size_t bytes = 0)
{
    CallSuccess s{};
    s.call_index = idx;
    s.status_code = status;
    s.response_ms = ms;
    s.body_bytes = bytes;
    return s;
}

static CallOutcome fail(long long idx, ErrorKind kind, std::string msg)
{
    ExecutionError e{};
    e.call_index = idx;
    e.kind = kind;
    e.message = std::move(msg);
    return e;
}

static RunInfo info_for(double elapsed_ms)
{
    RunInfo info;
    info.thread_count = 2;
    info.iterations = 3;
    info.start_time = WallClock::now();
    info.end_time = info.start_time + std::chrono::milliseconds(static_cast<long long>(elapsed_ms));
    info.elapsed_ms = elapsed_ms;
    return info;
}

static void test_nearest_rank_index()
{
    const std::vector<double> s{1.0, 2.0, 3.0, 4.0};
    assert_true(approx(percentile_nearest_rank(s, 0.0), 1.0), "p0 -> first");
    assert_true(approx(percentile_nearest_rank(s, 0.25), 2.0), "floor(0.25*4)=1");
    assert_true(approx(percentile_nearest_rank(s, 0.50), 3.0), "floor(0.5*4)=2");
    assert_true(approx(percentile_nearest_rank(s, 0.99), 4.0), "floor(0.99*4)=3");
    assert_true(approx(percentile_nearest_rank(s, 1.0), 4.0), "p100 clamped to last");
    assert_true(approx(percentile_nearest_rank({}, 0.5), 0.0), "empty -> 0");
}

static void test_empty_stats_are_zero()
{
    ResponseTimeStats st = response_time_stats({});
    assert_true(approx(st.min, 0.0) && approx(st.max, 0.0) && approx(st.average, 0.0), "empty min/avg/max");
    assert_true(approx(st.median, 0.0) && approx(st.p95, 0.0) && approx(st.p99, 0.0), "empty percentiles");
    assert_true(percentiles_of({}, {50}).empty(), "no extra percentiles without data");
}

static void test_stats_unsorted_input()
{
    ResponseTimeStats st = response_time_stats({4.0, 1.0, 3.0, 2.0});
    assert_true(approx(st.min, 1.0) && approx(st.max, 4.0), "min/max");
    assert_true(approx(st.average, 2.5), "average");
    assert_true(approx(st.median, 3.0), "median = sorted[n/2]");
}

static void test_monotonic_percentiles()
{
    std::vector<double> t;
    for (int i = 0; i < 257; ++i) t.push_back(static_cast<double>((i * 37) % 101) + 0.5);
    ResponseTimeStats st = response_time_stats(t);
    assert_true(st.min <= st.median && st.median <= st.p95 && st.p95 <= st.p99 && st.p99 <= st.max,
                "min <= median <= p95 <= p99 <= max");
}

static void test_large_n_linear()
{
    std::vector<double> t;
    for (int i = 1; i <= 100; ++i) t.push_back(static_cast<double>(i));
    auto pv = percentiles_of(t, {1, 50, 99, 100});
    assert_true(approx(get_pct_value(pv, 1), 2.0), "p1 -> index 1");
    assert_true(approx(get_pct_value(pv, 50), 51.0), "p50 -> index 50");
    assert_true(approx(get_pct_value(pv, 99), 100.0), "p99 -> index 99");
    assert_true(approx(get_pct_value(pv, 100), 100.0), "p100 -> last");
}

static void test_clamp_keeps_keys()
{
    auto pv = percentiles_of({5.0, 7.0}, {-10, 150});
    assert_true(approx(get_pct_value(pv, -10), 5.0), "p-10 -> p0 value");
    assert_true(approx(get_pct_value(pv, 150), 7.0), "p150 -> p100 value");
}

static void test_throughput_uses_wall_clock()
{
    // 20 calls of 100 ms each across 5 workers finishing in ~400 ms
    ThroughputStats tp = throughput_stats(20, 2000, 20, 400.0);
    assert_true(approx(tp.requests_per_second, 50.0), "20 / 0.4 s");
    assert_true(approx(tp.bytes_per_second, 5000.0), "2000 B / 0.4 s");
    assert_true(tp.average_response_size == 100, "2000 / 20");

    ThroughputStats none = throughput_stats(0, 0, 0, 0.0);
    assert_true(approx(none.requests_per_second, 0.0) && none.average_response_size == 0, "zero elapsed");
}

static void test_aggregate_counts_and_distributions()
{
    std::vector<CallOutcome> outcomes{
        ok(1, 10.0, 200, 10),
        fail(2, ErrorKind::Timeout, "Request timed out after 50ms"),
        ok(3, 30.0, 500, 30),
        ok(4, 20.0, 200, 20),
        fail(5, ErrorKind::Timeout, "Request timed out after 50ms"),
        fail(6, ErrorKind::Network, "Connection refused"),
    };
    RunInfo info = info_for(1000.0);
    info.pctl = {50, 90};
    AggregateResult r = aggregate_outcomes(outcomes, info);

    assert_true(r.total_requests == 6, "total");
    assert_true(r.successful_requests == 3 && r.failed_requests == 3, "split");
    assert_true(r.successful_requests + r.failed_requests == r.total_requests, "sum invariant");
    assert_true(r.status_codes.at(200) == 2 && r.status_codes.at(500) == 1, "status distribution");
    assert_true(r.error_messages.at("Request timed out after 50ms") == 2, "messages grouped");
    assert_true(r.error_kinds.size() == std::size(kAllErrorKinds), "every kind present");
    assert_true(r.error_kinds.at(ErrorKind::Timeout) == 2 && r.error_kinds.at(ErrorKind::Network) == 1 &&
                r.error_kinds.at(ErrorKind::Unknown) == 0, "kind counts");
    assert_true(r.most_common_error_kind() == ErrorKind::Timeout, "most common kind");
    assert_true(approx(r.success_rate(), 50.0) && approx(r.failure_rate(), 50.0), "rates");
    assert_true(approx(r.response_times.average, 20.0), "average over successes only");
    assert_true(r.throughput.total_bytes == 60 && approx(r.throughput.requests_per_second, 6.0), "throughput");
    assert_true(r.percentiles.size() == 2, "extra percentiles present");
    assert_true(r.thread_count == 2 && r.iterations == 3, "parameters kept");
}

static void test_aggregate_empty_run()
{
    AggregateResult r = aggregate_outcomes({}, info_for(0.0));
    assert_true(r.total_requests == 0, "no calls");
    assert_true(approx(r.success_rate(), 0.0) && approx(r.failure_rate(), 0.0), "rates 0 without calls");
    assert_true(!r.most_common_error_kind(), "no most common kind");
    assert_true(approx(r.response_times.p99, 0.0), "zero stats");
}

static void test_aggregate_is_pure()
{
    std::vector<CallOutcome> outcomes{ok(1, 12.5), ok(2, 7.25), fail(3, ErrorKind::Unknown, "x")};
    const RunInfo info = info_for(250.0);
    AggregateResult a = aggregate_outcomes(outcomes, info);
    AggregateResult b = aggregate_outcomes(outcomes, info);
    assert_true(a.total_requests == b.total_requests, "same totals");
    assert_true(a.response_times.min == b.response_times.min && a.response_times.max == b.response_times.max &&
                a.response_times.average == b.response_times.average &&
                a.response_times.median == b.response_times.median &&
                a.response_times.p95 == b.response_times.p95 &&
                a.response_times.p99 == b.response_times.p99, "same response stats");
    assert_true(a.throughput.requests_per_second == b.throughput.requests_per_second, "same throughput");
    assert_true(a.status_codes == b.status_codes && a.error_messages == b.error_messages &&
                a.error_kinds == b.error_kinds, "same distributions");
}

static void test_end_never_before_start()
{
    RunInfo info = info_for(5.0);
    info.end_time = info.start_time - std::chrono::seconds(1);
    info.elapsed_ms = -3.0;
    AggregateResult r = aggregate_outcomes({ok(1, 1.0)}, info);
    assert_true(r.end_time >= r.start_time, "end >= start");
    assert_true(r.elapsed_ms >= 0.0, "elapsed non-negative");
}

int main()
{
    test_nearest_rank_index();
    test_empty_stats_are_zero();
    test_stats_unsorted_input();
    test_monotonic_percentiles();
    test_large_n_linear();
    test_clamp_keeps_keys();
    test_throughput_uses_wall_clock();
    test_aggregate_counts_and_distributions();
    test_aggregate_empty_run();
    test_aggregate_is_pure();
    test_end_never_before_start();
    std::cout << "aggregate tests: OK" << std::endl;
    return 0;
}
