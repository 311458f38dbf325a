#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>
#include <iostream>
#include <limits>

#include "wl/engine.hpp"
#include "wl/json.hpp"
#include "wl/options.hpp"
#include "wl/output.hpp"

using namespace wl;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static AggregateResult sample_result()
{
    AggregateResult r{};
    r.total_requests = 4;
    r.successful_requests = 3;
    r.failed_requests = 1;
    r.thread_count = 2;
    r.iterations = 2;
    r.status = RunStatus::Completed;
    r.elapsed_ms = 250.0;
    r.request.method = HttpMethod::POST;
    r.request.url = "http://h/items/{id}";
    r.request.headers["X-Trace"] = "a\"b";
    r.request.body = "{\"n\":1}";
    r.request.path_params["id"] = "9";
    r.response_times = {10.0, 30.0, 20.4, 20.0, 30.0, 30.0};
    r.throughput = {16.0, 240.0, 60, 20};
    r.percentiles = {{90, 30.0}};
    r.status_codes = {{200, 2}, {503, 1}};
    r.error_messages = {{"Connection refused", 1}};
    for (ErrorKind k : kAllErrorKinds) r.error_kinds[k] = 0;
    r.error_kinds[ErrorKind::Network] = 1;

    ExecutionError e{};
    e.call_index = 3;
    e.kind = ErrorKind::Network;
    e.message = "Connection refused";
    e.cause = "connection";
    r.failures.push_back(e);
    return r;
}

static void test_json_helpers()
{
    assert_true(json_escape("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001", "escape");
    assert_true(json_string("x") == "\"x\"", "quoted");
    assert_true(json_number(1.5) == "1.500", "3 decimals");
    assert_true(json_number(2.0 / 3.0, 2) == "0.67", "precision");
    assert_true(json_number(std::numeric_limits<double>::infinity()) == "0.000", "inf -> 0");
}

static void test_summary_line()
{
    const std::string line = format_summary_line(sample_result());
    assert_true(line == "Total: 4 | Success: 75.0% | Avg Time: 20ms | RPS: 16.0", "summary line exact");
}

static void test_summary_text()
{
    const std::string s = format_summary_text(sample_result());
    assert_contains(s, "status: completed\n", "status");
    assert_contains(s, "requests: total=4 ok=3 failed=1 (success 75.0%, failure 25.0%)\n", "counts");
    assert_contains(s, "response time: min=10.000 ms, avg=20.400 ms, median=20.000 ms, p95=30.000 ms, "
                       "p99=30.000 ms, max=30.000 ms\n", "response times");
    assert_contains(s, "percentiles: p90=30.000\n", "extra percentiles");
    assert_contains(s, "throughput: 16.0 req/s, 240.0 B/s, total 60 B, avg response 20 B\n", "throughput");
    assert_contains(s, "status codes: 200=2 503=1\n", "status codes");
    assert_contains(s, "errors by kind: NETWORK=1\n", "kinds, zero counts hidden");
    assert_contains(s, "  1x Connection refused\n", "messages");
}

static void test_budget_marker()
{
    AggregateResult r = sample_result();
    r.status = RunStatus::Cancelled;
    r.budget_exhausted = true;
    assert_contains(format_summary_text(r), "status: cancelled (time budget exhausted)\n", "budget marker");
}

static void test_outcome_lines()
{
    CallSuccess ok{};
    ok.call_index = 5;
    ok.status_code = 200;
    ok.status_text = "OK";
    ok.response_ms = 12.3456;
    ok.body_bytes = 42;
    assert_true(format_outcome_text(ok) == "call 5: 200 OK - 12.346 ms, 42 bytes\n", "success text");

    const std::string js = build_ndjson_outcome(ok);
    assert_contains(js, "{\"call\":5,\"ok\":true,\"status\":200,\"status_text\":\"OK\",\"ms\":12.346,\"bytes\":42",
                    "success ndjson");
    assert_true(js.find('\n') == std::string::npos, "single line");

    ExecutionError e{};
    e.call_index = 6;
    e.kind = ErrorKind::Timeout;
    e.message = "Request timed out after 50ms";
    e.cause = "timeout";
    const std::string et = format_outcome_text(e);
    assert_true(et == "call 6: TIMEOUT - Request timed out after 50ms\n  cause: timeout\n", "failure text");
    assert_contains(build_ndjson_outcome(e),
                    "{\"call\":6,\"ok\":false,\"kind\":\"TIMEOUT\",\"error\":\"Request timed out after 50ms\","
                    "\"cause\":\"timeout\"", "failure ndjson");
}

static void test_final_json()
{
    const std::string js = build_final_json(sample_result());
    assert_contains(js, "\"status\":\"completed\"", "status");
    assert_contains(js, "\"request\":{\"method\":\"POST\",\"url\":\"http://h/items/{id}\"", "request");
    assert_contains(js, "\"headers\":{\"X-Trace\":\"a\\\"b\"}", "headers escaped");
    assert_contains(js, "\"body\":\"{\\\"n\\\":1}\"", "body escaped");
    assert_contains(js, "\"path_params\":{\"id\":\"9\"}", "path params kept");
    assert_contains(js, "\"parameters\":{\"thread_count\":2,\"iterations\":2,\"total_calls\":4}", "parameters");
    assert_contains(js, "\"counts\":{\"total\":4,\"success\":3,\"failed\":1,\"success_rate\":75.00,"
                        "\"failure_rate\":25.00}", "counts");
    assert_contains(js, "\"percentiles\":{\"p90\":30.000}", "percentiles");
    assert_contains(js, "\"status_codes\":{\"200\":2,\"503\":1}", "status codes");
    assert_contains(js, "\"NETWORK\":1", "kind breakdown");
    assert_contains(js, "\"UNKNOWN\":0", "zero-filled kinds");
    assert_contains(js, "\"most_common_kind\":\"NETWORK\"", "most common kind");
    assert_contains(js, "\"by_message\":{\"Connection refused\":1}", "messages");
    assert_contains(js, "\"failures\":[{\"call\":3,\"ok\":false", "failures listed");
    assert_true(js.front() == '{' && js.back() == '}', "one object");
}

static void test_header_and_progress()
{
    Options opt{};
    opt.url = "http://h/users/{id}";
    opt.path_params["id"] = "7";
    opt.query_params["q"] = "x";
    opt.method = HttpMethod::DELETE;
    opt.threads = 3;
    opt.iterations = 4;
    const std::string s = format_header_text(opt);
    assert_contains(s, "Target: DELETE http://h/users/7?q=x\n", "resolved target");
    assert_contains(s, "Threads: 3  Iterations: 4  Total calls: 12\n", "parameters");
    assert_contains(s, "Budget: (none)\n", "no budget");
    assert_contains(s, "Body: (none)\n", "no body");

    Progress p{};
    p.total = 8;
    p.completed = 2;
    p.succeeded = 1;
    p.failed = 1;
    assert_true(format_progress_text(p) == "progress: 2/8 (25.0%) ok=1 failed=1\n", "progress without average");
    p.average_ms = 5.0;
    assert_contains(format_progress_text(p), " avg=5.000 ms\n", "progress with average");
}

int main()
{
    test_json_helpers();
    test_summary_line();
    test_summary_text();
    test_budget_marker();
    test_outcome_lines();
    test_final_json();
    test_header_and_progress();
    std::cout << "presentation tests: OK" << std::endl;
    return 0;
}
