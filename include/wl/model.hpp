#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace wl {

enum class HttpMethod { GET, POST, PUT, DELETE, PATCH, HEAD, OPTIONS };

const char* method_str(HttpMethod m);

// case-insensitive; nullopt for unknown verbs
std::optional<HttpMethod> parse_method(std::string_view s);

using WallClock = std::chrono::system_clock;
using Headers = std::map<std::string, std::string>;
using ResponseHeaders = std::map<std::string, std::vector<std::string>>;

struct RequestDescriptor {
    HttpMethod                         method = HttpMethod::GET;
    std::string                        url;
    Headers                            headers;
    std::optional<std::string>         body;
    int                                timeout_ms = 30000; // per call
    bool                               follow_redirects = true;
    std::map<std::string, std::string> query_params;
    std::map<std::string, std::string> path_params;
};

struct ExecutionParameters {
    int thread_count = 1;
    int iterations = 1;
    int max_duration_ms = 0;  // whole-run budget, 0 = unlimited
    int progress_every = 10;  // notify every N completions (and on the last)

    long long total_calls() const
    {
        return static_cast<long long>(thread_count) * iterations;
    }
};

enum class ErrorKind { Network, Timeout, Validation, Authentication, ServerError, Unknown };

inline constexpr ErrorKind kAllErrorKinds[] = {
    ErrorKind::Network, ErrorKind::Timeout, ErrorKind::Validation,
    ErrorKind::Authentication, ErrorKind::ServerError, ErrorKind::Unknown,
};

const char* error_kind_str(ErrorKind k);

struct ExecutionError {
    std::string           message;
    std::string           cause;       // underlying transport error, may be empty
    long long             call_index{};
    WallClock::time_point timestamp{};
    ErrorKind             kind = ErrorKind::Unknown;
};

struct CallSuccess {
    int                   status_code{};
    std::string           status_text;
    ResponseHeaders       headers;
    std::string           body;
    double                response_ms{}; // call start -> body fully read
    WallClock::time_point timestamp{};
    size_t                body_bytes{};
    long long             call_index{};
};

// A 4xx/5xx response is still a CallSuccess: the exchange completed.
using CallOutcome = std::variant<CallSuccess, ExecutionError>;

inline bool is_success(const CallOutcome& o) { return std::holds_alternative<CallSuccess>(o); }

long long outcome_call_index(const CallOutcome& o);

enum class RunStatus { Idle, Running, Completed, Cancelled, FatalError };

const char* run_status_str(RunStatus s);

struct ResponseTimeStats {
    double min{};
    double max{};
    double average{};
    double median{};
    double p95{};
    double p99{};
};

struct ThroughputStats {
    double requests_per_second{};
    double bytes_per_second{};
    size_t total_bytes{};
    size_t average_response_size{};
};

struct AggregateResult {
    long long total_requests{};
    long long successful_requests{};
    long long failed_requests{};
    std::vector<CallSuccess>    successes;
    std::vector<ExecutionError> failures;

    WallClock::time_point start_time{};
    WallClock::time_point end_time{};
    double                elapsed_ms{}; // steady clock, end - start

    int                 thread_count{};
    int                 iterations{};
    RequestDescriptor   request;
    RunStatus           status = RunStatus::Idle;
    bool                budget_exhausted = false;

    ResponseTimeStats                  response_times;
    ThroughputStats                    throughput;
    std::vector<std::pair<int,double>> percentiles; // extra (p, value) pairs
    std::map<int, long long>           status_codes;
    std::map<std::string, long long>   error_messages;
    std::map<ErrorKind, long long>     error_kinds;   // every kind present

    double success_rate() const;  // percent
    double failure_rate() const;  // percent
    std::optional<ErrorKind> most_common_error_kind() const;
};

} // namespace wl
