#include "wl/model.hpp"

#include <algorithm>
#include <cctype>

namespace wl {

const char* method_str(HttpMethod m)
{
    switch (m)
    {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "GET";
}

std::optional<HttpMethod> parse_method(std::string_view s)
{
    static const std::pair<const char*, HttpMethod> kMethods[] = {
        {"GET", HttpMethod::GET},
        {"POST", HttpMethod::POST},
        {"PUT", HttpMethod::PUT},
        {"DELETE", HttpMethod::DELETE},
        {"PATCH", HttpMethod::PATCH},
        {"HEAD", HttpMethod::HEAD},
        {"OPTIONS", HttpMethod::OPTIONS},
    };
    std::string up(s);
    std::ranges::transform(up, up.begin(), [](unsigned char c) { return std::toupper(c); });
    for (const auto& kv : kMethods)
    {
        if (up == kv.first) return kv.second;
    }
    return std::nullopt;
}

const char* error_kind_str(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::Network: return "NETWORK";
        case ErrorKind::Timeout: return "TIMEOUT";
        case ErrorKind::Validation: return "VALIDATION";
        case ErrorKind::Authentication: return "AUTHENTICATION";
        case ErrorKind::ServerError: return "SERVER_ERROR";
        case ErrorKind::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* run_status_str(RunStatus s)
{
    switch (s)
    {
        case RunStatus::Idle: return "idle";
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::FatalError: return "fatal";
    }
    return "idle";
}

long long outcome_call_index(const CallOutcome& o)
{
    return std::visit([](const auto& v) { return v.call_index; }, o);
}

double AggregateResult::success_rate() const
{
    if (total_requests <= 0) return 0.0;
    return static_cast<double>(successful_requests) / static_cast<double>(total_requests) * 100.0;
}

double AggregateResult::failure_rate() const
{
    if (total_requests <= 0) return 0.0;
    return static_cast<double>(failed_requests) / static_cast<double>(total_requests) * 100.0;
}

std::optional<ErrorKind> AggregateResult::most_common_error_kind() const
{
    std::optional<ErrorKind> best;
    long long best_count = 0;
    for (const auto& [kind, count] : error_kinds)
    {
        if (count > best_count)
        {
            best = kind;
            best_count = count;
        }
    }
    return best;
}

} // namespace wl
