#include "wl/executor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <spdlog/spdlog.h>

namespace wl
{
ErrorKind classify_transport_error(TransportErrorKind k)
{
    switch (k)
    {
        case TransportErrorKind::Connection:
        case TransportErrorKind::Tls:
        case TransportErrorKind::Protocol:
            return ErrorKind::Network;
        case TransportErrorKind::Timeout:
            return ErrorKind::Timeout;
        case TransportErrorKind::InvalidUrl:
            return ErrorKind::Validation;
        case TransportErrorKind::None:
        case TransportErrorKind::NotAvailable:
        case TransportErrorKind::Canceled:
            return ErrorKind::Unknown;
    }
    return ErrorKind::Unknown;
}

static bool contains_ci(std::string_view hay, std::string_view needle)
{
    auto it = std::ranges::search(
        hay,
        needle,
        [](unsigned char a, unsigned char b)
        {
            return std::tolower(a) == std::tolower(b);
        });
    return !it.empty();
}

ErrorKind classify_exception(const std::exception &e)
{
    const std::string_view msg = e.what();
    if (dynamic_cast<const std::invalid_argument *>(&e)) return ErrorKind::Validation;
    if (contains_ci(msg, "timed out") || contains_ci(msg, "timeout")) return ErrorKind::Timeout;
    if (contains_ci(msg, "401") || contains_ci(msg, "403") ||
        contains_ci(msg, "unauthorized") || contains_ci(msg, "forbidden"))
        return ErrorKind::Authentication;
    if (contains_ci(msg, "connection") || contains_ci(msg, "refused") ||
        contains_ci(msg, "host"))
        return ErrorKind::Network;
    return ErrorKind::Unknown;
}

static ExecutionError make_error(std::string message,
                                 std::string cause,
                                 long long call_index,
                                 ErrorKind kind)
{
    ExecutionError err{};
    err.message = std::move(message);
    err.cause = std::move(cause);
    err.call_index = call_index;
    err.timestamp = WallClock::now();
    err.kind = kind;
    return err;
}

CallOutcome execute_call(HttpTransport &transport,
                         const RequestDescriptor &req,
                         long long call_index,
                         const std::atomic<bool> &cancel)
{
    const auto t0 = std::chrono::steady_clock::now();
    TransportResult tr{};
    try
    {
        tr = transport.send(req, cancel);
    }
    catch (const std::exception &e)
    {
        const ErrorKind kind = classify_exception(e);
        spdlog::debug("call #{} threw {}: {}", call_index, typeid(e).name(), e.what());
        return make_error(e.what(), typeid(e).name(), call_index, kind);
    }
    const auto t1 = std::chrono::steady_clock::now();

    if (tr.rc != 0)
    {
        std::string message = tr.error;
        if (tr.kind == TransportErrorKind::Canceled) message = "Request cancelled";
        if (message.empty()) message = "Network error occurred";
        spdlog::debug("call #{} failed ({}): {}", call_index,
                      transport_error_str(tr.kind), tr.error);
        return make_error(std::move(message),
                          transport_error_str(tr.kind),
                          call_index,
                          classify_transport_error(tr.kind));
    }

    CallSuccess ok{};
    ok.status_code = tr.status;
    ok.status_text = std::move(tr.reason);
    ok.headers = std::move(tr.headers);
    ok.body = std::move(tr.body);
    ok.body_bytes = ok.body.size();
    ok.response_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    ok.timestamp = WallClock::now();
    ok.call_index = call_index;
    return ok;
}
} // namespace wl
