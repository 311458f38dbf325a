#pragma once

#include <atomic>
#include <exception>

#include "wl/model.hpp"
#include "wl/transport.hpp"

namespace wl
{
// Issues one call through `transport` and records it as an outcome.
// Transport errors and exceptions thrown by the transport become an
// ExecutionError; any completed exchange is a CallSuccess whatever its status.
// response_ms covers the whole exchange including the body read.
CallOutcome execute_call(HttpTransport &transport,
                         const RequestDescriptor &req,
                         long long call_index,
                         const std::atomic<bool> &cancel);

ErrorKind classify_transport_error(TransportErrorKind k);

// Best effort from the exception type and message.
ErrorKind classify_exception(const std::exception &e);
} // namespace wl
