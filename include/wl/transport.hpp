#pragma once

#include <atomic>
#include <string>

#include "wl/model.hpp"

namespace wl {

enum class TransportErrorKind {
    None = 0,
    NotAvailable,
    InvalidUrl,
    Connection,
    Timeout,
    Canceled,
    Tls,
    Protocol,
};

const char* transport_error_str(TransportErrorKind k);

struct TransportResult {
    int rc{};                 // 0 on success, -1 on error
    std::string error;        // error message when rc != 0
    TransportErrorKind kind{TransportErrorKind::None};

    // Success fields; body is fully read when send() returns
    int status{};
    std::string reason;
    ResponseHeaders headers;
    std::string body;
};

// One HTTP exchange. Implementations must be safe to call from several
// threads at once and should give up early once `cancel` becomes true.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual TransportResult send(const RequestDescriptor& req, const std::atomic<bool>& cancel) = 0;
};

// cpp-httplib backed transport. Without httplib at build time every call
// returns rc = -1 and kind = NotAvailable.
// A background watcher stops the connection of any call whose cancel flag
// is raised, so a cancelled call does not wait out its timeout.
class HttplibTransport : public HttpTransport {
public:
    HttplibTransport();
    ~HttplibTransport() override;

    HttplibTransport(const HttplibTransport&) = delete;
    HttplibTransport& operator=(const HttplibTransport&) = delete;

    TransportResult send(const RequestDescriptor& req, const std::atomic<bool>& cancel) override;

private:
    struct Impl;
    Impl* impl_;
};

} // namespace wl
