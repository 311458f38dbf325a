#include "wl/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "wl/request.hpp"

#ifdef HAVE_HTTPLIB
#include <httplib.h>
#endif

namespace wl
{
const char *transport_error_str(TransportErrorKind k)
{
    switch (k)
    {
        case TransportErrorKind::None: return "none";
        case TransportErrorKind::NotAvailable: return "not-available";
        case TransportErrorKind::InvalidUrl: return "invalid-url";
        case TransportErrorKind::Connection: return "connection";
        case TransportErrorKind::Timeout: return "timeout";
        case TransportErrorKind::Canceled: return "canceled";
        case TransportErrorKind::Tls: return "tls";
        case TransportErrorKind::Protocol: return "protocol";
    }
    return "none";
}

static TransportResult fail(TransportErrorKind kind, std::string msg)
{
    TransportResult out{};
    out.rc = -1;
    out.kind = kind;
    out.error = std::move(msg);
    return out;
}

#ifdef HAVE_HTTPLIB
static TransportErrorKind classify(httplib::Error err, bool deadline_hit, bool cancelled)
{
    if (cancelled) return TransportErrorKind::Canceled;
    if (deadline_hit) return TransportErrorKind::Timeout;
    switch (err)
    {
        case httplib::Error::Canceled:
            return TransportErrorKind::Timeout;
        case httplib::Error::Connection:
        case httplib::Error::BindIPAddress:
        case httplib::Error::Read:
        case httplib::Error::Write:
            return TransportErrorKind::Connection;
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            return TransportErrorKind::Tls;
        case httplib::Error::ExceedRedirectCount:
        case httplib::Error::UnsupportedMultipartBoundaryChars:
        case httplib::Error::Compression:
            return TransportErrorKind::Protocol;
        default:
            return TransportErrorKind::Connection;
    }
}

// Newer cpp-httplib releases renamed Request::progress to download_progress.
template <typename Req, typename Fn>
static void set_download_progress(Req &r, Fn fn)
{
    if constexpr (requires { r.download_progress = fn; }) r.download_progress = std::move(fn);
    else r.progress = std::move(fn);
}

struct HttplibTransport::Impl {
    Impl()
        : watcher([this]{ watch(); })
    {}

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            stop = true;
        }
        cv.notify_all();
        watcher.join();
    }

    void add(httplib::Client* cli, const std::atomic<bool>* cancel)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            live.emplace(cli, cancel);
        }
        cv.notify_all();
    }

    void remove(httplib::Client* cli)
    {
        std::lock_guard<std::mutex> lk(mtx);
        live.erase(cli);
    }

    // Keeps stopping a cancelled client until its call returns, so a stop
    // that lands before the socket opens is repeated once it is.
    void watch()
    {
        std::unique_lock<std::mutex> lk(mtx);
        while (!stop)
        {
            if (live.empty())
            {
                cv.wait(lk, [&]{ return stop || !live.empty(); });
                continue;
            }
            for (const auto& [cli, cancel] : live)
            {
                if (cancel->load(std::memory_order_relaxed)) cli->stop();
            }
            cv.wait_for(lk, std::chrono::milliseconds(10), [&]{ return stop; });
        }
    }

    std::mutex mtx;
    std::condition_variable cv;
    bool stop = false;
    std::map<httplib::Client*, const std::atomic<bool>*> live;
    std::thread watcher; // last: started once the members above exist
};
#else
struct HttplibTransport::Impl {};
#endif

HttplibTransport::HttplibTransport()
    : impl_(new Impl())
{}

HttplibTransport::~HttplibTransport()
{
    delete impl_;
}

TransportResult HttplibTransport::send(const RequestDescriptor &req,
                                       const std::atomic<bool> &cancel)
{
    auto parts = split_url(req.url);
    if (!parts)
    {
        return fail(TransportErrorKind::InvalidUrl, "invalid url: " + req.url);
    }

#ifndef HAVE_HTTPLIB
    (void) cancel;
    return fail(TransportErrorKind::NotAvailable,
                "httplib not available: rebuild with cpp-httplib to send requests");
#else
    httplib::Client cli(parts->origin());
    if (!cli.is_valid())
    {
        return fail(TransportErrorKind::Tls,
                    "client could not be created for " + parts->origin() +
                    " (https needs CPPHTTPLIB_OPENSSL_SUPPORT)");
    }

    const int tmo = req.timeout_ms > 0 ? req.timeout_ms : 30000;
    cli.set_connection_timeout(tmo / 1000, (tmo % 1000) * 1000);
    cli.set_read_timeout(tmo / 1000, (tmo % 1000) * 1000);
    cli.set_write_timeout(tmo / 1000, (tmo % 1000) * 1000);
    cli.set_follow_location(req.follow_redirects);
    // Targets are already percent-encoded by resolve_request.
    cli.set_url_encode(false);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(tmo);
    bool deadline_hit = false;

    httplib::Request hreq;
    hreq.method = method_str(req.method);
    hreq.path = parts->target;
    for (const auto &[name, value]: req.headers) hreq.set_header(name, value);

    const bool bodyless = req.method == HttpMethod::GET || req.method == HttpMethod::HEAD;
    if (!bodyless)
    {
        const std::string body = req.body.value_or(std::string{});
        if (!body.empty() && !find_header(req.headers, "Content-Type"))
        {
            hreq.set_header("Content-Type", detect_content_type(body));
        }
        hreq.body = body;
    }

    // Called while the body is read; returning false aborts with Error::Canceled.
    set_download_progress(hreq, [&](uint64_t, uint64_t)
    {
        if (cancel.load(std::memory_order_relaxed)) return false;
        if (std::chrono::steady_clock::now() >= deadline)
        {
            deadline_hit = true;
            return false;
        }
        return true;
    });

    // Registered with the watcher for the duration of the call.
    struct LiveCall {
        Impl& impl;
        httplib::Client& cli;
        LiveCall(Impl& i, httplib::Client& c, const std::atomic<bool>& flag) : impl(i), cli(c)
        {
            impl.add(&cli, &flag);
        }
        ~LiveCall() { impl.remove(&cli); }
    } live(*impl_, cli, cancel);
    if (cancel.load(std::memory_order_relaxed))
    {
        return fail(TransportErrorKind::Canceled, "cancelled before sending");
    }
    auto res = cli.send(hreq);
    if (!res)
    {
        const auto err = res.error();
        const bool cancelled = cancel.load(std::memory_order_relaxed);
        if (!deadline_hit && std::chrono::steady_clock::now() >= deadline) deadline_hit = true;
        const auto kind = classify(err, deadline_hit, cancelled);
        std::string msg = kind == TransportErrorKind::Timeout
                              ? "Request timed out after " + std::to_string(tmo) + "ms"
                              : httplib::to_string(err);
        return fail(kind, std::move(msg));
    }

    TransportResult out{};
    out.rc = 0;
    out.status = res->status;
    out.reason = res->reason;
    for (const auto &[name, value]: res->headers) out.headers[name].push_back(value);
    out.body = std::move(res->body);
    return out;
#endif
}
} // namespace wl
