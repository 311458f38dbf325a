// Concurrent HTTP load runner (C++23)

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "wl/cli.hpp"
#include "wl/engine.hpp"
#include "wl/output.hpp"

namespace {

enum ExitCode { kOk = 0, kSomeFailed = 1, kUsage = 2, kFatal = 3, kInterrupted = 130 };

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int)
{
    g_interrupted = 1;
}

void setup_logging(const std::string &level)
{
    auto logger = spdlog::stderr_color_mt("wireload");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

// Successes and failures are each ordered by call index; print them merged.
void print_calls(const wl::AggregateResult &r, bool ndjson)
{
    size_t i = 0, j = 0;
    while (i < r.successes.size() || j < r.failures.size())
    {
        wl::CallOutcome o;
        const bool take_ok = j >= r.failures.size() ||
                             (i < r.successes.size() &&
                              r.successes[i].call_index < r.failures[j].call_index);
        if (take_ok) o = r.successes[i++];
        else o = r.failures[j++];
        if (ndjson) std::println("{}", wl::build_ndjson_outcome(o));
        else std::print("{}", wl::format_outcome_text(o));
    }
}

} // namespace

int main(int argc, char **argv)
{
    wl::Options opt;
    if (argc <= 1)
    {
        wl::print_usage(argv[0]);
        return kUsage;
    }
    switch (wl::parse_args(argc, argv, opt))
    {
        case wl::ParseResult::Help: return kOk;
        case wl::ParseResult::Error: return kUsage;
        case wl::ParseResult::Ok: break;
    }

    setup_logging(opt.log_level);

    const bool text = !opt.json && !opt.ndjson;
    if (text) std::print("{}", wl::format_header_text(opt));

    wl::RunCallbacks cb;
    if (opt.progress)
    {
        cb.on_progress = [](const wl::Progress &p)
        {
            std::print(stderr, "{}", wl::format_progress_text(p));
        };
    }
    std::optional<wl::AggregateResult> result;
    std::string fatal;
    cb.on_complete = [&](const wl::AggregateResult &r) { result = r; };
    cb.on_cancelled = [&](const wl::AggregateResult &r) { result = r; };
    cb.on_fatal = [&](const std::string &msg) { fatal = msg; };

    wl::CancellationHandle handle;
    try
    {
        const wl::ExecutionEngine engine(std::make_shared<wl::HttplibTransport>(), opt.pctl);
        std::signal(SIGINT, on_sigint);
        handle = engine.start(wl::to_descriptor(opt), wl::to_parameters(opt), std::move(cb));
    }
    catch (const wl::ValidationError &e)
    {
        for (const auto &msg : e.errors()) std::println(stderr, "error: {}", msg);
        return kUsage;
    }
    catch (const std::exception &e)
    {
        std::println(stderr, "fatal: {}", e.what());
        return kFatal;
    }

    bool interrupted = false;
    while (!handle.done())
    {
        if (g_interrupted && !interrupted)
        {
            interrupted = true;
            spdlog::warn("interrupted, cancelling run");
            handle.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    handle.wait();

    if (!result)
    {
        std::println(stderr, "fatal: {}", fatal.empty() ? "run produced no result" : fatal);
        return kFatal;
    }

    if (opt.ndjson || text) print_calls(*result, opt.ndjson);
    if (opt.json || opt.ndjson) std::println("{}", wl::build_final_json(*result));
    else std::print("{}", wl::format_summary_text(*result));

    if (interrupted) return kInterrupted;
    return result->failed_requests > 0 ? kSomeFailed : kOk;
}
