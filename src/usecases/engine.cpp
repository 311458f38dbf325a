#include "wl/engine.hpp"

#include <chrono>
#include <mutex>
#include <system_error>

#include <spdlog/spdlog.h>

#include "wl/aggregate.hpp"
#include "wl/executor.hpp"
#include "wl/request.hpp"
#include "wl/result_sink.hpp"
#include "wl/scheduler.hpp"

namespace wl {

namespace {

std::string join_errors(const std::vector<std::string>& errors)
{
    std::string out;
    for (const auto& e : errors)
    {
        if (!out.empty()) out += "; ";
        out += e;
    }
    return out;
}

// Serializes progress reports so `completed` never goes backwards or repeats.
class ProgressNotifier {
public:
    ProgressNotifier(const ProgressCallback& cb, long long total, int every)
        : cb_(cb), total_(total), every_(every > 0 ? every : 1)
    {}

    void on_outcome(const ResultSink& sink)
    {
        if (!cb_) return;
        const long long c = sink.completed();
        if (c % every_ != 0 && c != total_) return;
        report(sink);
    }

    // Final report for runs that stopped between throttle steps.
    void finish(const ResultSink& sink)
    {
        if (cb_) report(sink);
    }

private:
    void report(const ResultSink& sink)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const SinkCounters c = sink.counters();
        if (c.completed <= last_) return;
        last_ = c.completed;

        Progress p;
        p.total = total_;
        p.completed = c.completed;
        p.succeeded = c.succeeded;
        p.failed = c.failed;
        if (c.succeeded > 0) p.average_ms = c.success_ms_sum / static_cast<double>(c.succeeded);
        try
        {
            cb_(p);
        }
        catch (const std::exception& e)
        {
            spdlog::warn("progress callback threw: {}", e.what());
        }
    }

    const ProgressCallback& cb_;
    long long  total_;
    long long  every_;
    std::mutex mtx_;
    long long  last_ = 0;
};

std::string describe(const std::exception_ptr& ep)
{
    try
    {
        std::rethrow_exception(ep);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown exception";
    }
}

void validate_or_throw(const RequestDescriptor& req, const ExecutionParameters& params)
{
    auto errors = validate_parameters(params);
    auto req_errors = validate_request(req);
    errors.insert(errors.end(), req_errors.begin(), req_errors.end());
    if (!errors.empty())
    {
        spdlog::error("run rejected: {}", join_errors(errors));
        throw ValidationError(std::move(errors));
    }
}

AggregateResult execute_batch(HttpTransport& transport,
                              const RequestDescriptor& req,
                              const ExecutionParameters& params,
                              const std::vector<int>& pctl,
                              Cancellation& cancel,
                              const ProgressCallback& on_progress,
                              std::atomic<RunStatus>& status)
{
    const RequestDescriptor resolved = resolve_request(req);
    const long long total = params.total_calls();

    spdlog::info("run started: {} {} threads={} iterations={} total={}",
                 method_str(req.method), resolved.url,
                 params.thread_count, params.iterations, total);

    RunInfo info;
    info.request = req;
    info.thread_count = params.thread_count;
    info.iterations = params.iterations;
    info.pctl = pctl;

    ResultSink sink(params.thread_count);
    ProgressNotifier notifier(on_progress, total, params.progress_every);

    status.store(RunStatus::Running);
    info.start_time = WallClock::now();
    const auto t0 = std::chrono::steady_clock::now();

    // Set when a call finished after cancellation was requested.
    std::atomic<bool> interrupted{false};

    std::unique_ptr<ThreadPool> pool;
    try
    {
        pool = std::make_unique<ThreadPool>(params.thread_count);
    }
    catch (const std::exception& e)
    {
        status.store(RunStatus::FatalError);
        spdlog::error("could not start {} worker threads: {}", params.thread_count, e.what());
        throw FatalSchedulingError(std::string("worker pool unavailable: ") + e.what());
    }

    try
    {
        dispatch_workers(*pool, params.thread_count, params.iterations, cancel,
            [&](const IterationContext& ctx, const std::atomic<bool>& flag)
            {
                CallOutcome outcome = execute_call(transport, resolved, ctx.call_index, flag);
                if (flag.load(std::memory_order_relaxed)) interrupted.store(true, std::memory_order_relaxed);
                sink.append(ctx.worker, std::move(outcome));
                notifier.on_outcome(sink);
            });
    }
    catch (const std::exception& e)
    {
        pool->cancel();
        pool->wait_idle();
        status.store(RunStatus::FatalError);
        spdlog::error("could not dispatch workers: {}", e.what());
        throw FatalSchedulingError(std::string("dispatch failed: ") + e.what());
    }

    if (params.max_duration_ms > 0)
    {
        if (!pool->wait_idle_for(std::chrono::milliseconds(params.max_duration_ms)))
        {
            info.budget_exhausted = true;
            spdlog::warn("run budget of {}ms exhausted, cancelling", params.max_duration_ms);
            cancel.cancel();
            pool->wait_idle();
        }
    }
    else
    {
        pool->wait_idle();
    }

    info.end_time = WallClock::now();
    info.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    if (auto ep = pool->first_exception())
    {
        status.store(RunStatus::FatalError);
        const std::string what = describe(ep);
        spdlog::error("worker failed, run aborted: {}", what);
        throw FatalSchedulingError("worker failed: " + what);
    }
    pool.reset();

    notifier.finish(sink);
    // A cancel that lands after the last call still leaves a completed run.
    const bool cut_short = interrupted.load() || sink.completed() < total;
    info.budget_exhausted = info.budget_exhausted && cut_short;
    info.status = cut_short && cancel.is_cancelled() ? RunStatus::Cancelled : RunStatus::Completed;

    AggregateResult result = aggregate_outcomes(sink.drain(), info);
    status.store(info.status);

    if (info.status == RunStatus::Cancelled)
    {
        spdlog::warn("run cancelled after {}/{} calls ({} failed)",
                     result.total_requests, total, result.failed_requests);
    }
    else
    {
        spdlog::info("run completed: {} calls, {} failed, {:.1f} req/s",
                     result.total_requests, result.failed_requests,
                     result.throughput.requests_per_second);
    }
    return result;
}

// Runs one validated batch to the end. Any failure outside a single call
// surfaces as FatalSchedulingError.
AggregateResult run_batch(HttpTransport& transport,
                          const RequestDescriptor& req,
                          const ExecutionParameters& params,
                          const std::vector<int>& pctl,
                          Cancellation& cancel,
                          const ProgressCallback& on_progress,
                          std::atomic<RunStatus>& status)
{
    try
    {
        return execute_batch(transport, req, params, pctl, cancel, on_progress, status);
    }
    catch (const FatalSchedulingError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        status.store(RunStatus::FatalError);
        spdlog::error("run aborted: {}", e.what());
        throw FatalSchedulingError(std::string("run aborted: ") + e.what());
    }
}

template <typename Fn, typename... Args>
void invoke_guarded(const char* what, const Fn& fn, const Args&... args)
{
    if (!fn) return;
    try
    {
        fn(args...);
    }
    catch (const std::exception& e)
    {
        spdlog::warn("{} callback threw: {}", what, e.what());
    }
}

} // namespace

ValidationError::ValidationError(std::vector<std::string> errors)
    : std::invalid_argument("validation failed: " + join_errors(errors)),
      errors_(std::move(errors))
{}

struct CancellationHandle::Shared {
    Cancellation           cancel;
    std::atomic<RunStatus> status{RunStatus::Idle};
    std::atomic<bool>      finished{false};
};

CancellationHandle::~CancellationHandle()
{
    cancel();
    if (runner_.joinable())
    {
        if (runner_.get_id() == std::this_thread::get_id()) runner_.detach();
        else runner_.join();
    }
}

CancellationHandle& CancellationHandle::operator=(CancellationHandle&& other) noexcept
{
    if (this != &other)
    {
        cancel();
        wait();
        shared_ = std::move(other.shared_);
        runner_ = std::move(other.runner_);
    }
    return *this;
}

void CancellationHandle::cancel()
{
    if (!shared_ || shared_->finished.load()) return;
    shared_->cancel.cancel();
}

void CancellationHandle::wait()
{
    if (runner_.joinable() && runner_.get_id() != std::this_thread::get_id()) runner_.join();
}

RunStatus CancellationHandle::status() const
{
    return shared_ ? shared_->status.load() : RunStatus::Idle;
}

bool CancellationHandle::done() const
{
    return !shared_ || shared_->finished.load();
}

ExecutionEngine::ExecutionEngine(std::shared_ptr<HttpTransport> transport, std::vector<int> pctl)
    : transport_(std::move(transport)), pctl_(std::move(pctl))
{
    if (!transport_) throw std::invalid_argument("ExecutionEngine: transport is null");
}

AggregateResult ExecutionEngine::run(const RequestDescriptor& req,
                                     const ExecutionParameters& params,
                                     const ProgressCallback& on_progress,
                                     Cancellation* cancel) const
{
    validate_or_throw(req, params);
    Cancellation local;
    std::atomic<RunStatus> status{RunStatus::Idle};
    return run_batch(*transport_, req, params, pctl_, cancel ? *cancel : local, on_progress, status);
}

CancellationHandle ExecutionEngine::start(const RequestDescriptor& req,
                                          const ExecutionParameters& params,
                                          RunCallbacks callbacks) const
{
    validate_or_throw(req, params);

    CancellationHandle handle;
    handle.shared_ = std::make_shared<CancellationHandle::Shared>();
    auto shared = handle.shared_;
    FatalCallback on_fatal = callbacks.on_fatal;

    auto body = [shared, transport = transport_, pctl = pctl_, req, params,
                 cb = std::move(callbacks)]()
    {
        try
        {
            AggregateResult result = run_batch(*transport, req, params, pctl,
                                               shared->cancel, cb.on_progress, shared->status);
            shared->finished.store(true);
            if (result.status == RunStatus::Cancelled)
                invoke_guarded("on_cancelled", cb.on_cancelled, result);
            else
                invoke_guarded("on_complete", cb.on_complete, result);
        }
        catch (const std::exception& e)
        {
            shared->status.store(RunStatus::FatalError);
            shared->finished.store(true);
            invoke_guarded("on_fatal", cb.on_fatal, std::string(e.what()));
        }
    };

    try
    {
        handle.runner_ = std::thread(std::move(body));
    }
    catch (const std::system_error& e)
    {
        spdlog::error("could not start run thread: {}", e.what());
        shared->status.store(RunStatus::FatalError);
        shared->finished.store(true);
        invoke_guarded("on_fatal", on_fatal,
                       std::string("run thread unavailable: ") + e.what());
    }
    return handle;
}

} // namespace wl
