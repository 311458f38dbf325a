#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "wl/concurrency.hpp"
#include "wl/model.hpp"
#include "wl/transport.hpp"

namespace wl {

struct Progress {
    long long             total{};
    long long             completed{};
    long long             succeeded{};
    long long             failed{};
    std::optional<double> average_ms; // over successes so far
};

using ProgressCallback = std::function<void(const Progress&)>;
using ResultCallback   = std::function<void(const AggregateResult&)>;
using FatalCallback    = std::function<void(const std::string&)>;

// Request or parameters rejected before anything ran.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(std::vector<std::string> errors);
    const std::vector<std::string>& errors() const { return errors_; }
private:
    std::vector<std::string> errors_;
};

// The batch could not be scheduled or a worker died; no result exists.
class FatalSchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Progress callbacks run on worker threads, one at a time, with
// non-decreasing `completed`. The others run on the run's own thread.
struct RunCallbacks {
    ProgressCallback on_progress;
    ResultCallback   on_complete;
    ResultCallback   on_cancelled;
    FatalCallback    on_fatal;
};

// Owns a run started with ExecutionEngine::start.
// Destroying the handle cancels the run and waits for it to stop.
class CancellationHandle {
public:
    CancellationHandle() = default;
    ~CancellationHandle();
    CancellationHandle(CancellationHandle&&) noexcept = default;
    CancellationHandle& operator=(CancellationHandle&& other) noexcept;
    CancellationHandle(const CancellationHandle&) = delete;
    CancellationHandle& operator=(const CancellationHandle&) = delete;

    // Idempotent; no-op once the run has finished.
    void cancel();

    // Blocks until the run and its final callback are done.
    void wait();

    RunStatus status() const;
    bool done() const;

private:
    friend class ExecutionEngine;
    struct Shared;
    std::shared_ptr<Shared> shared_;
    std::thread runner_;
};

class ExecutionEngine {
public:
    // pctl: extra percentiles (0..100) to include in every result
    explicit ExecutionEngine(std::shared_ptr<HttpTransport> transport,
                             std::vector<int> pctl = {});

    // Blocking. Throws ValidationError before starting and
    // FatalSchedulingError when the run cannot proceed. Setting `cancel`
    // stops the run early and yields a Cancelled partial result.
    AggregateResult run(const RequestDescriptor& req,
                        const ExecutionParameters& params,
                        const ProgressCallback& on_progress = {},
                        Cancellation* cancel = nullptr) const;

    // Validates synchronously (throws ValidationError), then runs on a
    // background thread and reports through `callbacks`.
    CancellationHandle start(const RequestDescriptor& req,
                             const ExecutionParameters& params,
                             RunCallbacks callbacks) const;

private:
    std::shared_ptr<HttpTransport> transport_;
    std::vector<int>               pctl_;
};

} // namespace wl
