#pragma once

#include <atomic>
#include <functional>

#include "wl/concurrency.hpp"

namespace wl {

struct IterationContext {
    int       worker{};     // 0-based
    int       iteration{};  // 0-based, per worker
    long long call_index{}; // 1-based, global, taken at dispatch
};

using IterationFn = std::function<void(const IterationContext&, const std::atomic<bool>& cancel)>;

// Queues one task per worker on `pool`; each runs `iterations` calls of fn in
// order and checks `cancel` (and the pool's own flag) before starting the next
// one. Returns immediately; wait on the pool for completion. `cancel` must
// outlive the queued tasks. The pool should have at least `workers` threads,
// otherwise loops run one after another.
void dispatch_workers(ThreadPool& pool,
                      int workers,
                      int iterations,
                      const Cancellation& cancel,
                      IterationFn fn);

} // namespace wl
