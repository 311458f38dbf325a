#include "wl/scheduler.hpp"

#include <memory>

namespace wl {

namespace {

struct DispatchState {
    std::atomic<long long> next_index{0};
    const Cancellation*    cancel{};
    IterationFn            fn;
};

} // namespace

void dispatch_workers(ThreadPool& pool,
                      int workers,
                      int iterations,
                      const Cancellation& cancel,
                      IterationFn fn)
{
    if (workers <= 0 || iterations <= 0) return;

    auto state = std::make_shared<DispatchState>();
    state->cancel = &cancel;
    state->fn = std::move(fn);

    for (int w = 0; w < workers; ++w)
    {
        pool.submit_cancelable([state, w, iterations](const std::atomic<bool>& pool_flag)
        {
            const std::atomic<bool>& run_flag = state->cancel->flag();
            for (int i = 0; i < iterations; ++i)
            {
                if (run_flag.load(std::memory_order_relaxed) ||
                    pool_flag.load(std::memory_order_relaxed))
                    return;
                IterationContext ctx;
                ctx.worker = w;
                ctx.iteration = i;
                ctx.call_index = state->next_index.fetch_add(1, std::memory_order_relaxed) + 1;
                state->fn(ctx, run_flag);
            }
        });
    }
}

} // namespace wl
