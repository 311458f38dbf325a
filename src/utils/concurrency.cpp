#include "wl/concurrency.hpp"

#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace wl {

struct ThreadPool::Impl {
    explicit Impl(int n)
        : stop(false), active(0), cancel(false)
    {
        if (n <= 0) n = 1;
        workers.reserve(n);
        try
        {
            for (int i = 0; i < n; ++i)
            {
                workers.emplace_back([this]{ this->worker_loop(); });
            }
        }
        catch (...)
        {
            shutdown();
            throw;
        }
    }

    ~Impl()
    {
        shutdown();
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            stop = true;
        }
        cv_task.notify_all();
        for (auto& th : workers) if (th.joinable()) th.join();
    }

    void submit(std::function<void()> task)
    {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (stop) return; // ignore submissions after stop
            q.push(std::move(task));
        }
        cv_task.notify_one();
    }

    void submit_cancelable(std::function<void(const std::atomic<bool>&)> task)
    {
        submit([this, t = std::move(task)](){ t(cancel); });
    }

    void wait_idle()
    {
        std::unique_lock<std::mutex> lk(mtx);
        cv_idle.wait(lk, [&]{ return q.empty() && active == 0; });
    }

    bool wait_idle_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lk(mtx);
        return cv_idle.wait_for(lk, timeout, [&]{ return q.empty() && active == 0; });
    }

    void cancel_req()
    {
        cancel.store(true, std::memory_order_relaxed);
    }

    std::exception_ptr first_exception() const
    {
        std::lock_guard<std::mutex> lk(mtx);
        return first_ex;
    }

    void set_first_exception(std::exception_ptr ep)
    {
        if (!ep) return;
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_ex) first_ex = std::move(ep);
    }

private:
    void worker_loop()
    {
        for(;;)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lk(mtx);
                cv_task.wait(lk, [&]{ return stop || !q.empty(); });
                if (stop && q.empty()) return;
                task = std::move(q.front());
                q.pop();
                ++active;
            }
            try {
                task();
            } catch (...) {
                // kept for first_exception(); siblings see the cancel flag
                set_first_exception(std::current_exception());
                cancel_req();
            }
            {
                std::lock_guard<std::mutex> lk(mtx);
                --active;
                if (q.empty() && active == 0) cv_idle.notify_all();
            }
        }
    }

public:
    mutable std::mutex mtx;
    std::condition_variable cv_task;
    std::condition_variable cv_idle;
    std::queue<std::function<void()>> q;
    std::vector<std::thread> workers;
    bool stop;
    size_t active;
    std::atomic<bool> cancel;
    std::exception_ptr first_ex;
};

ThreadPool::ThreadPool(int threads)
  : impl_(new Impl(threads))
{}

ThreadPool::~ThreadPool()
{
    delete impl_;
}

int ThreadPool::size() const
{
    return static_cast<int>(impl_->workers.size());
}

void ThreadPool::submit(std::function<void()> task)
{
    impl_->submit(std::move(task));
}

void ThreadPool::submit_cancelable(std::function<void(const std::atomic<bool>&)> task)
{
    impl_->submit_cancelable(std::move(task));
}

void ThreadPool::wait_idle()
{
    impl_->wait_idle();
}

bool ThreadPool::wait_idle_for(std::chrono::milliseconds timeout)
{
    return impl_->wait_idle_for(timeout);
}

void ThreadPool::cancel()
{
    impl_->cancel_req();
}

const std::atomic<bool>& ThreadPool::cancel_flag() const
{
    return impl_->cancel;
}

std::exception_ptr ThreadPool::first_exception() const
{
    return impl_->first_exception();
}

} // namespace wl
