#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>

namespace wl {

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Fixed-size thread pool.
// Construction throws std::system_error when the threads cannot be created;
// threads started before the failure are joined first.
class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  int size() const;

  // Enqueue a non-cancelable task
  void submit(std::function<void()> task);

  // Enqueue a task that can observe pool's cancellation flag
  void submit_cancelable(std::function<void(const std::atomic<bool>&)> task);

  // Wait until the queue is empty and all tasks complete
  void wait_idle();

  // Same, giving up after `timeout`. Returns true when idle.
  bool wait_idle_for(std::chrono::milliseconds timeout);

  // Request cooperative cancellation (tasks should check cancel_flag()).
  // Also set automatically when a task throws.
  void cancel();
  const std::atomic<bool>& cancel_flag() const;

  // Returns first captured exception (if any); nullptr if none
  std::exception_ptr first_exception() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace wl
