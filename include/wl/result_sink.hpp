#pragma once

#include <atomic>
#include <vector>

#include "wl/model.hpp"

namespace wl {

struct SinkCounters {
    long long completed{};
    long long succeeded{};
    long long failed{};
    double    success_ms_sum{};
};

// Append-only outcome store, one shard per worker.
// A worker only ever appends to its own shard, so appends take no lock;
// the atomic counters give a live view for progress reporting.
// drain() may only be called once every worker has stopped.
class ResultSink {
public:
    explicit ResultSink(int workers);

    // Throws std::out_of_range for an unknown worker.
    void append(int worker, CallOutcome outcome);

    SinkCounters counters() const;
    long long completed() const { return completed_.load(std::memory_order_acquire); }

    // Merges the shards ordered by call index and leaves the sink empty.
    std::vector<CallOutcome> drain();

private:
    std::vector<std::vector<CallOutcome>> shards_;
    std::atomic<long long> completed_{0};
    std::atomic<long long> succeeded_{0};
    std::atomic<long long> failed_{0};
    std::atomic<long long> success_us_sum_{0};
};

} // namespace wl
