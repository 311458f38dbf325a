#include "wl/result_sink.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

namespace wl {

ResultSink::ResultSink(int workers)
    : shards_(static_cast<size_t>(workers > 0 ? workers : 1))
{}

void ResultSink::append(int worker, CallOutcome outcome)
{
    if (worker < 0 || static_cast<size_t>(worker) >= shards_.size())
        throw std::out_of_range("ResultSink: no shard for worker " + std::to_string(worker));

    if (const auto* ok = std::get_if<CallSuccess>(&outcome))
    {
        succeeded_.fetch_add(1, std::memory_order_relaxed);
        success_us_sum_.fetch_add(static_cast<long long>(ok->response_ms * 1000.0),
                                  std::memory_order_relaxed);
    }
    else
    {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }
    shards_[static_cast<size_t>(worker)].push_back(std::move(outcome));
    completed_.fetch_add(1, std::memory_order_release);
}

SinkCounters ResultSink::counters() const
{
    SinkCounters c;
    c.succeeded = succeeded_.load(std::memory_order_relaxed);
    c.failed = failed_.load(std::memory_order_relaxed);
    c.completed = c.succeeded + c.failed;
    c.success_ms_sum = static_cast<double>(success_us_sum_.load(std::memory_order_relaxed)) / 1000.0;
    return c;
}

std::vector<CallOutcome> ResultSink::drain()
{
    size_t total = 0;
    for (const auto& s : shards_) total += s.size();

    std::vector<CallOutcome> out;
    out.reserve(total);
    for (auto& s : shards_)
    {
        std::ranges::move(s, std::back_inserter(out));
        s.clear();
    }
    std::ranges::stable_sort(out, {}, [](const CallOutcome& o) { return outcome_call_index(o); });
    return out;
}

} // namespace wl
