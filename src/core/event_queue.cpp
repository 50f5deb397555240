#include "core/event_queue.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace dscope
{
EventQueue::EventQueue(std::size_t capacity)
    : capacity_(std::max(capacity, kMinCapacity))
{
}

std::uint64_t EventQueue::Push(InputEvent ev)
{
    std::lock_guard<std::mutex> lock(mtx_);
    ev.seq = ++last_seq_;
    if (queue_.size() >= capacity_)
        EvictOneLocked();
    queue_.push_back(std::move(ev));
    return last_seq_;
}

std::vector<InputEvent> EventQueue::Drain()
{
    std::vector<InputEvent> out;
    std::lock_guard<std::mutex> lock(mtx_);
    out.reserve(queue_.size());
    for (InputEvent& ev : queue_)
        out.push_back(std::move(ev));
    queue_.clear();
    return out;
}

std::size_t EventQueue::Size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

std::uint64_t EventQueue::DroppedCount() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}

std::uint64_t EventQueue::ForcedDropCount() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return forced_dropped_;
}

void EventQueue::EvictOneLocked()
{
    if (queue_.empty())
        return;

    // Rule 1: oldest event that takes no part in a press/release pair.
    for (auto it = queue_.begin(); it != queue_.end(); ++it)
    {
        if (!IsPairOpen(*it) && !IsPairClose(*it))
        {
            queue_.erase(it);
            dropped_++;
            return;
        }
    }

    // Rule 2: oldest complete pair, evicted as a unit.
    for (size_t i = 0; i < queue_.size(); ++i)
    {
        if (!IsPairOpen(queue_[i]))
            continue;
        for (size_t j = i + 1; j < queue_.size(); ++j)
        {
            if (ClosesPair(queue_[i], queue_[j]))
            {
                // Erase the later index first so `i` stays valid.
                queue_.erase(queue_.begin() + (std::ptrdiff_t)j);
                queue_.erase(queue_.begin() + (std::ptrdiff_t)i);
                dropped_ += 2;
                return;
            }
        }
    }

    // Rule 3: only unmatched presses/releases left.
    if (forced_dropped_ == 0)
        std::fprintf(stderr, "[input] queue full (%zu): dropping unmatched %s (seq %llu)\n",
                     capacity_, EventKindName(queue_.front()), (unsigned long long)queue_.front().seq);
    queue_.pop_front();
    dropped_++;
    forced_dropped_++;
}
} // namespace dscope
