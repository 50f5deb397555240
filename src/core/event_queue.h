#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "core/input_event.h"

namespace dscope
{
// Bounded FIFO of normalized input events, drained once per frame.
//
// Producers are the host adapters (native polling path, browser callbacks that
// may fire at any point of the browser's own scheduling). The consumer is the
// FrameDriver. Push() and Drain() share one mutex, so a drain never observes
// half of a concurrent push.
//
// Sequence numbers are stamped here, under the lock, so they strictly increase
// across all producers and are never reused (even for events later evicted).
//
// Backpressure when full (one eviction per push):
//   1. the oldest event that is neither a press nor a release is evicted
//      (pointer-move, scroll, text, resize, focus);
//   2. if only press/release events remain, the oldest complete pair
//      (press + its matching release) is evicted together, so pairs are never
//      split and no button is left stuck;
//   3. if there is no complete pair either, the oldest event is evicted and
//      counted as a forced drop.
class EventQueue
{
public:
    static constexpr std::size_t kDefaultCapacity = 256;
    static constexpr std::size_t kMinCapacity = 2;

    explicit EventQueue(std::size_t capacity = kDefaultCapacity);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Queues `ev` (its `seq` is overwritten). Returns the assigned sequence number.
    std::uint64_t Push(InputEvent ev);

    // Removes and returns every queued event in push order.
    std::vector<InputEvent> Drain();

    std::size_t Capacity() const { return capacity_; }
    std::size_t Size() const;

    // Total events evicted by the backpressure policy (all rules).
    std::uint64_t DroppedCount() const;
    // Subset of DroppedCount() evicted by rule 3 (could have split a pair).
    std::uint64_t ForcedDropCount() const;

private:
    void EvictOneLocked();

    const std::size_t capacity_;

    mutable std::mutex mtx_;
    std::deque<InputEvent> queue_;
    std::uint64_t last_seq_ = 0;
    std::uint64_t dropped_ = 0;
    std::uint64_t forced_dropped_ = 0;
};
} // namespace dscope
