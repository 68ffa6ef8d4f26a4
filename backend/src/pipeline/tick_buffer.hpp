#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>
#include <vector>

#include "md/tick.hpp"

// Overflow policy when the buffer is at capacity
enum class Backpressure {
    DropOldest,   // evict one stale tick, then push newest
    DropNewest,   // reject the incoming tick
    Block         // wait for a drain (released by close())
};

inline const char* to_cstr(Backpressure bp) {
    switch (bp) {
        case Backpressure::DropOldest: return "drop_oldest";
        case Backpressure::DropNewest: return "drop_newest";
        case Backpressure::Block:      return "block";
    }
    return "?";
}

// Multi-producer tick buffer shared by all connections of one collector.
// Every read and write takes the same mutex; the critical sections only
// move ticks in or swap the container out.
// capacity == 0 means unbounded.
class TickBuffer {
public:
    explicit TickBuffer(std::size_t capacity = 0, Backpressure bp = Backpressure::DropOldest)
    : capacity_(capacity), backpressure_(bp) {}

    TickBuffer(const TickBuffer&) = delete;
    TickBuffer& operator=(const TickBuffer&) = delete;

    // Returns false if the tick was not stored (DropNewest at capacity, or closed).
    bool push(Tick t) {
        std::unique_lock<std::mutex> lk(m_);
        if (closed_) return false;
        if (capacity_ && ticks_.size() >= capacity_) {
            switch (backpressure_) {
                case Backpressure::DropNewest:
                    ++dropped_;
                    return false;
                case Backpressure::DropOldest:
                    ticks_.pop_front();
                    ++dropped_;
                    break;
                case Backpressure::Block:
                    space_cv_.wait(lk, [this]{ return closed_ || ticks_.size() < capacity_; });
                    if (closed_) return false;
                    break;
            }
        }
        ticks_.push_back(std::move(t));
        return true;
    }

    // Copy out everything buffered; with `clear` the same critical section
    // empties the buffer, so a concurrent push lands strictly before or after.
    std::vector<Tick> drain(bool clear) {
        std::deque<Tick> taken;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (!clear) {
                return std::vector<Tick>(ticks_.begin(), ticks_.end());
            }
            taken.swap(ticks_);
        }
        space_cv_.notify_all();
        return std::vector<Tick>(std::make_move_iterator(taken.begin()),
                                 std::make_move_iterator(taken.end()));
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return ticks_.size();
    }

    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lk(m_);
        return dropped_;
    }

    // Reject further pushes and release producers blocked on a full buffer.
    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        space_cv_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = false;
    }

    std::size_t capacity() const noexcept { return capacity_; }
    Backpressure backpressure() const noexcept { return backpressure_; }

private:
    const std::size_t capacity_;
    const Backpressure backpressure_;

    mutable std::mutex m_;
    std::condition_variable space_cv_;
    std::deque<Tick> ticks_;
    std::uint64_t dropped_{0};
    bool closed_{false};
};
