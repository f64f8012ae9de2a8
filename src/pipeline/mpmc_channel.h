#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include <sys/types.h>

#include "folly/MPMCQueue.h"

#include "channel.h"

namespace Handoff {

/**
 * Channel backed by folly::MPMCQueue. The queue provides the blocking and
 * FIFO guarantees; Size() and PeakSize() come from sizeGuess() and are
 * estimates clamped to [0, capacity].
 */
template<typename T>
class MpmcChannel final : public Channel<T> {
public:
    explicit MpmcChannel(size_t capacity) : capacity_(capacity), queue_(ValidCapacity(capacity)) {}

    void Insert(T element) override {
        queue_.blockingWrite(std::move(element));
        size_t now = Size();
        size_t prev = peak_.load(std::memory_order_relaxed);
        while (now > prev && !peak_.compare_exchange_weak(prev, now, std::memory_order_relaxed)) {
        }
    }

    T Remove() override {
        T element;
        queue_.blockingRead(element);
        return element;
    }

    size_t Capacity() const override { return capacity_; }

    size_t Size() const override {
        ssize_t guess = queue_.sizeGuess();
        if (guess <= 0) return 0;
        return std::min(static_cast<size_t>(guess), capacity_);
    }

    size_t PeakSize() const override { return peak_.load(std::memory_order_relaxed); }

private:
    static size_t ValidCapacity(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("MpmcChannel capacity must be at least 1");
        }
        return capacity;
    }

    const size_t capacity_;
    folly::MPMCQueue<T> queue_;
    std::atomic<size_t> peak_{0};
};

} // namespace Handoff
