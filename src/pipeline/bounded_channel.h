#pragma once

/**
 * BoundedChannel: monitor-style bounded FIFO.
 *
 * One absl::Mutex guards the queue; producers wait on not_full_, consumers on
 * not_empty_. Each side signals the other after changing the length, outside
 * of any wait loop, so a waiter re-checks its predicate under the lock.
 * @threading One inserting thread and one removing thread.
 */

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "channel.h"

namespace Handoff {

template<typename T>
class BoundedChannel final : public Channel<T> {
public:
	explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
		if (capacity == 0) {
			throw std::invalid_argument("BoundedChannel capacity must be at least 1");
		}
	}

	BoundedChannel(const BoundedChannel&) = delete;
	BoundedChannel& operator=(const BoundedChannel&) = delete;

	void Insert(T element) override {
		absl::MutexLock lock(&mu_);
		while (queue_.size() >= capacity_) {
			not_full_.Wait(&mu_);
		}
		queue_.push_back(std::move(element));
		if (queue_.size() > peak_) {
			peak_ = queue_.size();
		}
		not_empty_.Signal();
	}

	T Remove() override {
		absl::MutexLock lock(&mu_);
		while (queue_.empty()) {
			not_empty_.Wait(&mu_);
		}
		T element = std::move(queue_.front());
		queue_.pop_front();
		not_full_.Signal();
		return element;
	}

	size_t Capacity() const override { return capacity_; }

	size_t Size() const override {
		absl::MutexLock lock(&mu_);
		return queue_.size();
	}

	size_t PeakSize() const override {
		absl::MutexLock lock(&mu_);
		return peak_;
	}

private:
	const size_t capacity_;

	mutable absl::Mutex mu_;
	absl::CondVar not_full_;
	absl::CondVar not_empty_;
	std::deque<T> queue_ ABSL_GUARDED_BY(mu_);
	size_t peak_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Handoff
