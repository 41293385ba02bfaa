#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Blocking multi-consumer queue feeding batch workers. Once closed it
// refuses new items; consumers drain what is left, then get nullopt.
template<typename T>
class WorkQueue {
private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;

public:
    WorkQueue() = default;

    // Non-copyable, non-movable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Returns false if the queue has been closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available or the queue is closed and empty
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });

        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
};

#endif // WORK_QUEUE_HPP
