/**
 * @file Channel.hpp
 * @brief Closable multi-producer queue with optional capacity bound.
 *
 * Producers call send() and block while the channel is full. Consumers call
 * receive() and block until an item arrives or the channel is closed and
 * drained. Items are delivered in send order.
 *
 * @section Patterns
 * - Producer-Consumer: decouples capture threads from encoding.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "Types.hpp"

namespace oc {

template <typename T>
class Channel {
public:
    // capacity 0 means unbounded
    explicit Channel(usize capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel was closed before the item was accepted
    bool send(T item) {
        std::unique_lock lock(mutex_);
        notFull_.wait(lock, [this] {
            return closed_ || capacity_ == 0 || queue_.size() < capacity_;
        });
        if (closed_)
            return false;
        queue_.push_back(std::move(item));
        lock.unlock();
        notEmpty_.notify_one();
        return true;
    }

    // Blocks until an item is available; nullopt once closed and drained
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return popLocked(lock);
    }

    std::optional<T> receiveFor(Duration timeout) {
        std::unique_lock lock(mutex_);
        notEmpty_.wait_for(
                lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return popLocked(lock);
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    usize size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> popLocked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty())
            return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    usize capacity_;
    std::deque<T> queue_;
    bool closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace oc
