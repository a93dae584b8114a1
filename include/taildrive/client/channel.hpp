/**
 * @file channel.hpp
 * @brief Thread-safe FIFO connecting the foreground to the sync worker
 *
 * One channel carries commands into the worker, a second carries events
 * back out. Either side can close a channel; blocked pushers and poppers
 * wake up and see the closed state.
 *
 * EXAMPLE:
 * Channel<Command> commands;
 * commands.push(RefreshCommand{});       // Foreground
 * while (auto cmd = commands.try_pop())  // Worker, once per tick
 *     handle(*cmd);
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace taildrive::client {

/**
 * @brief Thread-safe FIFO with optional capacity
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers may use it concurrently
 * - With capacity 0 (the default) the channel is unbounded and push never
 *   blocks; otherwise push blocks while the channel is full
 */
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Append an item
     *
     * RETURNS: false if the channel was closed (the item is dropped)
     * BLOCKS: Only when a capacity is set and the channel is full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return closed_ || capacity_ == 0 || queue_.size() < capacity_;
            });
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop without blocking; nullopt when empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_front(lock);
    }

    /**
     * @brief Pop, waiting up to `timeout`; nullopt on timeout or closed-and-empty
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_front(lock);
    }

    /**
     * @brief Wait up to `timeout` for an item or close, without popping
     *
     * RETURNS: true if an item is available
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        return !queue_.empty();
    }

    /**
     * @brief Refuse further pushes; queued items can still be popped
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

private:
    T take_front(std::unique_lock<std::mutex>& lock) {
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::size_t capacity_;
    bool closed_ = false;
};

} // namespace taildrive::client
