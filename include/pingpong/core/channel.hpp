/**
 * @file channel.hpp
 * @brief Closable multi-producer queue with a blocking receive
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief FIFO channel for handing items from one thread to another
 *
 * receive() blocks until an item arrives or the channel is closed.
 * After close(), send() is refused and receive() drains nothing further:
 * queued items are dropped so consumers stop promptly.
 */
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueues an item
     * @return false if the channel is closed
     */
    bool send(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                return false;
            }
            items.push_back(std::move(item));
        }
        ready.notify_one();
        return true;
    }

    /**
     * @brief Waits for the next item
     * @return The item, or nothing once the channel is closed
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex);
        ready.wait(lock, [this] { return closed || !items.empty(); });
        if (closed) {
            return std::nullopt;
        }
        T item = std::move(items.front());
        items.pop_front();
        return item;
    }

    /**
     * @brief Wakes every waiting receiver and refuses further items
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
            items.clear();
        }
        ready.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

private:
    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<T> items;
    bool closed = false;
};
