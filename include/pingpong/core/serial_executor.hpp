/**
 * @file serial_executor.hpp
 * @brief Marshals work from platform threads onto the game-state thread
 *
 * Collision callbacks and hand-tracking updates arrive on threads owned by
 * the platform. None of them may touch the registry, the GameStateMachine
 * or the tracking flags directly; they post() a closure instead, and the
 * owning thread runs the queue with drain() once per frame.
 *
 * Only the queue itself is locked. The state the closures touch is never
 * shared between threads, so it needs no locking of its own.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor() = default;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /**
     * @brief Queues a task; safe to call from any thread
     */
    void post(Task task);

    /**
     * @brief Runs every task queued before the call, in posting order
     *
     * Tasks posted while draining run on the next drain. Must only be
     * called from the owning thread.
     *
     * @return Number of tasks run
     */
    std::size_t drain();

    /** @brief Number of tasks waiting; safe from any thread */
    std::size_t pending() const;

private:
    mutable std::mutex queueMutex;
    std::deque<Task> queue;
};
