/**
 * @file hand_tracking_session.hpp
 * @brief Cancellable consumer of a provider's anchor-update stream
 */

#ifndef PINGPONG_HAND_TRACKING_SESSION_HPP
#define PINGPONG_HAND_TRACKING_SESSION_HPP

#include <functional>
#include <future>
#include <memory>
#include "pingpong/core/serial_executor.hpp"
#include "pingpong/tracking/hand_tracking_provider.hpp"

/**
 * @class HandTrackingSession
 * @brief Runs one dedicated task that waits on the anchor stream
 *
 * Each received update is posted to the SerialExecutor; the update handler
 * therefore always runs on the game-state thread, in stream order.
 *
 * start(), stop() and the destructor must be called from the game-state
 * thread. A successful start() runs the start handler before returning.
 * stop() closes the stream, waits for the task to finish and stops the
 * provider, then runs the stop handler.
 *
 * If the provider ends the stream on its own, the session counts as no
 * longer running; the next start() releases the old provider first.
 */
class HandTrackingSession {
public:
    using UpdateHandler = std::function<void(const AnchorUpdate&)>;
    using StartHandler = std::function<void()>;
    using StopHandler = std::function<void()>;

    HandTrackingSession(SerialExecutor& executor, UpdateHandler onUpdate,
                        StartHandler onStarted = {}, StopHandler onStopped = {});
    ~HandTrackingSession();

    HandTrackingSession(const HandTrackingSession&) = delete;
    HandTrackingSession& operator=(const HandTrackingSession&) = delete;

    /**
     * @brief Starts the provider and the consumer task
     *
     * The provider is borrowed until stop(). A session whose stream was
     * closed by its provider is stopped first.
     *
     * @return false if already running, unsupported, or the provider failed
     */
    bool start(IHandTrackingProvider& provider);

    /**
     * @brief Cancels consumption and releases the provider; no-op if idle
     */
    void stop();

    /**
     * @brief True between a successful start() and stop(), unless the
     *        provider has closed the stream since
     */
    bool isRunning() const;

private:
    SerialExecutor& executor;
    UpdateHandler onUpdate;
    StartHandler onStarted;
    StopHandler onStopped;

    IHandTrackingProvider* provider = nullptr;
    std::shared_ptr<AnchorStream> stream;
    std::future<void> consumer;
};

#endif // PINGPONG_HAND_TRACKING_SESSION_HPP
