#include "pingpong/tracking/hand_tracking_session.hpp"

#include <chrono>
#include <iostream>
#include <utility>

HandTrackingSession::HandTrackingSession(SerialExecutor& executor, UpdateHandler onUpdate,
                                         StartHandler onStarted, StopHandler onStopped)
    : executor(executor)
    , onUpdate(std::move(onUpdate))
    , onStarted(std::move(onStarted))
    , onStopped(std::move(onStopped))
{
}

HandTrackingSession::~HandTrackingSession() {
    stop();
}

bool HandTrackingSession::isRunning() const {
    if (!provider) {
        return false;
    }
    // The consumer only returns once the stream is closed
    return !consumer.valid()
        || consumer.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

bool HandTrackingSession::start(IHandTrackingProvider& trackingProvider) {
    if (provider && !isRunning()) {
        std::cout << "Hand tracking stream ended by provider" << std::endl;
        stop();
    }
    if (provider) {
        return false;
    }

    if (!trackingProvider.isSupported()) {
        std::cerr << "Hand tracking is not supported on this device" << std::endl;
        return false;
    }

    auto updates = trackingProvider.run();
    if (!updates) {
        std::cerr << "Failed to start hand tracking" << std::endl;
        return false;
    }

    provider = &trackingProvider;
    stream = updates;

    // The task only owns the stream and a copy of the handler, never this.
    // Updates still queued on the executor when the stream closes are dropped.
    consumer = std::async(std::launch::async,
        [updates, handler = onUpdate, &exec = executor]() {
            while (auto update = updates->receive()) {
                exec.post([handler, updates, item = *update]() {
                    if (handler && !updates->isClosed()) {
                        handler(item);
                    }
                });
            }
        });

    if (onStarted) {
        onStarted();
    }
    std::cout << "Hand tracking started successfully" << std::endl;
    return true;
}

void HandTrackingSession::stop() {
    if (!provider) {
        return;
    }

    stream->close();
    if (consumer.valid()) {
        consumer.get();
    }
    provider->stop();

    provider = nullptr;
    stream.reset();

    if (onStopped) {
        onStopped();
    }
    std::cout << "Hand tracking stopped" << std::endl;
}
