/**
 * @file hand_tracking_provider.hpp
 * @brief Boundary to the platform's hand-tracking service
 */

#ifndef PINGPONG_HAND_TRACKING_PROVIDER_HPP
#define PINGPONG_HAND_TRACKING_PROVIDER_HPP

#include <memory>
#include <mutex>
#include "pingpong/core/channel.hpp"
#include "pingpong/tracking/anchor_update.hpp"

using AnchorStream = Channel<AnchorUpdate>;

/**
 * @class IHandTrackingProvider
 * @brief A platform hand-tracking session producing anchor updates
 */
class IHandTrackingProvider {
public:
    virtual ~IHandTrackingProvider() = default;

    /**
     * @brief Whether the device can track hands at all
     */
    virtual bool isSupported() const = 0;

    /**
     * @brief Starts the platform session
     * @return The ordered anchor-update stream, or nullptr if the session
     *         could not be started
     */
    virtual std::shared_ptr<AnchorStream> run() = 0;

    /**
     * @brief Stops the platform session and releases it
     */
    virtual void stop() = 0;
};

/**
 * @class QueuedTrackingProvider
 * @brief In-process provider fed by push(), for the demo and for tests
 *
 * push() may be called from any thread while the provider is running.
 */
class QueuedTrackingProvider : public IHandTrackingProvider {
public:
    explicit QueuedTrackingProvider(bool supported = true);

    bool isSupported() const override;
    std::shared_ptr<AnchorStream> run() override;
    void stop() override;

    /**
     * @brief Delivers an update to the running session
     * @return false if the provider is not running
     */
    bool push(const AnchorUpdate& update);

    bool isRunning() const;

private:
    bool supported;
    mutable std::mutex streamMutex;
    std::shared_ptr<AnchorStream> stream;
};

#endif // PINGPONG_HAND_TRACKING_PROVIDER_HPP
