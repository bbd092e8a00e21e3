#include "pingpong/tracking/hand_tracking_provider.hpp"

QueuedTrackingProvider::QueuedTrackingProvider(bool supported) : supported(supported) {}

bool QueuedTrackingProvider::isSupported() const {
    return supported;
}

std::shared_ptr<AnchorStream> QueuedTrackingProvider::run() {
    if (!supported) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(streamMutex);
    if (stream && !stream->isClosed()) {
        return stream;
    }
    stream = std::make_shared<AnchorStream>();
    return stream;
}

void QueuedTrackingProvider::stop() {
    std::shared_ptr<AnchorStream> old;
    {
        std::lock_guard<std::mutex> lock(streamMutex);
        old.swap(stream);
    }
    if (old) {
        old->close();
    }
}

bool QueuedTrackingProvider::push(const AnchorUpdate& update) {
    std::shared_ptr<AnchorStream> current;
    {
        std::lock_guard<std::mutex> lock(streamMutex);
        current = stream;
    }
    return current && current->send(update);
}

bool QueuedTrackingProvider::isRunning() const {
    std::lock_guard<std::mutex> lock(streamMutex);
    return stream && !stream->isClosed();
}
