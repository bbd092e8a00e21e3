#include "pingpong/core/serial_executor.hpp"
#include "pingpong/core/profile.hpp"

#include <utility>

void SerialExecutor::post(Task task) {
    if (!task) {
        return;
    }
    std::lock_guard<std::mutex> lock(queueMutex);
    queue.push_back(std::move(task));
}

std::size_t SerialExecutor::drain() {
    PROFILE_SCOPE("SerialExecutor::drain");

    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        batch.swap(queue);
    }

    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

std::size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return queue.size();
}
