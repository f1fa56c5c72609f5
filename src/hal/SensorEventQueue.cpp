#include "SensorEventQueue.hpp"

void SensorEventQueue::push(const SensorData& data) {
    std::lock_guard<std::mutex> guard(lock);
    pending.push_back(data);
}

size_t SensorEventQueue::drain(const std::function<void(const SensorData&)>& callback) {
    std::deque<SensorData> batch;
    {
        std::lock_guard<std::mutex> guard(lock);
        batch.swap(pending);
    }

    for (const auto& data : batch) {
        callback(data);
    }
    return batch.size();
}

size_t SensorEventQueue::size() {
    std::lock_guard<std::mutex> guard(lock);
    return pending.size();
}
