#pragma once

#include "../SensorData.hpp"

#include <deque>
#include <functional>
#include <mutex>

// Hands readings from the hardware SDK's callback thread over to the poll loop.
class SensorEventQueue {
public:
    void push(const SensorData& data);

    // Invokes callback for each pending reading, outside of the lock.
    // Returns the number of readings delivered.
    size_t drain(const std::function<void(const SensorData&)>& callback);

    size_t size();

private:
    std::mutex lock;
    std::deque<SensorData> pending;
};
