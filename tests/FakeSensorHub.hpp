#pragma once

#include "hal/SensorEventQueue.hpp"
#include "hal/SensorHub.hpp"

#include <functional>

// In-memory hub: tests push readings, the poll loop drains them.
class FakeSensorHub : public SensorHub {
public:
    std::vector<SensorInfo> list_sensors() override {
        return sensors;
    }

    void register_sensor_event(SensorEventCallback cb) override {
        callback = std::move(cb);
        registrations++;
    }

    void process_pending_events() override {
        polls++;
        if (on_poll)
            on_poll(polls);
        queue.drain([this](const SensorData& data) {
            if (callback)
                callback(data);
        });
    }

    std::vector<SensorInfo> sensors;
    SensorEventQueue queue;
    SensorEventCallback callback;
    std::function<void(int)> on_poll;
    int registrations = 0;
    int polls = 0;
};
