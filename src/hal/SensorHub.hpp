#pragma once

#include "SensorInfo.hpp"
#include "../SensorData.hpp"

#include <functional>
#include <vector>

using SensorEventCallback = std::function<void(const SensorData&)>;

class SensorHub {
public:
    virtual ~SensorHub() = default;

    // Returns every sensor known to the hardware, with cached values
    virtual std::vector<SensorInfo> list_sensors() = 0;

    // Sets the callback invoked for each reading by process_pending_events
    virtual void register_sensor_event(SensorEventCallback callback) = 0;

    // Delivers readings queued since the previous call, in arrival order
    virtual void process_pending_events() = 0;
};
