#pragma once

#include "hal/SensorHub.hpp"
#include "hal/SensorEventQueue.hpp"

#include <telldus-core.h>

#include <string>

// Sensor hub backed by a Tellstick through the telldus-core SDK.
class TelldusSensorHub : public SensorHub {
public:
    TelldusSensorHub();
    ~TelldusSensorHub() override;

    TelldusSensorHub(const TelldusSensorHub&) = delete;
    TelldusSensorHub& operator=(const TelldusSensorHub&) = delete;

    std::vector<SensorInfo> list_sensors() override;
    void register_sensor_event(SensorEventCallback callback) override;
    void process_pending_events() override;

private:
    // Runs on the SDK's event thread
    static void WINAPI on_sensor_event(const char *protocol, const char *model, int id,
                                       int dataType, const char *value, int timestamp,
                                       int callbackId, void *context);

    static std::optional<SensorValue> read_value(const char *protocol, const char *model,
                                                 int id, int dataType);
    static std::string error_string(int code);

    SensorEventQueue queue;
    SensorEventCallback callback;
    int callbackId = -1;
};
