#include "TelldusSensorHub.hpp"
#include "Logger.hpp"

#include <stdexcept>

#define PROTOCOL_LEN 32
#define MODEL_LEN 32
#define VALUE_LEN 16

TelldusSensorHub::TelldusSensorHub() {
    tdInit();
    LOG_DEBUG("telldus-core initialized");
}

TelldusSensorHub::~TelldusSensorHub() {
    if (callbackId >= 0) {
        int ret = tdUnregisterCallback(callbackId);
        if (ret != TELLSTICK_SUCCESS) {
            LOG_WARN("tdUnregisterCallback(" << callbackId << ") failed: " << error_string(ret));
        }
    }
    tdClose();
    LOG_DEBUG("telldus-core closed");
}

std::vector<SensorInfo> TelldusSensorHub::list_sensors() {
    std::vector<SensorInfo> sensors;

    char protocol[PROTOCOL_LEN];
    char model[MODEL_LEN];
    int id = 0;
    int dataTypes = 0;

    while (tdSensor(protocol, sizeof(protocol), model, sizeof(model), &id, &dataTypes) == TELLSTICK_SUCCESS) {
        SensorInfo info;
        info.protocol = protocol;
        info.model = model;
        info.id = id;

        if (dataTypes & TELLSTICK_TEMPERATURE) {
            info.temperature = read_value(protocol, model, id, TELLSTICK_TEMPERATURE);
        }
        if (dataTypes & TELLSTICK_HUMIDITY) {
            info.humidity = read_value(protocol, model, id, TELLSTICK_HUMIDITY);
        }

        LOG_DEBUG("Found sensor " << id << " [" << info.protocol << "/" << info.model
                                  << "] datatypes: " << dataTypes);
        sensors.push_back(info);
    }

    return sensors;
}

std::optional<SensorValue> TelldusSensorHub::read_value(const char *protocol, const char *model,
                                                        int id, int dataType) {
    char value[VALUE_LEN];
    int timestamp = 0;

    int ret = tdSensorValue(protocol, model, id, dataType, value, sizeof(value), &timestamp);
    if (ret != TELLSTICK_SUCCESS) {
        LOG_WARN("tdSensorValue(" << id << ", " << dataType << ") failed: " << error_string(ret));
        return std::nullopt;
    }

    return SensorValue{value, static_cast<time_t>(timestamp)};
}

void TelldusSensorHub::register_sensor_event(SensorEventCallback cb) {
    callback = std::move(cb);

    if (callbackId >= 0) {
        return;
    }

    int ret = tdRegisterSensorEvent(&TelldusSensorHub::on_sensor_event, this);
    if (ret < 0) {
        throw std::runtime_error("Could not register for sensor events: " + error_string(ret));
    }
    callbackId = ret;
    LOG_DEBUG("Registered sensor event callback " << callbackId);
}

void TelldusSensorHub::process_pending_events() {
    size_t delivered = queue.drain([this](const SensorData& data) {
        if (callback) {
            callback(data);
        }
    });

    if (delivered > 0) {
        LOG_DEBUG("Processed " << delivered << " sensor events");
    }
}

void WINAPI TelldusSensorHub::on_sensor_event(const char *protocol, const char *model, int id,
                                              int dataType, const char *value, int timestamp,
                                              int callbackId, void *context) {
    TelldusSensorHub *hub = static_cast<TelldusSensorHub *>(context);
    hub->queue.push(SensorData(protocol ? protocol : "", model ? model : "", id, dataType,
                               value ? value : "", static_cast<time_t>(timestamp), callbackId));
}

std::string TelldusSensorHub::error_string(int code) {
    char *message = tdGetErrorString(code);
    if (message == nullptr) {
        return "error " + std::to_string(code);
    }

    std::string result(message);
    tdReleaseString(message);
    return result;
}
