#pragma once

#include <ctime>
#include <optional>
#include <string>

struct SensorValue {
    std::string value;          // As reported by the hardware (e.g., "21.5")
    time_t timestamp;           // Unix time of the last update
};

struct SensorInfo {
    std::string protocol;       // Radio protocol (e.g., "oregon")
    std::string model;          // Sensor model (e.g., "EA4C")
    int id;                     // Device ID announced by the sensor

    // Last known values, empty if the sensor never reported that datatype
    std::optional<SensorValue> temperature;
    std::optional<SensorValue> humidity;

    SensorInfo() : id(0) {}
};
