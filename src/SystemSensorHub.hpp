#pragma once

#include "hal/SensorHub.hpp"
#include <memory>

class SystemSensorHub {
public:
    static std::unique_ptr<SensorHub> create();
};
