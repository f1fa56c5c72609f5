#include "SystemSensorHub.hpp"

#include "hal/telldus/TelldusSensorHub.hpp"

std::unique_ptr<SensorHub> SystemSensorHub::create() {
    return std::make_unique<TelldusSensorHub>();
}
