#ifndef SENSOR_TABLE_HPP
#define SENSOR_TABLE_HPP

#include "hal/SensorInfo.hpp"

#include <iostream>
#include <vector>

// Prints the sensors known to the hardware as a fixed-width table.
class SensorTable
{
public:
    explicit SensorTable(std::ostream& out = std::cout);

    void print(const std::vector<SensorInfo>& sensors);

    // Earlier of the temperature and humidity timestamps; 0 if neither exists.
    static time_t last_updated(const SensorInfo& sensor);

private:
    std::ostream& out;
};

#endif // SENSOR_TABLE_HPP
