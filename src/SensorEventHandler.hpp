#ifndef SENSOR_EVENT_HANDLER_HPP
#define SENSOR_EVENT_HANDLER_HPP

#include "DataLogger.hpp"
#include "Heartbeat.hpp"
#include "SensorData.hpp"

#include <iostream>
#include <set>

// Filters incoming readings by sensor ID and fans them out to the console
// and the data logger.
class SensorEventHandler
{
public:
    // heartbeat may be null. An empty sensors set accepts every sensor.
    SensorEventHandler(DataLogger& logger, Heartbeat* heartbeat, const std::set<int>& sensors,
                       bool silent, bool verbose, std::ostream& out = std::cout);

    void handle_sensor_event(const SensorData& data);
    void handle_loop();
    void handle_exit();

private:
    bool accepts(int id) const;
    void print_sensor_data(const SensorData& data);

    DataLogger& logger;
    Heartbeat* heartbeat;
    std::set<int> sensors;
    bool silent;
    bool verbose;
    std::ostream& out;
    bool exited;
};

#endif // SENSOR_EVENT_HANDLER_HPP
