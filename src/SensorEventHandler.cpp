#include "SensorEventHandler.hpp"
#include "Logger.hpp"

SensorEventHandler::SensorEventHandler(DataLogger& dataLogger, Heartbeat* hb, const std::set<int>& ids,
                                       bool silentMode, bool verboseMode, std::ostream& output)
    : logger(dataLogger), heartbeat(hb), sensors(ids), silent(silentMode),
      verbose(verboseMode), out(output), exited(false)
{
    LOG_DEBUG("SensorEventHandler created, filtering on " << sensors.size() << " sensor IDs");
}

bool SensorEventHandler::accepts(int id) const
{
    return sensors.empty() || sensors.count(id) > 0;
}

void SensorEventHandler::print_sensor_data(const SensorData& data)
{
    if (silent)
        return;

    if (heartbeat)
        heartbeat->erase();

    out << data << std::endl;

    if (heartbeat)
        heartbeat->dont_flush();
}

void SensorEventHandler::handle_sensor_event(const SensorData& data)
{
    if (accepts(data.id())) {
        print_sensor_data(data);
        logger.log_sensor_data(data);
    } else if (verbose) {
        out << "Ignoring sensor with ID " << data.id() << std::endl;
    }
}

void SensorEventHandler::handle_loop()
{
    if (heartbeat)
        heartbeat->print_output();
}

void SensorEventHandler::handle_exit()
{
    if (exited)
        return;
    exited = true;

    if (heartbeat)
        heartbeat->clean_up();
}
