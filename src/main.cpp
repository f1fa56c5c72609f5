#include "CommandLine.hpp"
#include "Config.hpp"
#include "DataLogger.hpp"
#include "Heartbeat.hpp"
#include "Logger.hpp"
#include "SensorEventHandler.hpp"
#include "SensorEventLoop.hpp"
#include "SensorTable.hpp"
#include "SystemSensorHub.hpp"

#include <iostream>
#include <memory>

static int list_sensors()
{
    std::unique_ptr<SensorHub> hub = SystemSensorHub::create();
    SensorTable table(std::cout);
    table.print(hub->list_sensors());
    return 0;
}

static int run_event_loop(const Config &config)
{
    std::unique_ptr<DataLogger> logger;
    try {
        logger = DataLogger::create(config.logging);
    } catch (const std::runtime_error &e) {
        // Logfile could not be opened or the log type has no backend
        std::cout << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<Heartbeat> heartbeat;
    if (config.console.heartbeat)
        heartbeat = std::make_unique<Heartbeat>(std::cout);

    SensorEventHandler handler(*logger, heartbeat.get(), config.sensors.ids,
                               config.console.silent, config.console.verbose);

    std::unique_ptr<SensorHub> hub = SystemSensorHub::create();
    SensorEventLoop loop(*hub, handler, config.general.poll_interval_ms);
    loop.run();

    return 0;
}

int main(int argc, char *argv[])
{
    Config config;

    switch (CommandLine::parse(argc, argv, config)) {
    case CommandLine::EXIT_OK:
        return 0;
    case CommandLine::EXIT_USAGE:
        return 2;
    case CommandLine::CONTINUE:
        break;
    }

    if (!Logger::setLevel(config.general.loglevel))
        LOG_WARN("Unknown log level " << config.general.loglevel);
    LOG_DEBUG("Starting telltemp");

    try {
        if (config.general.list)
            return list_sensors();

        return run_event_loop(config);
    } catch (const std::exception &e) {
        LOG_ERROR(e.what());
        return 1;
    }
}
