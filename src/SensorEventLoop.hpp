#ifndef SENSOR_EVENT_LOOP_HPP
#define SENSOR_EVENT_LOOP_HPP

#include "SensorEventHandler.hpp"
#include "hal/SensorHub.hpp"

#include <BasicUsageEnvironment.hh>

// Polls the sensor hub on a live555 task scheduler until stopped by
// SIGINT/SIGTERM or stop().
class SensorEventLoop
{
public:
    SensorEventLoop(SensorHub& hub, SensorEventHandler& handler, unsigned intervalMs = 500);
    ~SensorEventLoop();

    SensorEventLoop(const SensorEventLoop&) = delete;
    SensorEventLoop& operator=(const SensorEventLoop&) = delete;

    // Blocks until stopped, then calls the handler's handle_exit once.
    void run();
    void stop();

private:
    static void tick(void *clientData);
    static void handle_signal(int signum);
    void install_signal_handlers();
    void restore_signal_handlers();

    SensorHub& hub;
    SensorEventHandler& handler;
    unsigned intervalUs;

    TaskScheduler *scheduler;
    UsageEnvironment *env;
    TaskToken tickTask;
    EventLoopWatchVariable watchVariable;

    static EventLoopWatchVariable *activeWatchVariable;
};

#endif // SENSOR_EVENT_LOOP_HPP
