#include "SensorEventLoop.hpp"
#include "Logger.hpp"

#include <csignal>

EventLoopWatchVariable *SensorEventLoop::activeWatchVariable = nullptr;

SensorEventLoop::SensorEventLoop(SensorHub& sensorHub, SensorEventHandler& eventHandler, unsigned intervalMs)
    : hub(sensorHub), handler(eventHandler), intervalUs(intervalMs * 1000),
      scheduler(nullptr), env(nullptr), tickTask(nullptr), watchVariable(0)
{
    scheduler = BasicTaskScheduler::createNew();
    env = BasicUsageEnvironment::createNew(*scheduler);
    LOG_DEBUG("SensorEventLoop created, polling every " << intervalMs << " ms");
}

SensorEventLoop::~SensorEventLoop()
{
    if (tickTask != nullptr) {
        env->taskScheduler().unscheduleDelayedTask(tickTask);
    }
    env->reclaim();
    env = nullptr;
    delete scheduler;
    scheduler = nullptr;
    LOG_DEBUG("SensorEventLoop destroyed");
}

void SensorEventLoop::run()
{
    hub.register_sensor_event([this](const SensorData& data) {
        handler.handle_sensor_event(data);
    });

    install_signal_handlers();

    // First poll happens right away, the following ones every interval
    tickTask = env->taskScheduler().scheduleDelayedTask(0, tick, this);

    LOG_INFO("Waiting for sensor events");
    env->taskScheduler().doEventLoop(&watchVariable);

    restore_signal_handlers();
    env->taskScheduler().unscheduleDelayedTask(tickTask);
    tickTask = nullptr;

    LOG_INFO("Sensor event loop stopped");
    handler.handle_exit();
}

void SensorEventLoop::stop()
{
    watchVariable = 1;
}

void SensorEventLoop::tick(void *clientData)
{
    SensorEventLoop *loop = static_cast<SensorEventLoop *>(clientData);
    loop->tickTask = nullptr;

    loop->hub.process_pending_events();
    loop->handler.handle_loop();

    if (!loop->watchVariable) {
        loop->tickTask = loop->env->taskScheduler().scheduleDelayedTask(loop->intervalUs, tick, loop);
    }
}

void SensorEventLoop::handle_signal(int /*signum*/)
{
    if (activeWatchVariable != nullptr)
        *activeWatchVariable = 1;
}

void SensorEventLoop::install_signal_handlers()
{
    activeWatchVariable = &watchVariable;

    struct sigaction action = {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    // A second interrupt gets the default disposition and terminates
    action.sa_flags = SA_RESETHAND;

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_WARN("Could not install signal handlers, the loop can only be stopped by killing the process");
    }
}

void SensorEventLoop::restore_signal_handlers()
{
    struct sigaction action = {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_WARN("Could not restore default signal handlers");
    }

    activeWatchVariable = nullptr;
}
