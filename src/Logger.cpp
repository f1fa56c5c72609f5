#include "Logger.hpp"
#include "TimeUtils.hpp"

#include <cstring>
#include <ctime>
#include <iostream>

Logger::Level Logger::level = Logger::WARN;

void Logger::setLevel(Level newLevel)
{
    level = newLevel;
}

bool Logger::setLevel(const std::string &name)
{
    Level parsed;
    if (!parseLevel(name, parsed))
        return false;

    level = parsed;
    return true;
}

Logger::Level Logger::getLevel()
{
    return level;
}

bool Logger::parseLevel(const std::string &name, Level &parsed)
{
    static const Level levels[] = {ERROR, WARN, NOTICE, INFO, DEBUG};

    for (Level candidate : levels) {
        if (name == levelName(candidate)) {
            parsed = candidate;
            return true;
        }
    }
    return false;
}

const char *Logger::levelName(Level lvl)
{
    switch (lvl) {
    case ERROR:
        return "ERROR";
    case WARN:
        return "WARN";
    case NOTICE:
        return "NOTICE";
    case INFO:
        return "INFO";
    case DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

void Logger::log(Level lvl, const char *file, const LogMsg &msg)
{
    if (lvl > level)
        return;

    // Strip the directory part of __FILE__
    const char *module = std::strrchr(file, '/');
    module = module ? module + 1 : file;

    std::cerr << TimeUtils::format_local_time(std::time(nullptr)) << " [" << levelName(lvl)
              << ":" << module << "]: " << msg.str() << std::endl;
}
