#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <sstream>
#include <string>

// Collects the streamed pieces of a LOG_* statement.
class LogMsg
{
public:
    template <typename T>
    LogMsg &operator<<(const T &value)
    {
        stream << value;
        return *this;
    }

    std::string str() const { return stream.str(); }

private:
    std::ostringstream stream;
};

class Logger
{
public:
    enum Level
    {
        ERROR,
        WARN,
        NOTICE,
        INFO,
        DEBUG
    };

    static void setLevel(Level level);
    static bool setLevel(const std::string &name);
    static Level getLevel();
    static bool parseLevel(const std::string &name, Level &level);

    static void log(Level level, const char *file, const LogMsg &msg);

private:
    static const char *levelName(Level level);
    static Level level;
};

#define LOG_ERROR(str) Logger::log(Logger::ERROR, __FILE__, LogMsg() << str)
#define LOG_WARN(str) Logger::log(Logger::WARN, __FILE__, LogMsg() << str)
#define LOG_NOTICE(str) Logger::log(Logger::NOTICE, __FILE__, LogMsg() << str)
#define LOG_INFO(str) Logger::log(Logger::INFO, __FILE__, LogMsg() << str)
#define LOG_DEBUG(str) Logger::log(Logger::DEBUG, __FILE__, LogMsg() << str)

#endif // LOGGER_HPP
