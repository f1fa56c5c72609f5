#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <set>
#include <string>

enum class LogType {
    CSV,
    SQLite
};

struct _general {
    std::string loglevel = "WARN";
    unsigned poll_interval_ms = 500;
    bool list = false;
};

struct _logging {
    std::string file;          // Empty: no data logging
    LogType type = LogType::CSV;
    bool overwrite = false;    // Truncate instead of append
};

struct _console {
    bool heartbeat = false;
    bool silent = false;
    bool verbose = false;
};

struct _sensors {
    std::set<int> ids;         // Empty: accept every sensor
};

class Config {
public:
    _general general;
    _logging logging;
    _console console;
    _sensors sensors;
};

#endif // CONFIG_HPP
