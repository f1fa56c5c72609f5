#ifndef DATA_LOGGER_HPP
#define DATA_LOGGER_HPP

#include "Config.hpp"
#include "SensorData.hpp"

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

class NotImplementedError : public std::runtime_error {
public:
    explicit NotImplementedError(const std::string& what) : std::runtime_error(what) {}
};

// Sink for accepted sensor readings. Implementations hold their resources
// for their whole lifetime and release them on destruction.
class DataLogger {
public:
    virtual ~DataLogger() = default;

    virtual void log_sensor_data(const SensorData& data) = 0;

    // Throws std::runtime_error if the logfile cannot be opened and
    // NotImplementedError for log types without a backend.
    static std::unique_ptr<DataLogger> create(const _logging& logging);
};

class NullDataLogger : public DataLogger {
public:
    void log_sensor_data(const SensorData& data) override;
};

class CSVDataLogger : public DataLogger {
public:
    static const char* const HEADER;

    CSVDataLogger(const std::string& path, bool overwrite);
    ~CSVDataLogger() override;

    CSVDataLogger(const CSVDataLogger&) = delete;
    CSVDataLogger& operator=(const CSVDataLogger&) = delete;

    void log_sensor_data(const SensorData& data) override;

private:
    void write_row(const std::string& timestamp, const std::string& id,
                   const std::string& temperature, const std::string& humidity);
    static std::string escape_field(const std::string& field);

    std::string path;
    std::ofstream file;
};

class SQLiteDataLogger : public DataLogger {
public:
    explicit SQLiteDataLogger(const std::string& path);

    void log_sensor_data(const SensorData& data) override;
};

#endif // DATA_LOGGER_HPP
