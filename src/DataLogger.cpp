#include "DataLogger.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

const char* const CSVDataLogger::HEADER = "Timestamp,ID,Temperature,Humidity";

std::unique_ptr<DataLogger> DataLogger::create(const _logging& logging) {
    if (logging.type == LogType::SQLite) {
        return std::make_unique<SQLiteDataLogger>(logging.file);
    }

    if (logging.file.empty()) {
        LOG_DEBUG("No logfile configured, sensor data will not be logged");
        return std::make_unique<NullDataLogger>();
    }

    return std::make_unique<CSVDataLogger>(logging.file, logging.overwrite);
}

void NullDataLogger::log_sensor_data(const SensorData& /*data*/) {
}

CSVDataLogger::CSVDataLogger(const std::string& logPath, bool overwrite)
    : path(logPath) {
    std::error_code ec;
    bool new_file = !std::filesystem::exists(path, ec);

    std::ios_base::openmode mode = std::ios_base::out | (overwrite ? std::ios_base::trunc : std::ios_base::app);

    errno = 0;
    file.open(path, mode);
    if (!file.is_open()) {
        const char* reason = errno ? std::strerror(errno) : "unknown error";
        throw std::runtime_error("Could not open logfile " + path + ": " + reason);
    }

    LOG_INFO("Logging sensor data to " << path << (overwrite ? " (overwrite)" : " (append)"));

    if (new_file || overwrite) {
        file << HEADER << "\r\n";
        file.flush();
    }
}

CSVDataLogger::~CSVDataLogger() {
    if (file.is_open()) {
        file.close();
        LOG_DEBUG("Closed logfile " << path);
    }
}

void CSVDataLogger::log_sensor_data(const SensorData& data) {
    std::string temperature;
    std::string humidity;

    switch (data.datatype()) {
    case SensorDataType::Temperature:
        temperature = data.value();
        break;
    case SensorDataType::Humidity:
        humidity = data.value();
        break;
    default:
        LOG_DEBUG("Not logging datatype " << data.raw_datatype() << " from sensor " << data.id());
        return;
    }

    write_row(std::to_string(data.timestamp()), std::to_string(data.id()), temperature, humidity);
}

void CSVDataLogger::write_row(const std::string& timestamp, const std::string& id,
                              const std::string& temperature, const std::string& humidity) {
    file << escape_field(timestamp) << ','
         << escape_field(id) << ','
         << escape_field(temperature) << ','
         << escape_field(humidity) << "\r\n";
    file.flush();

    if (!file) {
        LOG_ERROR("Failed to write sensor data to " << path);
        file.clear();
    }
}

std::string CSVDataLogger::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

SQLiteDataLogger::SQLiteDataLogger(const std::string& /*path*/) {
    throw NotImplementedError("SQLite support not yet implemented, sorry.");
}

void SQLiteDataLogger::log_sensor_data(const SensorData& /*data*/) {
}
