#include "SensorData.hpp"
#include "TimeUtils.hpp"

#include <ostream>
#include <sstream>

SensorData::SensorData(const std::string& protocol, const std::string& model, int id,
                       int datatype, const std::string& value, time_t timestamp, int cid)
    : protocol_(protocol), model_(model), id_(id), datatype_(datatype),
      value_(value), timestamp_(timestamp), cid_(cid) {
}

SensorDataType SensorData::datatype() const {
    switch (datatype_) {
    case static_cast<int>(SensorDataType::Temperature):
        return SensorDataType::Temperature;
    case static_cast<int>(SensorDataType::Humidity):
        return SensorDataType::Humidity;
    default:
        return SensorDataType::Unknown;
    }
}

const char* SensorData::datatype_to_string(int datatype) {
    switch (datatype) {
    case static_cast<int>(SensorDataType::Temperature):
        return "temperature";
    case static_cast<int>(SensorDataType::Humidity):
        return "humidity";
    default:
        return "unknown";
    }
}

std::string SensorData::to_string() const {
    std::ostringstream ss;
    ss << TimeUtils::format_local_time(timestamp_)
       << " SENSOR " << id_
       << " [" << protocol_ << "/" << model_ << "] "
       << datatype_to_string(datatype_)
       << " value: " << value_;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const SensorData& data) {
    return os << data.to_string();
}
