#ifndef SENSOR_DATA_HPP
#define SENSOR_DATA_HPP

#include <ctime>
#include <iosfwd>
#include <string>

// Datatype codes as delivered by the sensor hardware.
enum class SensorDataType {
    Temperature = 1,
    Humidity = 2,
    Unknown
};

// One reading received from a sensor. Immutable once constructed.
class SensorData {
public:
    SensorData(const std::string& protocol, const std::string& model, int id,
               int datatype, const std::string& value, time_t timestamp, int cid);

    const std::string& protocol() const { return protocol_; }
    const std::string& model() const { return model_; }
    int id() const { return id_; }
    int raw_datatype() const { return datatype_; }
    SensorDataType datatype() const;
    const std::string& value() const { return value_; }
    time_t timestamp() const { return timestamp_; }
    int cid() const { return cid_; }

    static const char* datatype_to_string(int datatype);

    // 2015-02-16 13:37:00 SENSOR 123 [protocol/model] temperature value: -1.23
    std::string to_string() const;

private:
    std::string protocol_;
    std::string model_;
    int id_;
    int datatype_;
    std::string value_;
    time_t timestamp_;
    int cid_;
};

std::ostream& operator<<(std::ostream& os, const SensorData& data);

#endif // SENSOR_DATA_HPP
