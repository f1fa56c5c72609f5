#include "SensorTable.hpp"
#include "TimeUtils.hpp"

#include <algorithm>
#include <iomanip>

SensorTable::SensorTable(std::ostream& output) : out(output)
{
}

time_t SensorTable::last_updated(const SensorInfo& sensor)
{
    if (sensor.temperature && sensor.humidity)
        return std::min(sensor.temperature->timestamp, sensor.humidity->timestamp);
    if (sensor.temperature)
        return sensor.temperature->timestamp;
    if (sensor.humidity)
        return sensor.humidity->timestamp;
    return 0;
}

void SensorTable::print(const std::vector<SensorInfo>& sensors)
{
    out << "Number of sensors: " << sensors.size() << "\n\n";

    out << std::left
        << std::setw(5) << "ID" << " "
        << std::setw(15) << "PROTOCOL" << " "
        << std::setw(22) << "MODEL" << " "
        << std::setw(8) << "TEMP" << " "
        << std::setw(8) << "HUMIDITY" << " "
        << "LAST UPDATED" << "\n";

    for (const auto& sensor : sensors) {
        if (!sensor.temperature && !sensor.humidity)
            continue;

        out << std::left
            << std::setw(5) << sensor.id << " "
            << std::setw(15) << sensor.protocol << " "
            << std::setw(22) << sensor.model << " "
            << std::setw(9) << (sensor.temperature ? sensor.temperature->value : "")
            << std::setw(9) << (sensor.humidity ? sensor.humidity->value : "")
            << TimeUtils::format_local_time(last_updated(sensor)) << "\n";
    }

    out << std::right;
    out.flush();
}
