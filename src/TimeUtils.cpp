#include "TimeUtils.hpp"

#include <time.h>

namespace TimeUtils {

std::string format_local_time(time_t timestamp)
{
    struct tm local;
    if (localtime_r(&timestamp, &local) == nullptr)
        return std::to_string(timestamp);

    char buffer[32];
    size_t length = strftime(buffer, sizeof(buffer), "%F %T", &local);
    return std::string(buffer, length);
}

} // namespace TimeUtils
