#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <ctime>
#include <string>

namespace TimeUtils {

// Formats a unix timestamp in the local time zone as "YYYY-MM-DD HH:MM:SS".
std::string format_local_time(time_t timestamp);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
