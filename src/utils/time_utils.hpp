#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

std::string get_current_human_readable_time();

// Wall clock as fractional unix seconds
double get_current_epoch_seconds();

// Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]"; no suffix means UTC.
bool parse_iso_time_to_epoch(const std::string& timestamp, double& epoch_seconds_out);

std::string format_epoch_as_iso_utc(double epoch_seconds);
std::string format_epoch_as_human_readable(double epoch_seconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
