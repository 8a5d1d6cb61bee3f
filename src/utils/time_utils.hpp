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
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

std::string get_current_human_readable_time();

// Unix epoch readings taken at the moment of the call.
long long get_current_epoch_milliseconds();
long long get_current_epoch_seconds();

std::string format_epoch_seconds_iso_with_z(long long epoch_seconds);

// Gregorian month length, month in 1..12.
int days_in_month(int year, int month);

// Seconds since epoch for 00:00:00 UTC on the given calendar date.
long long utc_midnight_epoch_seconds(int year, int month, int day);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
