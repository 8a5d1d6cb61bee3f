#include "time_utils.hpp"
#include <sstream>
#include <iomanip>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    
    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

long long get_current_epoch_milliseconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

long long get_current_epoch_seconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string format_epoch_seconds_iso_with_z(long long epoch_seconds) {
    time_t in_time_t = static_cast<time_t>(epoch_seconds);
    std::stringstream ss;
    
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

int days_in_month(int year, int month) {
    static const int month_lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap_year = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap_year ? 29 : 28;
    }
    return month_lengths[month - 1];
}

long long utc_midnight_epoch_seconds(int year, int month, int day) {
    std::tm date_tm = {};
    date_tm.tm_year = year - 1900;
    date_tm.tm_mon = month - 1;
    date_tm.tm_mday = day;
    return static_cast<long long>(timegm(&date_tm));
}

} // namespace TimeUtils
