#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>

namespace TimeUtils {

constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr long long SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

// strftime formats
constexpr const char* ISO_DATE = "%Y-%m-%d";
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* RUN_ID_FORMAT = "%Y%m%d_%H%M%S";   // Run folders and export file names

// Wall clock. Local time except the _with_z variant, which is UTC.
std::string get_current_time_formatted(const char* time_format);
std::string get_current_human_readable_time();
std::string get_current_iso_time_with_z();
long long get_current_epoch_seconds();

// Bar dates. Epoch seconds are UTC; utc_offset_seconds moves them to the exchange's calendar day.
std::string epoch_seconds_to_iso_date(long long epoch_seconds, long long utc_offset_seconds);
// UTC midnight of a YYYY-MM-DD date. Throws std::runtime_error on malformed input.
long long iso_date_to_epoch_seconds(const std::string& iso_date);
// Calendar arithmetic on YYYY-MM-DD; day_count may be negative.
std::string add_calendar_days(const std::string& iso_date, long long day_count);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
