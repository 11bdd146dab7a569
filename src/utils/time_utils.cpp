#include "time_utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TimeUtils {

namespace {
    std::string format_tm(const std::tm& time_parts, const char* time_format) {
        std::ostringstream formatted_stream;
        formatted_stream << std::put_time(&time_parts, time_format);
        return formatted_stream.str();
    }

    std::time_t now_as_time_t() {
        return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    }
}

std::string get_current_time_formatted(const char* time_format) {
    std::time_t now = now_as_time_t();
    std::tm local_parts;
    localtime_r(&now, &local_parts);
    return format_tm(local_parts, time_format);
}

std::string get_current_human_readable_time() {
    return get_current_time_formatted(HUMAN_READABLE);
}

std::string get_current_iso_time_with_z() {
    std::time_t now = now_as_time_t();
    std::tm utc_parts;
    gmtime_r(&now, &utc_parts);
    return format_tm(utc_parts, ISO_8601_WITH_Z);
}

long long get_current_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string epoch_seconds_to_iso_date(long long epoch_seconds, long long utc_offset_seconds) {
    std::time_t shifted_time = static_cast<std::time_t>(epoch_seconds + utc_offset_seconds);
    std::tm utc_parts;
    gmtime_r(&shifted_time, &utc_parts);
    return format_tm(utc_parts, ISO_DATE);
}

long long iso_date_to_epoch_seconds(const std::string& iso_date) {
    std::tm parsed_parts = {};
    std::istringstream date_stream(iso_date);
    date_stream >> std::get_time(&parsed_parts, ISO_DATE);
    if (date_stream.fail()) {
        throw std::runtime_error("Invalid ISO date: " + iso_date);
    }
    return static_cast<long long>(timegm(&parsed_parts));
}

std::string add_calendar_days(const std::string& iso_date, long long day_count) {
    return epoch_seconds_to_iso_date(iso_date_to_epoch_seconds(iso_date) + day_count * SECONDS_PER_DAY, 0);
}

} // namespace TimeUtils
