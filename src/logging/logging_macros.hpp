#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "logger/async_logger.hpp"
#include <string>

namespace CanslimScanner {
namespace Logging {

constexpr size_t TABLE_LABEL_WIDTH = 18;
constexpr size_t TABLE_VALUE_WIDTH = 46;

// "| label | value |" with both cells padded or cut to the table widths.
inline std::string format_table_row(const std::string& label, const std::string& value) {
    std::string label_cell = label.substr(0, TABLE_LABEL_WIDTH);
    std::string value_cell = value.substr(0, TABLE_VALUE_WIDTH);
    label_cell.append(TABLE_LABEL_WIDTH - label_cell.size(), ' ');
    value_cell.append(TABLE_VALUE_WIDTH - value_cell.size(), ' ');
    return "| " + label_cell + " | " + value_cell + " |";
}

inline std::string format_table_rule() {
    return "+" + std::string(TABLE_LABEL_WIDTH + 2, '-') + "+" + std::string(TABLE_VALUE_WIDTH + 2, '-') + "+";
}

} // namespace Logging
} // namespace CanslimScanner

// Sections
#define LOG_SECTION_HEADER(title) log_message("+-- " + std::string(title), "")
#define LOG_SECTION_LINE(msg) log_message("|   " + std::string(msg), "")
#define LOG_SECTION_DETAIL(msg) log_message("|     " + std::string(msg), "")
#define LOG_SECTION_BREAK() log_message("|", "")
#define LOG_SECTION_FOOTER() log_message("+--", "")

// Two-column tables
#define LOG_TABLE_HEADER(title, subtitle) do { \
    LOG_SECTION_LINE(CanslimScanner::Logging::format_table_rule()); \
    LOG_SECTION_LINE(CanslimScanner::Logging::format_table_row(title, subtitle)); \
    LOG_SECTION_LINE(CanslimScanner::Logging::format_table_rule()); \
} while (0)
#define LOG_TABLE_ROW(label, value) LOG_SECTION_LINE(CanslimScanner::Logging::format_table_row(label, value))
#define LOG_TABLE_RULE() LOG_SECTION_LINE(CanslimScanner::Logging::format_table_rule())

#endif // LOGGING_MACROS_HPP
