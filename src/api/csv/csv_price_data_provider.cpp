#include "csv_price_data_provider.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace CanslimScanner {
namespace API {

namespace {
    std::vector<std::string> split_csv_line(const std::string& line) {
        std::vector<std::string> fields;
        std::string current_field;
        bool in_quotes = false;
        for (char character : line) {
            if (character == '"') {
                in_quotes = !in_quotes;
            } else if (character == ',' && !in_quotes) {
                fields.push_back(current_field);
                current_field.clear();
            } else if (character != '\r') {
                current_field += character;
            }
        }
        fields.push_back(current_field);
        return fields;
    }

    std::string trim_field(const std::string& field) {
        size_t first = field.find_first_not_of(" \t");
        if (first == std::string::npos) return "";
        size_t last = field.find_last_not_of(" \t");
        return field.substr(first, last - first + 1);
    }

    double parse_numeric_field(const std::string& field) {
        std::string trimmed = trim_field(field);
        if (trimmed.empty()) return std::numeric_limits<double>::quiet_NaN();
        try {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            return consumed == trimmed.size() ? value : std::numeric_limits<double>::quiet_NaN();
        } catch (const std::exception&) {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

    std::string lowercase(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }
}

CsvPriceDataProvider::CsvPriceDataProvider(const std::string& price_data_directory)
    : directory(price_data_directory) {}

Core::RawPriceTable CsvPriceDataProvider::get_history(const std::string& symbol, int lookback_days) const {
    std::string file_path = directory + "/" + symbol + ".csv";
    std::ifstream price_file(file_path);
    if (!price_file.is_open()) {
        throw Core::DataUnavailableError(symbol + ": price file not found: " + file_path);
    }
    std::stringstream file_buffer;
    file_buffer << price_file.rdbuf();
    return parse_price_csv(symbol, file_buffer.str(), lookback_days);
}

Core::RawPriceTable CsvPriceDataProvider::parse_price_csv(const std::string& symbol, const std::string& csv_content, int lookback_days) {
    std::istringstream csv_stream(csv_content);
    std::string line;
    if (!std::getline(csv_stream, line)) {
        throw Core::DataUnavailableError(symbol + ": price file is empty");
    }

    std::vector<std::string> header_fields = split_csv_line(line);
    size_t date_column = 0;
    for (size_t column_index = 0; column_index < header_fields.size(); ++column_index) {
        if (lowercase(trim_field(header_fields[column_index])) == "date") {
            date_column = column_index;
            break;
        }
    }

    Core::RawPriceTable raw_table;
    raw_table.symbol = symbol;
    for (size_t column_index = 0; column_index < header_fields.size(); ++column_index) {
        if (column_index != date_column) {
            raw_table.column_names.push_back(trim_field(header_fields[column_index]));
        }
    }

    while (std::getline(csv_stream, line)) {
        if (trim_field(line).empty() || trim_field(line) == "\r") continue;
        std::vector<std::string> fields = split_csv_line(line);
        std::vector<double> row_values;
        row_values.reserve(raw_table.column_names.size());
        for (size_t column_index = 0; column_index < header_fields.size(); ++column_index) {
            if (column_index == date_column) continue;
            row_values.push_back(column_index < fields.size() ? parse_numeric_field(fields[column_index])
                                                             : std::numeric_limits<double>::quiet_NaN());
        }
        raw_table.dates.push_back(date_column < fields.size() ? trim_field(fields[date_column]) : "");
        raw_table.rows.push_back(row_values);
    }

    if (lookback_days <= 0 || raw_table.dates.empty()) {
        return raw_table;
    }

    // Malformed dates are left for the normalizer to drop.
    std::vector<bool> has_valid_date(raw_table.dates.size(), false);
    std::string latest_date;
    for (size_t row_index = 0; row_index < raw_table.dates.size(); ++row_index) {
        const std::string row_date = raw_table.dates[row_index].substr(0, 10);
        try {
            TimeUtils::iso_date_to_epoch_seconds(row_date);
        } catch (const std::runtime_error&) {
            continue;
        }
        has_valid_date[row_index] = true;
        latest_date = std::max(latest_date, row_date);
    }
    if (latest_date.empty()) {
        return raw_table;
    }

    const std::string cutoff_date = TimeUtils::add_calendar_days(latest_date, -static_cast<long long>(lookback_days));
    Core::RawPriceTable filtered_table;
    filtered_table.symbol = raw_table.symbol;
    filtered_table.column_names = raw_table.column_names;
    for (size_t row_index = 0; row_index < raw_table.dates.size(); ++row_index) {
        if (has_valid_date[row_index] && raw_table.dates[row_index].substr(0, 10) < cutoff_date) continue;
        filtered_table.dates.push_back(raw_table.dates[row_index]);
        filtered_table.rows.push_back(raw_table.rows[row_index]);
    }
    return filtered_table;
}

} // namespace API
} // namespace CanslimScanner
