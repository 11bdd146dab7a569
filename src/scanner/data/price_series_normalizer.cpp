#include "price_series_normalizer.hpp"
#include "scanner/errors/scan_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace CanslimScanner {
namespace Core {

namespace {
    const std::vector<std::string> OPEN_ALIASES = {"open", "o", "openprice"};
    const std::vector<std::string> HIGH_ALIASES = {"high", "h", "highprice"};
    const std::vector<std::string> LOW_ALIASES = {"low", "l", "lowprice"};
    const std::vector<std::string> CLOSE_ALIASES = {"close", "c", "closeprice", "last"};
    const std::vector<std::string> VOLUME_ALIASES = {"volume", "v", "vol"};
    const std::vector<std::string> ADJUSTED_CLOSE_ALIASES = {"adjclose", "adjustedclose", "adjclosing", "adj"};

    bool is_valid_price(double price_value) {
        return std::isfinite(price_value) && price_value > 0.0;
    }
}

PriceSeriesNormalizer::PriceSeriesNormalizer(const SystemConfig& cfg) : config(cfg) {}

std::string PriceSeriesNormalizer::canonical_column_name(const std::string& column_name) {
    std::string canonical_name;
    canonical_name.reserve(column_name.size());
    for (char column_character : column_name) {
        if (column_character == ' ' || column_character == '_' || column_character == '-' || column_character == '.') continue;
        canonical_name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(column_character))));
    }
    return canonical_name;
}

int PriceSeriesNormalizer::resolve_column_index(const std::vector<std::string>& column_names, const std::vector<std::string>& aliases) {
    for (size_t column_index = 0; column_index < column_names.size(); ++column_index) {
        std::string canonical_name = canonical_column_name(column_names[column_index]);
        if (std::find(aliases.begin(), aliases.end(), canonical_name) != aliases.end()) {
            return static_cast<int>(column_index);
        }
    }
    return -1;
}

bool PriceSeriesNormalizer::is_iso_date(const std::string& date_string) {
    if (date_string.size() != 10 || date_string[4] != '-' || date_string[7] != '-') return false;
    for (size_t char_index = 0; char_index < date_string.size(); ++char_index) {
        if (char_index == 4 || char_index == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date_string[char_index]))) return false;
    }
    int month_value = std::stoi(date_string.substr(5, 2));
    int day_value = std::stoi(date_string.substr(8, 2));
    return month_value >= 1 && month_value <= 12 && day_value >= 1 && day_value <= 31;
}

void PriceSeriesNormalizer::fill_missing_adjusted_closes(std::vector<PriceBar>& price_bars) {
    std::vector<PriceBar>::const_iterator first_adjusted = std::find_if(price_bars.begin(), price_bars.end(),
        [](const PriceBar& price_bar) { return std::isfinite(price_bar.adjusted_close); });
    if (first_adjusted == price_bars.end()) {
        for (PriceBar& price_bar : price_bars) {
            price_bar.adjusted_close = price_bar.close_price;
        }
        return;
    }

    double adjustment_ratio = first_adjusted->adjusted_close / first_adjusted->close_price;
    for (PriceBar& price_bar : price_bars) {
        if (std::isfinite(price_bar.adjusted_close)) {
            adjustment_ratio = price_bar.adjusted_close / price_bar.close_price;
        } else {
            price_bar.adjusted_close = price_bar.close_price * adjustment_ratio;
        }
    }
}

PriceSeries PriceSeriesNormalizer::normalize(const RawPriceTable& raw_table) const {
    const std::string& symbol = raw_table.symbol;

    if (raw_table.dates.size() != raw_table.rows.size()) {
        throw DataUnavailableError(symbol + ": price table has " + std::to_string(raw_table.dates.size()) +
                                   " dates but " + std::to_string(raw_table.rows.size()) + " rows");
    }

    int open_column = resolve_column_index(raw_table.column_names, OPEN_ALIASES);
    int high_column = resolve_column_index(raw_table.column_names, HIGH_ALIASES);
    int low_column = resolve_column_index(raw_table.column_names, LOW_ALIASES);
    int close_column = resolve_column_index(raw_table.column_names, CLOSE_ALIASES);
    int volume_column = resolve_column_index(raw_table.column_names, VOLUME_ALIASES);
    int adjusted_close_column = resolve_column_index(raw_table.column_names, ADJUSTED_CLOSE_ALIASES);

    if (open_column < 0 || high_column < 0 || low_column < 0 || close_column < 0) {
        throw DataUnavailableError(symbol + ": price table is missing one of the open/high/low/close columns");
    }

    const int required_columns = std::max({open_column, high_column, low_column, close_column, volume_column, adjusted_close_column}) + 1;

    std::vector<PriceBar> cleaned_bars;
    cleaned_bars.reserve(raw_table.rows.size());
    bool any_volume_value = false;
    bool any_adjusted_close_value = false;

    for (size_t row_index = 0; row_index < raw_table.rows.size(); ++row_index) {
        const std::vector<double>& row_values = raw_table.rows[row_index];
        if (static_cast<int>(row_values.size()) < required_columns) continue;

        // Provider timestamps like 2024-01-02T00:00:00 keep only the date part.
        std::string bar_date = raw_table.dates[row_index].substr(0, 10);
        if (!is_iso_date(bar_date)) continue;

        PriceBar price_bar;
        price_bar.date = bar_date;
        price_bar.open_price = row_values[open_column];
        price_bar.high_price = row_values[high_column];
        price_bar.low_price = row_values[low_column];
        price_bar.close_price = row_values[close_column];
        if (!is_valid_price(price_bar.open_price) || !is_valid_price(price_bar.high_price) ||
            !is_valid_price(price_bar.low_price) || !is_valid_price(price_bar.close_price)) {
            continue;
        }

        price_bar.volume = 0.0;
        if (volume_column >= 0 && std::isfinite(row_values[volume_column]) && row_values[volume_column] >= 0.0) {
            price_bar.volume = row_values[volume_column];
            any_volume_value = true;
        }

        // NaN marks a missing adjustment until the fill pass below.
        price_bar.adjusted_close = std::numeric_limits<double>::quiet_NaN();
        if (adjusted_close_column >= 0 && is_valid_price(row_values[adjusted_close_column])) {
            price_bar.adjusted_close = row_values[adjusted_close_column];
            any_adjusted_close_value = true;
        }

        cleaned_bars.push_back(price_bar);
    }

    std::stable_sort(cleaned_bars.begin(), cleaned_bars.end(), [](const PriceBar& left_bar, const PriceBar& right_bar) {
        return left_bar.date < right_bar.date;
    });

    // Duplicate dates keep the row that appeared last in the input.
    PriceSeries price_series;
    price_series.symbol = symbol;
    price_series.has_volume = any_volume_value;
    price_series.has_adjusted_close = any_adjusted_close_value;
    price_series.bars.reserve(cleaned_bars.size());
    for (const PriceBar& price_bar : cleaned_bars) {
        if (!price_series.bars.empty() && price_series.bars.back().date == price_bar.date) {
            price_series.bars.back() = price_bar;
        } else {
            price_series.bars.push_back(price_bar);
        }
    }

    fill_missing_adjusted_closes(price_series.bars);

    const int minimum_bars = config.indicators.minimum_history_bars;
    if (static_cast<int>(price_series.bars.size()) < minimum_bars) {
        throw DataUnavailableError(symbol + ": only " + std::to_string(price_series.bars.size()) +
                                   " usable bars after cleaning, need " + std::to_string(minimum_bars));
    }

    return price_series;
}

} // namespace Core
} // namespace CanslimScanner
