#include "index_ticker_fetcher.hpp"
#include "scanner/errors/scan_errors.hpp"
#include "logging/logs/system_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace CanslimScanner {
namespace API {

using CanslimScanner::Logging::SystemLogs;

namespace {
    const std::vector<std::string> INDEX_KEYS = {"sp500", "nasdaq100", "russell2000"};
    const std::vector<std::string> TICKER_COLUMN_CANDIDATES = {"ticker", "symbol", "constituent symbol", "holding ticker"};

    std::string to_lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string trim_cell(const std::string& cell) {
        size_t first = cell.find_first_not_of(" \t\r\"\xEF\xBB\xBF");
        if (first == std::string::npos) return "";
        size_t last = cell.find_last_not_of(" \t\r\"");
        return cell.substr(first, last - first + 1);
    }

    std::vector<std::string> split_csv_row(const std::string& line) {
        std::vector<std::string> cells;
        std::string current_cell;
        bool in_quotes = false;
        for (char character : line) {
            if (character == '"') {
                in_quotes = !in_quotes;
            } else if (character == ',' && !in_quotes) {
                cells.push_back(trim_cell(current_cell));
                current_cell.clear();
            } else {
                current_cell += character;
            }
        }
        cells.push_back(trim_cell(current_cell));
        return cells;
    }

    int find_ticker_column(const std::vector<std::string>& header_cells) {
        for (const std::string& candidate : TICKER_COLUMN_CANDIDATES) {
            for (size_t column_index = 0; column_index < header_cells.size(); ++column_index) {
                if (to_lower(header_cells[column_index]) == candidate) return static_cast<int>(column_index);
            }
        }
        for (size_t column_index = 0; column_index < header_cells.size(); ++column_index) {
            std::string lowered = to_lower(header_cells[column_index]);
            if (lowered.find("ticker") != std::string::npos || lowered.find("symbol") != std::string::npos) {
                return static_cast<int>(column_index);
            }
        }
        return -1;
    }

    int find_column(const std::vector<std::string>& header_cells, const std::string& column_name) {
        for (size_t column_index = 0; column_index < header_cells.size(); ++column_index) {
            if (to_lower(header_cells[column_index]) == column_name) return static_cast<int>(column_index);
        }
        return -1;
    }

    // Letters with optional '-' share-class separators; rejects cash lines such as "-" or "USD 1.0".
    bool is_equity_symbol(const std::string& symbol) {
        if (symbol.empty() || symbol.size() > 10) return false;
        bool has_letter = false;
        for (char character : symbol) {
            if (std::isalpha(static_cast<unsigned char>(character))) {
                has_letter = true;
            } else if (character != '-') {
                return false;
            }
        }
        return has_letter && symbol.front() != '-' && symbol.back() != '-';
    }

    std::vector<std::string> sorted_unique(std::vector<std::string> symbols) {
        std::sort(symbols.begin(), symbols.end());
        symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());
        return symbols;
    }
}

IndexTickerFetcher::IndexTickerFetcher(const Config::DataSourceConfig& data_source_config, HttpClientPtr client, TickerCachePtr ticker_cache)
    : config(data_source_config), http_client(std::move(client)), cache(std::move(ticker_cache)) {
    if (!http_client) {
        throw std::runtime_error("IndexTickerFetcher requires an HTTP client");
    }
    if (!cache) {
        throw std::runtime_error("IndexTickerFetcher requires a ticker cache");
    }
}

std::string IndexTickerFetcher::normalize_symbol(const std::string& raw_symbol) {
    std::string symbol = trim_cell(raw_symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::replace(symbol.begin(), symbol.end(), '.', '-');
    std::replace(symbol.begin(), symbol.end(), '/', '-');
    return symbol;
}

std::vector<std::string> IndexTickerFetcher::parse_index_csv(const std::string& csv_content) {
    std::vector<std::string> lines;
    std::istringstream csv_stream(csv_content);
    std::string line;
    while (std::getline(csv_stream, line)) {
        lines.push_back(line);
    }

    // Holdings files start with fund metadata; the header is the first row naming a ticker column.
    size_t header_index = lines.size();
    int ticker_column = -1;
    for (size_t line_index = 0; line_index < lines.size(); ++line_index) {
        std::vector<std::string> cells = split_csv_row(lines[line_index]);
        if (cells.size() < 2) continue;
        ticker_column = find_ticker_column(cells);
        if (ticker_column >= 0) {
            header_index = line_index;
            break;
        }
    }
    if (ticker_column < 0) {
        throw Core::DataUnavailableError("Index holdings CSV has no ticker column");
    }

    std::vector<std::string> header_cells = split_csv_row(lines[header_index]);
    int asset_class_column = find_column(header_cells, "asset class");

    std::vector<std::string> tickers;
    for (size_t line_index = header_index + 1; line_index < lines.size(); ++line_index) {
        std::vector<std::string> cells = split_csv_row(lines[line_index]);
        if (static_cast<int>(cells.size()) <= ticker_column) continue;
        if (asset_class_column >= 0 && static_cast<int>(cells.size()) > asset_class_column &&
            to_lower(cells[asset_class_column]) != "equity") {
            continue;
        }
        std::string symbol = normalize_symbol(cells[ticker_column]);
        if (is_equity_symbol(symbol)) {
            tickers.push_back(symbol);
        }
    }
    return tickers;
}

std::vector<std::string> IndexTickerFetcher::parse_symbol_list(const std::string& symbol_list) {
    std::vector<std::string> symbols;
    std::istringstream list_stream(symbol_list);
    std::string line;
    while (std::getline(list_stream, line)) {
        std::string trimmed_line = trim_cell(line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') continue;
        std::replace(trimmed_line.begin(), trimmed_line.end(), ',', ' ');
        std::replace(trimmed_line.begin(), trimmed_line.end(), '\t', ' ');
        std::istringstream token_stream(trimmed_line);
        std::string token;
        while (token_stream >> token) {
            std::string symbol = normalize_symbol(token);
            if (!symbol.empty()) {
                symbols.push_back(symbol);
            }
        }
    }
    return symbols;
}

std::string IndexTickerFetcher::get_index_url(const std::string& index_key) const {
    if (index_key == "sp500") {
        return config.sp500_constituents_url;
    } else if (index_key == "nasdaq100") {
        return config.nasdaq100_constituents_url;
    } else if (index_key == "russell2000") {
        return config.russell2000_constituents_url;
    }
    throw std::runtime_error("Unknown index: " + index_key);
}

std::vector<std::string> IndexTickerFetcher::get_index_tickers(const std::string& index_key) {
    const long long now_epoch = TimeUtils::get_current_epoch_seconds();
    std::optional<CachedTickerList> cached_entry = cache->load(index_key);
    if (cached_entry && is_cache_fresh(cached_entry->fetched_at_epoch, now_epoch, config.universe_cache_ttl_hours)) {
        return cached_entry->tickers;
    }

    try {
        HttpRequest http_request(get_index_url(index_key), config.http_retries, config.http_timeout_seconds,
                                 config.http_retry_delay_ms, config.enable_ssl_verification);
        http_request.user_agent = config.user_agent;
        std::vector<std::string> tickers = sorted_unique(parse_index_csv(http_client->get(http_request)));
        if (tickers.empty()) {
            throw Core::DataUnavailableError("holdings download contained no tickers");
        }

        try {
            cache->store(index_key, CachedTickerList(tickers, now_epoch));
        } catch (const std::runtime_error& cache_error) {
            SystemLogs::log_system_warning("Ticker cache not updated for " + index_key + ": " + cache_error.what());
        }
        return tickers;
    } catch (const std::runtime_error& fetch_error) {
        if (cached_entry && !cached_entry->tickers.empty()) {
            SystemLogs::log_system_warning("Using stale " + index_key + " ticker cache: " + fetch_error.what());
            return cached_entry->tickers;
        }
        throw Core::DataUnavailableError(index_key + ": constituents unavailable: " + fetch_error.what());
    }
}

std::vector<std::string> IndexTickerFetcher::read_symbol_file(const std::string& file_path) const {
    std::ifstream symbol_file(file_path);
    if (!symbol_file.is_open()) {
        throw Core::DataUnavailableError("Cannot open symbol file: " + file_path);
    }
    std::stringstream file_buffer;
    file_buffer << symbol_file.rdbuf();
    return parse_symbol_list(file_buffer.str());
}

std::vector<std::string> IndexTickerFetcher::get_universe(const Config::UniverseSelection& selection) {
    std::vector<std::string> symbols;

    switch (selection.source) {
        case Config::UniverseSource::SP500:
            symbols = get_index_tickers("sp500");
            break;
        case Config::UniverseSource::NASDAQ100:
            symbols = get_index_tickers("nasdaq100");
            break;
        case Config::UniverseSource::RUSSELL2000:
            symbols = get_index_tickers("russell2000");
            break;
        case Config::UniverseSource::ALL: {
            std::string last_error;
            for (const std::string& index_key : INDEX_KEYS) {
                try {
                    std::vector<std::string> index_symbols = get_index_tickers(index_key);
                    symbols.insert(symbols.end(), index_symbols.begin(), index_symbols.end());
                } catch (const Core::DataUnavailableError& index_error) {
                    SystemLogs::log_system_warning(std::string("Skipping index: ") + index_error.what());
                    last_error = index_error.what();
                }
            }
            if (symbols.empty()) {
                throw Core::DataUnavailableError("No index constituents available: " + last_error);
            }
            break;
        }
        case Config::UniverseSource::LIST:
            symbols = parse_symbol_list(selection.argument);
            break;
        case Config::UniverseSource::FILE:
            symbols = read_symbol_file(selection.argument);
            break;
    }

    symbols = sorted_unique(std::move(symbols));
    if (symbols.empty()) {
        throw Core::DataUnavailableError("Universe " + Config::UniverseSelection::source_to_string(selection.source) + " resolved to no symbols");
    }
    return symbols;
}

} // namespace API
} // namespace CanslimScanner
