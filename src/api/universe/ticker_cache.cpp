#include "ticker_cache.hpp"
#include "logging/logs/system_logs.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace CanslimScanner {
namespace API {

namespace {
    // Missing file reads as an empty document. Throws json::exception on malformed content.
    json read_cache_document(const std::string& file_path) {
        std::ifstream cache_file(file_path);
        if (!cache_file.is_open()) {
            return json::object();
        }
        json cache_document = json::parse(cache_file);
        return cache_document.is_object() ? cache_document : json::object();
    }
}

bool is_cache_fresh(long long fetched_at_epoch, long long now_epoch, int ttl_hours) {
    if (ttl_hours <= 0 || fetched_at_epoch <= 0) return false;
    return now_epoch - fetched_at_epoch < static_cast<long long>(ttl_hours) * TimeUtils::SECONDS_PER_HOUR;
}

JsonFileTickerCache::JsonFileTickerCache(const std::string& cache_file_path) : file_path(cache_file_path) {}

std::optional<CachedTickerList> JsonFileTickerCache::load(const std::string& universe_key) const {
    try {
        json cache_document = read_cache_document(file_path);
        if (!cache_document.contains(universe_key)) {
            return std::nullopt;
        }
        const json& entry_json = cache_document[universe_key];
        CachedTickerList cached_entry(entry_json.at("tickers").get<std::vector<std::string>>(),
                                      entry_json.at("fetched_at").get<long long>());
        return cached_entry;
    } catch (const json::exception& json_error) {
        CanslimScanner::Logging::SystemLogs::log_system_warning("Ignoring unreadable ticker cache " + file_path + ": " + json_error.what());
        return std::nullopt;
    }
}

void JsonFileTickerCache::store(const std::string& universe_key, const CachedTickerList& entry) {
    json cache_document;
    try {
        cache_document = read_cache_document(file_path);
    } catch (const json::exception&) {
        // A corrupt cache is replaced wholesale.
        cache_document = json::object();
    }
    cache_document[universe_key] = {{"fetched_at", entry.fetched_at_epoch}, {"tickers", entry.tickers}};

    std::filesystem::path cache_path(file_path);
    if (cache_path.has_parent_path()) {
        std::error_code directory_error;
        std::filesystem::create_directories(cache_path.parent_path(), directory_error);
        if (directory_error) {
            throw std::runtime_error("Cannot create ticker cache directory " + cache_path.parent_path().string() + ": " + directory_error.message());
        }
    }

    std::ofstream cache_file(file_path, std::ios::trunc);
    if (!cache_file.is_open()) {
        throw std::runtime_error("Cannot write ticker cache " + file_path);
    }
    cache_file << cache_document.dump(2) << std::endl;
}

} // namespace API
} // namespace CanslimScanner
