#ifndef UNIVERSE_CONFIG_HPP
#define UNIVERSE_CONFIG_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace CanslimScanner {
namespace Config {

enum class UniverseSource {
    SP500,
    NASDAQ100,
    RUSSELL2000,
    ALL,
    LIST,
    FILE
};

struct UniverseSelection {
    UniverseSource source;
    std::string argument;                  // Comma separated symbols for LIST, path for FILE

    static UniverseSelection parse(const std::string& selector_string) {
        if (selector_string == "sp500" || selector_string == "SP500") {
            return UniverseSelection{UniverseSource::SP500, ""};
        } else if (selector_string == "nasdaq100" || selector_string == "NASDAQ100") {
            return UniverseSelection{UniverseSource::NASDAQ100, ""};
        } else if (selector_string == "russell2000" || selector_string == "RUSSELL2000") {
            return UniverseSelection{UniverseSource::RUSSELL2000, ""};
        } else if (selector_string == "all" || selector_string == "ALL") {
            return UniverseSelection{UniverseSource::ALL, ""};
        } else if (selector_string.rfind("list:", 0) == 0 && selector_string.size() > 5) {
            return UniverseSelection{UniverseSource::LIST, selector_string.substr(5)};
        } else if (selector_string.rfind("file:", 0) == 0 && selector_string.size() > 5) {
            return UniverseSelection{UniverseSource::FILE, selector_string.substr(5)};
        } else {
            throw std::runtime_error("Invalid universe selector: " + selector_string +
                                     ". Must be sp500, nasdaq100, russell2000, all, list:A,B or file:<path>");
        }
    }

    static std::string source_to_string(UniverseSource source) {
        switch (source) {
            case UniverseSource::SP500:
                return "sp500";
            case UniverseSource::NASDAQ100:
                return "nasdaq100";
            case UniverseSource::RUSSELL2000:
                return "russell2000";
            case UniverseSource::ALL:
                return "all";
            case UniverseSource::LIST:
                return "list";
            case UniverseSource::FILE:
                return "file";
            default:
                throw std::runtime_error("Unknown universe source");
        }
    }

    bool is_index() const {
        return source == UniverseSource::SP500 || source == UniverseSource::NASDAQ100 ||
               source == UniverseSource::RUSSELL2000;
    }
};

} // namespace Config
} // namespace CanslimScanner

#endif // UNIVERSE_CONFIG_HPP
