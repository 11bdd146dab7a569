#ifndef TICKER_UNIVERSE_INTERFACE_HPP
#define TICKER_UNIVERSE_INTERFACE_HPP

#include "configs/universe_config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CanslimScanner {
namespace API {

// Resolves a universe selection to a sorted list of unique symbols.
class TickerUniverseInterface {
public:
    virtual ~TickerUniverseInterface() = default;

    virtual std::vector<std::string> get_universe(const Config::UniverseSelection& selection) = 0;
};

using TickerUniversePtr = std::unique_ptr<TickerUniverseInterface>;

} // namespace API
} // namespace CanslimScanner

#endif // TICKER_UNIVERSE_INTERFACE_HPP
