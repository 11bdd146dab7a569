#ifndef PRICE_DATA_PROVIDER_INTERFACE_HPP
#define PRICE_DATA_PROVIDER_INTERFACE_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <memory>
#include <string>

namespace CanslimScanner {
namespace API {

// Daily price history source. Implementations throw Core::DataUnavailableError on failure.
class PriceDataProviderInterface {
public:
    virtual ~PriceDataProviderInterface() = default;

    virtual Core::RawPriceTable get_history(const std::string& symbol, int lookback_days) const = 0;
    virtual std::string get_provider_name() const = 0;
};

using PriceDataProviderPtr = std::unique_ptr<PriceDataProviderInterface>;

} // namespace API
} // namespace CanslimScanner

#endif // PRICE_DATA_PROVIDER_INTERFACE_HPP
