#ifndef FUNDAMENTALS_PROVIDER_INTERFACE_HPP
#define FUNDAMENTALS_PROVIDER_INTERFACE_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <memory>
#include <string>

namespace CanslimScanner {
namespace API {

// Fundamentals source. Fields the source lacks stay empty; a failed request throws Core::DataUnavailableError.
class FundamentalsProviderInterface {
public:
    virtual ~FundamentalsProviderInterface() = default;

    virtual Core::Fundamentals get_fundamentals(const std::string& symbol) const = 0;
    virtual std::string get_provider_name() const = 0;
};

using FundamentalsProviderPtr = std::unique_ptr<FundamentalsProviderInterface>;

// Technical-only scans: every field absent, so C, A, I fall back and N, S degrade.
class EmptyFundamentalsProvider : public FundamentalsProviderInterface {
public:
    Core::Fundamentals get_fundamentals(const std::string&) const override { return Core::Fundamentals(); }
    std::string get_provider_name() const override { return "none"; }
};

} // namespace API
} // namespace CanslimScanner

#endif // FUNDAMENTALS_PROVIDER_INTERFACE_HPP
