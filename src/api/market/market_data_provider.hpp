#ifndef MARKET_DATA_PROVIDER_HPP
#define MARKET_DATA_PROVIDER_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <memory>
#include <string>

namespace TruthTracker {
namespace API {

using QuoteSnapshotPtr = std::shared_ptr<const Core::QuoteSnapshot>;

class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    // Current quotes for every symbol the feed knows. On any failure the last
    // good snapshot is returned; never null.
    virtual QuoteSnapshotPtr fetch_all_quotes() = 0;

    // Seconds since the last successful poll, negative before the first one.
    virtual double get_snapshot_age_seconds() const = 0;

    virtual std::string get_provider_name() const = 0;
};

using MarketDataProviderPtr = std::unique_ptr<MarketDataProvider>;

} // namespace API
} // namespace TruthTracker

#endif // MARKET_DATA_PROVIDER_HPP
