#ifndef HTTP_MARKET_DATA_PROVIDER_HPP
#define HTTP_MARKET_DATA_PROVIDER_HPP

#include "market_data_provider.hpp"
#include "configs/market_data_config.hpp"
#include "utils/connectivity_manager.hpp"
#include <functional>
#include <mutex>
#include <string>

namespace TruthTracker {
namespace API {

// Performs a GET and returns the body; throws std::runtime_error on transport failure.
using HttpFetchFunction = std::function<std::string(const std::string& url)>;

/**
 * Polls the "all quotes" endpoint and keeps the last good snapshot.
 *
 * A transport failure on the primary endpoint walks the fallback endpoints in
 * order (data-wrapper shape only). A response in an unknown shape, or no
 * endpoint answering, serves the cached snapshot unchanged.
 */
class HttpMarketDataProvider : public MarketDataProvider {
public:
    HttpMarketDataProvider(const Config::MarketDataConfig& market_data_config, ConnectivityManager& connectivity_manager);
    HttpMarketDataProvider(const Config::MarketDataConfig& market_data_config, HttpFetchFunction fetch_function);

    QuoteSnapshotPtr fetch_all_quotes() override;
    double get_snapshot_age_seconds() const override;
    std::string get_provider_name() const override;

private:
    bool try_primary_endpoint(bool& transport_failed);
    bool try_fallback_endpoint(const std::string& fallback_url);
    void publish_snapshot(Core::QuoteSnapshot&& quotes, double received_at);
    QuoteSnapshotPtr get_cached_snapshot() const;

    Config::MarketDataConfig config;
    HttpFetchFunction http_fetch;

    mutable std::mutex snapshot_mutex;
    QuoteSnapshotPtr cached_snapshot;
    double last_successful_poll_at;
};

} // namespace API
} // namespace TruthTracker

#endif // HTTP_MARKET_DATA_PROVIDER_HPP
