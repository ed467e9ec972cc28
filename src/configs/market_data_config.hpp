#ifndef MARKET_DATA_CONFIG_HPP
#define MARKET_DATA_CONFIG_HPP

#include <string>
#include <vector>

namespace TruthTracker {
namespace Config {

struct MarketDataConfig {
    std::string quotes_url;                  // "All current quotes" endpoint
    std::vector<std::string> fallback_urls;  // Tried in order when the primary request fails
    int retry_count;
    int timeout_seconds;
    bool enable_ssl_verification;
    int rate_limit_delay_ms;

    MarketDataConfig()
        : quotes_url("http://127.0.0.1:8001/market-data/all"),
          fallback_urls(),
          retry_count(1),
          timeout_seconds(5),
          enable_ssl_verification(true),
          rate_limit_delay_ms(100) {}
};

} // namespace Config
} // namespace TruthTracker

#endif // MARKET_DATA_CONFIG_HPP
