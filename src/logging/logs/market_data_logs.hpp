#ifndef MARKET_DATA_LOGS_HPP
#define MARKET_DATA_LOGS_HPP

#include <cstddef>
#include <string>

namespace TruthTracker {
namespace Logging {

class MarketDataLogs {
public:
    static void log_quote_fetch_failure(const std::string& url, const std::string& error_message);
    static void log_unrecognized_quote_shape(const std::string& url, const std::string& detail);
    static void log_skipped_quote_entries(const std::string& url, size_t skipped_entry_count);
    static void log_fallback_endpoint_used(const std::string& url, size_t quote_count);
    static void log_serving_cached_snapshot(double snapshot_age_seconds);
};

} // namespace Logging
} // namespace TruthTracker

#endif // MARKET_DATA_LOGS_HPP
