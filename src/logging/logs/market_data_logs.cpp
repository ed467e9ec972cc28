#include "market_data_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iomanip>
#include <sstream>

namespace TruthTracker {
namespace Logging {

void MarketDataLogs::log_quote_fetch_failure(const std::string& url, const std::string& error_message) {
    log_message("WARNING: Market data fetch failed (" + url + "): " + error_message, "");
}

void MarketDataLogs::log_unrecognized_quote_shape(const std::string& url, const std::string& detail) {
    log_message("WARNING: Unrecognized market data response from " + url + ": " + detail, "");
}

void MarketDataLogs::log_skipped_quote_entries(const std::string& url, size_t skipped_entry_count) {
    log_message("Market data from " + url + ": skipped " + std::to_string(skipped_entry_count) +
                " entries without a symbol or positive bid/ask", "");
}

void MarketDataLogs::log_fallback_endpoint_used(const std::string& url, size_t quote_count) {
    log_message("Market data served by fallback " + url + " (" + std::to_string(quote_count) + " symbols)", "");
}

void MarketDataLogs::log_serving_cached_snapshot(double snapshot_age_seconds) {
    if (snapshot_age_seconds < 0.0) {
        log_message("WARNING: No market data received yet, trackers skip this tick", "");
        return;
    }
    std::ostringstream age_stream;
    age_stream << std::fixed << std::setprecision(1) << snapshot_age_seconds;
    log_message("WARNING: Serving cached market data snapshot (" + age_stream.str() + "s old)", "");
}

} // namespace Logging
} // namespace TruthTracker
