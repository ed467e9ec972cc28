#include "http_market_data_provider.hpp"
#include "quote_normalizer.hpp"
#include "logging/logs/market_data_logs.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;
using TruthTracker::Logging::MarketDataLogs;

namespace TruthTracker {
namespace API {

HttpMarketDataProvider::HttpMarketDataProvider(const Config::MarketDataConfig& market_data_config,
                                               ConnectivityManager& connectivity_manager)
    : HttpMarketDataProvider(market_data_config,
        [market_data_config, &connectivity_manager](const std::string& url) {
            HttpRequest quotes_request(url, market_data_config.retry_count, market_data_config.timeout_seconds,
                                       market_data_config.enable_ssl_verification, market_data_config.rate_limit_delay_ms);
            return http_get(quotes_request, connectivity_manager);
        }) {}

HttpMarketDataProvider::HttpMarketDataProvider(const Config::MarketDataConfig& market_data_config, HttpFetchFunction fetch_function)
    : config(market_data_config),
      http_fetch(std::move(fetch_function)),
      cached_snapshot(std::make_shared<const Core::QuoteSnapshot>()),
      last_successful_poll_at(-1.0) {
    if (config.quotes_url.empty()) {
        throw std::runtime_error("Market data quotes URL is not configured");
    }
    if (!http_fetch) {
        throw std::runtime_error("Market data provider requires an HTTP fetch function");
    }
}

std::string HttpMarketDataProvider::get_provider_name() const {
    return "http:" + config.quotes_url;
}

double HttpMarketDataProvider::get_snapshot_age_seconds() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    if (last_successful_poll_at < 0.0) {
        return -1.0;
    }
    return TimeUtils::get_current_epoch_seconds() - last_successful_poll_at;
}

QuoteSnapshotPtr HttpMarketDataProvider::get_cached_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    return cached_snapshot;
}

void HttpMarketDataProvider::publish_snapshot(Core::QuoteSnapshot&& quotes, double received_at) {
    QuoteSnapshotPtr fresh_snapshot = std::make_shared<const Core::QuoteSnapshot>(std::move(quotes));
    std::lock_guard<std::mutex> lock(snapshot_mutex);
    cached_snapshot = fresh_snapshot;
    last_successful_poll_at = received_at;
}

bool HttpMarketDataProvider::try_primary_endpoint(bool& transport_failed) {
    std::string response_body;
    try {
        response_body = http_fetch(config.quotes_url);
    } catch (const std::runtime_error& fetch_exception_error) {
        transport_failed = true;
        MarketDataLogs::log_quote_fetch_failure(config.quotes_url, fetch_exception_error.what());
        return false;
    }

    json response = json::parse(response_body, nullptr, false);
    if (response.is_discarded()) {
        MarketDataLogs::log_unrecognized_quote_shape(config.quotes_url, "body is not valid JSON");
        return false;
    }

    double received_at = TimeUtils::get_current_epoch_seconds();
    NormalizedQuotes normalized = normalize_quote_response(response, received_at);
    if (normalized.shape == QuoteResponseShape::UNRECOGNIZED) {
        MarketDataLogs::log_unrecognized_quote_shape(config.quotes_url, "no known quote layout");
        return false;
    }
    if (normalized.skipped_entry_count > 0) {
        MarketDataLogs::log_skipped_quote_entries(config.quotes_url, normalized.skipped_entry_count);
    }
    publish_snapshot(std::move(normalized.quotes), received_at);
    return true;
}

bool HttpMarketDataProvider::try_fallback_endpoint(const std::string& fallback_url) {
    std::string response_body;
    try {
        response_body = http_fetch(fallback_url);
    } catch (const std::runtime_error& fetch_exception_error) {
        MarketDataLogs::log_quote_fetch_failure(fallback_url, fetch_exception_error.what());
        return false;
    }

    json response = json::parse(response_body, nullptr, false);
    if (response.is_discarded() || !response.is_object() || !response.contains("data") || !response["data"].is_array()) {
        MarketDataLogs::log_unrecognized_quote_shape(fallback_url, "fallback endpoints must answer with a data array");
        return false;
    }

    double received_at = TimeUtils::get_current_epoch_seconds();
    NormalizedQuotes normalized = normalize_quote_response(response, received_at);
    size_t fallback_quote_count = normalized.quotes.size();
    publish_snapshot(std::move(normalized.quotes), received_at);
    MarketDataLogs::log_fallback_endpoint_used(fallback_url, fallback_quote_count);
    return true;
}

QuoteSnapshotPtr HttpMarketDataProvider::fetch_all_quotes() {
    bool transport_failed = false;
    if (try_primary_endpoint(transport_failed)) {
        return get_cached_snapshot();
    }

    if (transport_failed) {
        for (const std::string& fallback_url : config.fallback_urls) {
            if (try_fallback_endpoint(fallback_url)) {
                return get_cached_snapshot();
            }
        }
    }

    MarketDataLogs::log_serving_cached_snapshot(get_snapshot_age_seconds());
    return get_cached_snapshot();
}

} // namespace API
} // namespace TruthTracker
