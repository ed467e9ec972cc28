#include "config_loader.hpp"
#include "system_config.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace TruthTracker {
namespace Config {

namespace {
    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }
}

std::vector<std::string> split_config_list(const std::string& value) {
    std::vector<std::string> entries;
    std::stringstream ss(value);
    std::string entry;
    while (std::getline(ss, entry, ';')) {
        entry = trim(entry);
        if (!entry.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream in(csv_path);
    if (!in.is_open()) return false;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty() || line[0] == '#') continue;
        std::stringstream ss(line);
        std::string key, value;
        if (!std::getline(ss, key, ',')) continue;
        if (!std::getline(ss, value)) continue;
        key = trim(key); value = trim(value);

        try {
            // Market data
            if (key == "market_data.quotes_url") cfg.market_data.quotes_url = value;
            else if (key == "market_data.fallback_urls") cfg.market_data.fallback_urls = split_config_list(value);
            else if (key == "market_data.retry_count") cfg.market_data.retry_count = std::stoi(value);
            else if (key == "market_data.timeout_seconds") cfg.market_data.timeout_seconds = std::stoi(value);
            else if (key == "market_data.enable_ssl_verification") cfg.market_data.enable_ssl_verification = to_bool(value);
            else if (key == "market_data.rate_limit_delay_ms") cfg.market_data.rate_limit_delay_ms = std::stoi(value);

            // Timing
            else if (key == "timing.ingestion_poll_interval_sec") cfg.timing.ingestion_poll_interval_sec = std::stoi(value);
            else if (key == "timing.evaluation_poll_interval_sec") cfg.timing.evaluation_poll_interval_sec = std::stoi(value);
            else if (key == "timing.logging_poll_interval_sec") cfg.timing.logging_poll_interval_sec = std::stoi(value);
            else if (key == "timing.status_report_interval_sec") cfg.timing.status_report_interval_sec = std::stoi(value);
            else if (key == "timing.thread_startup_sequence_delay_milliseconds") cfg.timing.thread_startup_sequence_delay_milliseconds = std::stoi(value);
            else if (key == "timing.connectivity_max_retry_delay_seconds") cfg.timing.connectivity_max_retry_delay_seconds = std::stoi(value);
            else if (key == "timing.connectivity_degraded_threshold") cfg.timing.connectivity_degraded_threshold = std::stoi(value);
            else if (key == "timing.connectivity_disconnected_threshold") cfg.timing.connectivity_disconnected_threshold = std::stoi(value);
            else if (key == "timing.connectivity_backoff_multiplier") cfg.timing.connectivity_backoff_multiplier = std::stod(value);

            // Tracking
            else if (key == "tracking.signals_directory") cfg.tracking.signals_directory = value;
            else if (key == "tracking.signal_file_patterns") cfg.tracking.signal_file_patterns = split_config_list(value);
            else if (key == "tracking.default_auto_close_seconds") cfg.tracking.default_auto_close_seconds = std::stoi(value);
            else if (key == "tracking.max_tracking_seconds") cfg.tracking.max_tracking_seconds = std::stoi(value);
            else if (key == "tracking.runtime_state_path") cfg.tracking.runtime_state_path = value;
            else if (key == "tracking.rehydrate_processed_ids") cfg.tracking.rehydrate_processed_ids = to_bool(value);

            // Authorization
            else if (key == "authorization.forex_tags") cfg.authorization.forex_tags = split_config_list(value);
            else if (key == "authorization.crypto_tags") cfg.authorization.crypto_tags = split_config_list(value);

            // Logging
            else if (key == "logging.log_file") cfg.logging.log_file = value;
            else if (key == "logging.runtime_logs_directory") cfg.logging.runtime_logs_directory = value;
            else if (key == "logging.forex_truth_log_path") cfg.logging.forex_truth_log_path = value;
            else if (key == "logging.crypto_truth_log_path") cfg.logging.crypto_truth_log_path = value;
        } catch (const std::exception& conversion_exception_error) {
            fprintf(stderr, "Invalid value for %s on line %d of %s: %s\n",
                    key.c_str(), line_number, csv_path.c_str(), conversion_exception_error.what());
            return false;
        }
    }
    return true;
}

std::string resolve_runtime_config_path() {
    const char* override_path = std::getenv(RUNTIME_CONFIG_ENV_VARIABLE);
    if (override_path && override_path[0] != '\0') {
        return override_path;
    }
    return DEFAULT_RUNTIME_CONFIG_PATH;
}

int load_system_config(SystemConfig& config) {
    std::string system_config_path = resolve_runtime_config_path();

    if (!load_config_from_csv(config, system_config_path)) {
        fprintf(stderr, "Failed to load config CSV from %s\n", system_config_path.c_str());
        return 1;
    }
    return 0;
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    if (config.market_data.quotes_url.empty()) {
        errorMessage = "market_data.quotes_url is missing (provide via runtime config)";
        return false;
    }
    if (config.market_data.retry_count < 1 || config.market_data.timeout_seconds < 1) {
        errorMessage = "market_data.retry_count and market_data.timeout_seconds must be >= 1";
        return false;
    }
    if (config.timing.ingestion_poll_interval_sec <= 0 || config.timing.evaluation_poll_interval_sec <= 0 ||
        config.timing.logging_poll_interval_sec <= 0 || config.timing.status_report_interval_sec <= 0) {
        errorMessage = "timing.* intervals must be > 0";
        return false;
    }
    if (config.tracking.signals_directory.empty()) {
        errorMessage = "tracking.signals_directory is empty";
        return false;
    }
    if (config.tracking.signal_file_patterns.empty()) {
        errorMessage = "tracking.signal_file_patterns must list at least one pattern";
        return false;
    }
    if (config.tracking.default_auto_close_seconds <= 0) {
        errorMessage = "tracking.default_auto_close_seconds must be > 0";
        return false;
    }
    if (config.tracking.max_tracking_seconds <= 0) {
        errorMessage = "tracking.max_tracking_seconds must be > 0";
        return false;
    }
    if (config.authorization.forex_tags.empty() && config.authorization.crypto_tags.empty()) {
        errorMessage = "authorization.* must list at least one trusted tag";
        return false;
    }
    for (const std::string& forex_tag : config.authorization.forex_tags) {
        if (std::find(config.authorization.crypto_tags.begin(), config.authorization.crypto_tags.end(), forex_tag) !=
            config.authorization.crypto_tags.end()) {
            errorMessage = "authorization tag '" + forex_tag + "' is bound to both forex and crypto";
            return false;
        }
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "logging.log_file is empty";
        return false;
    }
    if (config.logging.forex_truth_log_path.empty() || config.logging.crypto_truth_log_path.empty()) {
        errorMessage = "logging.*_truth_log_path must both be set";
        return false;
    }
    if (config.logging.forex_truth_log_path == config.logging.crypto_truth_log_path) {
        errorMessage = "forex and crypto truth logs must be separate files";
        return false;
    }
    return true;
}

} // namespace Config
} // namespace TruthTracker
