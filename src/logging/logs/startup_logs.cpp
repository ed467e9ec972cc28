#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logging_macros.hpp"

namespace TruthTracker {
namespace Logging {

namespace {
    std::string join_tags(const std::vector<std::string>& tags) {
        std::string joined_tags;
        for (const std::string& tag : tags) {
            if (!joined_tags.empty()) joined_tags += ", ";
            joined_tags += tag;
        }
        return joined_tags.empty() ? "(none)" : joined_tags;
    }
}

void StartupLogs::log_application_header() {
    log_message("", "");
    log_message("================================================================================", "");
    log_message("                     TRUTH TRACKER - SIGNAL OUTCOME ENGINE", "");
    log_message("                     build " + get_git_commit_hash(), "");
    log_message("================================================================================", "");
    log_message("", "");
}

void StartupLogs::log_configuration_summary(const Config::SystemConfig& config, const std::string& config_path) {
    LOG_STARTUP_SECTION_HEADER("CONFIGURATION");
    LOG_STARTUP_CONTENT("Source: " + config_path);
    LOG_STARTUP_CONTENT("Quotes URL: " + config.market_data.quotes_url);
    LOG_STARTUP_CONTENT("Fallback endpoints: " + std::to_string(config.market_data.fallback_urls.size()));
    LOG_STARTUP_CONTENT("Signals directory: " + config.tracking.signals_directory);
    LOG_STARTUP_CONTENT("Ingestion interval: " + std::to_string(config.timing.ingestion_poll_interval_sec) + "s");
    LOG_STARTUP_CONTENT("Evaluation interval: " + std::to_string(config.timing.evaluation_poll_interval_sec) + "s");
    LOG_STARTUP_CONTENT("Default auto close: " + std::to_string(config.tracking.default_auto_close_seconds) + "s (state file " +
                        config.tracking.runtime_state_path + ")");
    LOG_STARTUP_CONTENT("Tracking ceiling: " + std::to_string(config.tracking.max_tracking_seconds) + "s");
    LOG_STARTUP_SEPARATOR();
    LOG_STARTUP_CONTENT("Forex tags: " + join_tags(config.authorization.forex_tags));
    LOG_STARTUP_CONTENT("Crypto tags: " + join_tags(config.authorization.crypto_tags));
    LOG_STARTUP_SEPARATOR();
    LOG_STARTUP_CONTENT("Forex truth log: " + config.logging.forex_truth_log_path);
    LOG_STARTUP_CONTENT("Crypto truth log: " + config.logging.crypto_truth_log_path);
    log_message("+-- ", "");
}

void StartupLogs::log_signal_source(const std::string& source_description, bool directory_exists) {
    if (directory_exists) {
        log_message("SIGNAL_SOURCE: watching " + source_description, "");
    } else {
        log_message("SIGNAL_SOURCE: WARNING - " + source_description + " does not exist yet, will keep polling", "");
    }
}

void StartupLogs::log_rehydration_result(size_t seeded_id_count, size_t malformed_line_count) {
    std::string rehydration_message = "DEDUP_REHYDRATION: " + std::to_string(seeded_id_count) +
                                      " previously resolved signal ids loaded from truth logs";
    if (malformed_line_count > 0) {
        rehydration_message += " (" + std::to_string(malformed_line_count) + " malformed lines skipped)";
    }
    log_message(rehydration_message, "");
}

void StartupLogs::log_rehydration_disabled() {
    log_message("DEDUP_REHYDRATION: disabled, processed ids start empty", "");
}

} // namespace Logging
} // namespace TruthTracker
