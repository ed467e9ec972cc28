#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logging_macros.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace TruthTracker {
namespace Logging {

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_shutdown_requested(const std::string& reason) {
    log_message("SYSTEM_SHUTDOWN: Shutdown requested (" + reason + ")", "");
}

void SystemLogs::log_shutdown_complete(int exit_code) {
    log_message("SYSTEM_SHUTDOWN: All threads joined, exit code " + std::to_string(exit_code), "");
}

void SystemLogs::log_thread_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error starting threads: ") + error_message, "");
}

void SystemLogs::log_threads_started(int expected_count, int actual_count) {
    if (actual_count == expected_count) {
        log_message("THREAD_STARTUP: All " + std::to_string(expected_count) + " threads started successfully", "");
    } else {
        log_message("THREAD_STARTUP: WARNING - Only " + std::to_string(actual_count) +
                    " of " + std::to_string(expected_count) + " threads started", "");
    }
}

void SystemLogs::log_main_loop_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error in main loop: ") + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: System startup completed successfully", "");
}

void SystemLogs::log_persistence_failure_alert(const std::string& error_message, const std::string& record_line) {
    LOG_THREAD_SECTION_HEADER("CRITICAL: TRUTH LOG WRITE FAILED");
    LOG_THREAD_CONTENT("ERROR: " + error_message);
    LOG_THREAD_CONTENT("UNWRITTEN RECORD: " + record_line);
    LOG_THREAD_CONTENT("ACTION: stopping tracker, process will exit non-zero");
    LOG_THREAD_SECTION_FOOTER();

    // Operator alert must survive even if the async queue is never drained
    std::cerr << "CRITICAL: truth log write failed: " << error_message << "\n"
              << "CRITICAL: unwritten record: " << record_line << std::endl;
}

void SystemLogs::log_status_report(const Core::RegistryStatistics& statistics, double market_data_age_seconds,
                                   const std::string& connectivity_status) {
    std::string market_data_age_text = "NO DATA YET";
    if (market_data_age_seconds >= 0.0) {
        std::ostringstream age_stream;
        age_stream << std::fixed << std::setprecision(1) << market_data_age_seconds << "s";
        market_data_age_text = age_stream.str();
    }

    LOG_THREAD_STATUS_HEADER();
    TABLE_HEADER_48("Tracker", "Registry & Feed Status");
    TABLE_ROW_48("Active", std::to_string(statistics.active_count));
    TABLE_ROW_48("Processed Ids", std::to_string(statistics.processed_count));
    TABLE_ROW_48("Admitted", std::to_string(statistics.admitted_total));
    TABLE_ROW_48("Duplicates", std::to_string(statistics.duplicate_total));
    TABLE_ROW_48("Rejected", std::to_string(statistics.rejected_total));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Wins", std::to_string(statistics.win_total));
    TABLE_ROW_48("Losses", std::to_string(statistics.loss_total));
    TABLE_ROW_48("Timeouts", std::to_string(statistics.timeout_total));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Market Data Age", market_data_age_text);
    TABLE_ROW_48("Quote Feed", connectivity_status);
    TABLE_FOOTER_48();
}

} // namespace Logging
} // namespace TruthTracker
