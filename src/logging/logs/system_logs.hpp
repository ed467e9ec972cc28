#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include "tracker/registry/tracker_registry.hpp"
#include <string>

namespace TruthTracker {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_shutdown_requested(const std::string& reason);
    static void log_shutdown_complete(int exit_code);

    // Thread management
    static void log_thread_startup_error(const std::string& error_message);
    static void log_threads_started(int expected_count, int actual_count);

    // Main loop
    static void log_main_loop_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
    static void log_startup_complete();

    // Alerts
    static void log_persistence_failure_alert(const std::string& error_message, const std::string& record_line);

    // Periodic status
    static void log_status_report(const Core::RegistryStatistics& statistics, double market_data_age_seconds,
                                  const std::string& connectivity_status);
};

} // namespace Logging
} // namespace TruthTracker

#endif // SYSTEM_LOGS_HPP
