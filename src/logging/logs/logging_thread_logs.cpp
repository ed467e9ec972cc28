#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iostream>

namespace TruthTracker {
namespace Logging {

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    log_message("LoggingThread exception: " + error_message, "");
}

void LoggingThreadLogs::log_thread_exited() {
    log_message("LoggingThread exited", "");
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    log_message("LoggingThread loop iteration exception: " + error_message, "");
}

// The async queue is what failed, so this goes straight to stderr
void LoggingThreadLogs::log_log_file_open_failure(const std::string& log_file_path) {
    std::cerr << "ERROR: LoggingThread could not open run log " << log_file_path << ", console output only" << std::endl;
}

} // namespace Logging
} // namespace TruthTracker
