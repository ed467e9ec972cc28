/**
 * Logging thread.
 * Drains the async logger queue to the console and the run log file.
 */
#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace TruthTracker::Threads;
using namespace TruthTracker::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    try {
        set_log_thread_tag("LOGGER");

        execute_logging_processing_loop();

        LoggingThreadLogs::log_thread_exited();
    } catch (const std::exception& exception_error) {
        LoggingThreadLogs::log_thread_exception(exception_error.what());
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        LoggingThreadLogs::log_log_file_open_failure(logger_ptr->get_file_path());
    }
    logger_ptr->running.store(true);

    std::vector<std::string> message_buffer;
    const std::chrono::seconds flush_interval(timing.logging_poll_interval_sec);

    while (logger_ptr->running.load()) {
        try {
            logger_ptr->collect_all_available_messages(message_buffer);

            if (!message_buffer.empty()) {
                logger_ptr->flush_message_buffer(message_buffer, log_file);
                logger_iterations->fetch_add(1);
            }

            std::unique_lock<std::mutex> logger_lock(logger_ptr->mtx);
            logger_ptr->cv.wait_for(logger_lock, flush_interval, [this] { return !logger_ptr->running.load(); });
        } catch (const std::exception& exception_error) {
            LoggingThreadLogs::log_loop_iteration_exception(exception_error.what());
            std::this_thread::sleep_for(flush_interval);
        }
    }

    // Final flush of any remaining messages
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
