#include "thread_manager.hpp"
#include "logging/logs/system_logs.hpp"

namespace TruthTracker {
namespace Core {

int Manager::start_threads(const std::vector<ThreadSystem::ThreadDefinition>& thread_definitions,
                           TruthTracker::Logging::LoggingContext& logging_context) {
    int started_thread_count = 0;

    for (const auto& thread_definition : thread_definitions) {
        try {
            // Capture the definition by value; the logging context outlives every thread
            *thread_definition.thread_handle = std::thread([thread_definition, &logging_context]() {
                TruthTracker::Logging::set_logging_context(logging_context);
                thread_definition.thread_function();
            });
            ++started_thread_count;
        } catch (const std::exception& exception_error) {
            TruthTracker::Logging::SystemLogs::log_thread_startup_error(
                thread_definition.name + ": " + exception_error.what());
        }
    }

    return started_thread_count;
}

bool Manager::join_thread(const std::string& thread_name, std::thread& thread_handle) {
    try {
        if (thread_handle.joinable()) {
            thread_handle.join();
        }
        return true;
    } catch (const std::exception& exception_error) {
        TruthTracker::Logging::SystemLogs::log_system_shutdown_error(
            "Exception joining " + thread_name + " thread: " + exception_error.what());
        return false;
    }
}

} // namespace Core
} // namespace TruthTracker
