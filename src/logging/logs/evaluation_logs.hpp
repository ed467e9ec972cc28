#ifndef EVALUATION_LOGS_HPP
#define EVALUATION_LOGS_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <string>

namespace TruthTracker {
namespace Logging {

class EvaluationLogs {
public:
    // Thread lifecycle logging
    static void log_thread_startup(int poll_interval_seconds);
    static void log_thread_exception(const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& error_message);

    // Tick processing
    static void log_auto_close_setting_error(const std::string& reason, int fallback_seconds);
    static void log_auto_close_setting_changed(int previous_seconds, int current_seconds);
    static void log_tracker_evaluation_error(const std::string& signal_id, const std::string& error_message);
    static void log_signal_resolved(const Core::TrackingResult& tracking_result);
    static void log_resolution_conflict(const std::string& signal_id);
};

} // namespace Logging
} // namespace TruthTracker

#endif // EVALUATION_LOGS_HPP
