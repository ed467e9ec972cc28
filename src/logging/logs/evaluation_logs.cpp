#include "evaluation_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace TruthTracker {
namespace Logging {

namespace {
    std::string format_price(double price) {
        std::ostringstream price_stream;
        price_stream << std::setprecision(10) << price;
        return price_stream.str();
    }

    std::string format_delta(const Core::TrackingResult& tracking_result) {
        std::ostringstream delta_stream;
        if (tracking_result.tracker.unit_system == Core::UnitSystem::CRYPTO) {
            delta_stream << std::showpos << std::fixed << std::setprecision(2) << tracking_result.delta << " $";
        } else {
            delta_stream << std::showpos << std::fixed << std::setprecision(1) << tracking_result.delta << " pips";
        }
        return delta_stream.str();
    }
}

void EvaluationLogs::log_thread_startup(int poll_interval_seconds) {
    log_message("EvaluationThread started, evaluating every " + std::to_string(poll_interval_seconds) + "s", "");
}

void EvaluationLogs::log_thread_exception(const std::string& error_message) {
    log_message("EvaluationThread exception: " + error_message, "");
}

void EvaluationLogs::log_loop_iteration_exception(const std::string& error_message) {
    log_message("EvaluationThread loop iteration exception: " + error_message, "");
}

void EvaluationLogs::log_auto_close_setting_error(const std::string& reason, int fallback_seconds) {
    log_message("WARNING: Runtime state unusable (" + reason + "), auto close falls back to " +
                std::to_string(fallback_seconds) + "s", "");
}

void EvaluationLogs::log_auto_close_setting_changed(int previous_seconds, int current_seconds) {
    log_message("Auto close changed from " + std::to_string(previous_seconds) + "s to " + std::to_string(current_seconds) + "s", "");
}

void EvaluationLogs::log_tracker_evaluation_error(const std::string& signal_id, const std::string& error_message) {
    log_message("ERROR: Evaluation of " + signal_id + " failed this tick: " + error_message, "");
}

void EvaluationLogs::log_signal_resolved(const Core::TrackingResult& tracking_result) {
    const Core::SignalTracker& tracker = tracking_result.tracker;
    std::ostringstream runtime_stream;
    runtime_stream << std::fixed << std::setprecision(1) << tracking_result.runtime_seconds / 60.0 << " min";

    LOG_THREAD_SIGNAL_RESOLVED_HEADER(tracker.signal_id);
    TABLE_HEADER_48("Outcome", Core::outcome_to_string(tracking_result.outcome) + " / " +
                               Core::exit_reason_to_string(tracking_result.exit_reason));
    TABLE_ROW_48("Symbol", tracker.symbol + " " + Core::direction_to_string(tracker.direction));
    TABLE_ROW_48("Entry", format_price(tracker.entry_price));
    TABLE_ROW_48("Exit", format_price(tracking_result.exit_price));
    TABLE_ROW_48("Market Price", format_price(tracking_result.observed_market_price));
    TABLE_ROW_48("Result", format_delta(tracking_result));
    TABLE_ROW_48("Runtime", runtime_stream.str());
    TABLE_FOOTER_48();
}

void EvaluationLogs::log_resolution_conflict(const std::string& signal_id) {
    log_message("WARNING: " + signal_id + " was no longer active at resolution, result discarded", "");
}

} // namespace Logging
} // namespace TruthTracker
