#include "evaluation_coordinator.hpp"
#include "tracker/evaluation/outcome_policy.hpp"
#include "logging/logs/evaluation_logs.hpp"
#include "logging/logs/truth_log_logs.hpp"
#include <stdexcept>

using TruthTracker::Logging::EvaluationLogs;
using TruthTracker::Logging::TruthLogLogs;

namespace TruthTracker {
namespace Core {

EvaluationCoordinator::EvaluationCoordinator(TrackerRegistry& tracker_registry_ref, API::MarketDataProvider& market_data_provider_ref,
                                             TruthLogger& truth_logger_ref, const Config::AutoCloseSettingSource& auto_close_setting_ref,
                                             const Config::TrackingConfig& tracking_config_ref)
    : tracker_registry(tracker_registry_ref),
      market_data_provider(market_data_provider_ref),
      truth_logger(truth_logger_ref),
      auto_close_setting_source(auto_close_setting_ref),
      tracking_config(tracking_config_ref),
      last_auto_close_seconds(-1) {}

int EvaluationCoordinator::read_current_auto_close_seconds() {
    Config::AutoCloseSetting auto_close_setting = auto_close_setting_source.read_auto_close_setting();

    if (auto_close_setting.read_error != last_auto_close_read_error) {
        if (!auto_close_setting.read_error.empty()) {
            EvaluationLogs::log_auto_close_setting_error(auto_close_setting.read_error, auto_close_setting.auto_close_seconds);
        }
        last_auto_close_read_error = auto_close_setting.read_error;
    }
    if (last_auto_close_seconds >= 0 && auto_close_setting.auto_close_seconds != last_auto_close_seconds) {
        EvaluationLogs::log_auto_close_setting_changed(last_auto_close_seconds, auto_close_setting.auto_close_seconds);
    }
    last_auto_close_seconds = auto_close_setting.auto_close_seconds;
    return auto_close_setting.auto_close_seconds;
}

EvaluationCycleReport EvaluationCoordinator::run_evaluation_cycle(double now_seconds) {
    EvaluationCycleReport cycle_report;

    std::vector<SignalTracker> active_trackers = tracker_registry.snapshot_active();
    if (active_trackers.empty()) {
        return cycle_report;
    }

    cycle_report.auto_close_seconds = read_current_auto_close_seconds();
    API::QuoteSnapshotPtr quote_snapshot = market_data_provider.fetch_all_quotes();
    const QuoteSnapshot empty_quotes;
    const QuoteSnapshot& quotes = quote_snapshot ? *quote_snapshot : empty_quotes;

    for (const SignalTracker& tracker : active_trackers) {
        try {
            evaluate_tracker(tracker, quotes, now_seconds, cycle_report);
        } catch (const TruthLogWriteError&) {
            throw;
        } catch (const std::exception& evaluation_exception_error) {
            EvaluationLogs::log_tracker_evaluation_error(tracker.signal_id, evaluation_exception_error.what());
        }
    }
    return cycle_report;
}

void EvaluationCoordinator::evaluate_tracker(const SignalTracker& tracker, const QuoteSnapshot& quotes, double now_seconds,
                                             EvaluationCycleReport& cycle_report) {
    cycle_report.evaluated_count++;

    SignalTracker observed_tracker = tracker;
    const MarketQuote* quote_ptr = nullptr;
    auto quote_iterator = quotes.find(tracker.symbol);
    if (quote_iterator != quotes.end()) {
        quote_ptr = &quote_iterator->second;
        double current_price = select_exit_side_price(tracker.direction, *quote_ptr);
        std::optional<SignalTracker> updated_tracker =
            tracker_registry.record_observation(tracker.signal_id, current_price, compute_delta(tracker, current_price));
        if (!updated_tracker) {
            return;
        }
        observed_tracker = *updated_tracker;
    } else {
        cycle_report.missing_quote_count++;
    }

    OutcomeEvaluationRequest evaluation_request(observed_tracker, quote_ptr, now_seconds,
                                                cycle_report.auto_close_seconds, tracking_config.max_tracking_seconds);
    std::optional<TrackingResult> tracking_result = evaluate_outcome(evaluation_request);
    if (!tracking_result) {
        return;
    }

    if (!tracker_registry.resolve(tracker.signal_id, *tracking_result)) {
        EvaluationLogs::log_resolution_conflict(tracker.signal_id);
        return;
    }
    cycle_report.resolved_count++;
    EvaluationLogs::log_signal_resolved(*tracking_result);

    persist_result(*tracking_result, cycle_report);
}

void EvaluationCoordinator::persist_result(const TrackingResult& tracking_result, EvaluationCycleReport& cycle_report) {
    const std::string& signal_id = tracking_result.tracker.signal_id;
    TruthLogWriteResult write_result;
    try {
        write_result = truth_logger.log(tracking_result);
    } catch (const TruthLogWriteError& write_exception_error) {
        TruthLogLogs::log_write_failure(signal_id, write_exception_error.what());
        throw;
    }

    if (write_result.logged()) {
        cycle_report.logged_count++;
        TruthLogLogs::log_record_written(signal_id, write_result.partition_path);
    } else {
        cycle_report.truth_log_rejected_count++;
        TruthLogLogs::log_record_rejected(signal_id, write_result.reason);
    }
}

} // namespace Core
} // namespace TruthTracker
