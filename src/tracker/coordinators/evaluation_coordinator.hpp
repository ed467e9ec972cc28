#ifndef EVALUATION_COORDINATOR_HPP
#define EVALUATION_COORDINATOR_HPP

#include "api/market/market_data_provider.hpp"
#include "configs/runtime_settings.hpp"
#include "configs/tracking_config.hpp"
#include "tracker/registry/tracker_registry.hpp"
#include "tracker/truth_log/truth_logger.hpp"
#include <cstddef>
#include <string>

namespace TruthTracker {
namespace Core {

struct EvaluationCycleReport {
    size_t evaluated_count;
    size_t missing_quote_count;
    size_t resolved_count;
    size_t logged_count;
    size_t truth_log_rejected_count;
    int auto_close_seconds;

    EvaluationCycleReport()
        : evaluated_count(0), missing_quote_count(0), resolved_count(0), logged_count(0),
          truth_log_rejected_count(0), auto_close_seconds(0) {}
};

/**
 * One evaluation tick over every active tracker.
 *
 * Quotes are fetched once per tick, outside the registry lock. A terminal
 * tracker is resolved in the registry before its record is handed to the
 * truth log. TruthLogWriteError propagates to the caller; any other per-tracker
 * failure is logged and the tracker is retried next tick.
 */
class EvaluationCoordinator {
public:
    EvaluationCoordinator(TrackerRegistry& tracker_registry_ref, API::MarketDataProvider& market_data_provider_ref,
                          TruthLogger& truth_logger_ref, const Config::AutoCloseSettingSource& auto_close_setting_ref,
                          const Config::TrackingConfig& tracking_config_ref);

    EvaluationCycleReport run_evaluation_cycle(double now_seconds);

private:
    int read_current_auto_close_seconds();
    void evaluate_tracker(const SignalTracker& tracker, const QuoteSnapshot& quotes, double now_seconds,
                          EvaluationCycleReport& cycle_report);
    void persist_result(const TrackingResult& tracking_result, EvaluationCycleReport& cycle_report);

    TrackerRegistry& tracker_registry;
    API::MarketDataProvider& market_data_provider;
    TruthLogger& truth_logger;
    const Config::AutoCloseSettingSource& auto_close_setting_source;
    const Config::TrackingConfig& tracking_config;

    int last_auto_close_seconds;
    std::string last_auto_close_read_error;
};

} // namespace Core
} // namespace TruthTracker

#endif // EVALUATION_COORDINATOR_HPP
