#include "outcome_policy.hpp"
#include <cmath>

namespace TruthTracker {
namespace Core {

namespace {
    double round_to_decimals(double value, double decimal_scale) {
        return std::round(value * decimal_scale) / decimal_scale;
    }

    TrackingResult build_result(const OutcomeEvaluationRequest& request, Outcome outcome, ExitReason exit_reason,
                                double exit_price, double observed_market_price) {
        TrackingResult tracking_result;
        tracking_result.tracker = request.tracker;
        tracking_result.outcome = outcome;
        tracking_result.exit_reason = exit_reason;
        tracking_result.exit_price = exit_price;
        tracking_result.runtime_seconds = request.evaluation_time - request.tracker.started_at;
        tracking_result.delta = exit_reason == ExitReason::TIMEOUT ? 0.0 : compute_delta(request.tracker, exit_price);
        tracking_result.observed_market_price = observed_market_price;
        tracking_result.completed_at = request.evaluation_time;
        tracking_result.auto_close_seconds = request.auto_close_seconds;
        return tracking_result;
    }
}

double pip_size_for_symbol(const std::string& symbol) {
    if (symbol.find("JPY") != std::string::npos) {
        return JPY_PIP_SIZE;
    }
    return STANDARD_PIP_SIZE;
}

double compute_delta(const SignalTracker& tracker, double exit_price) {
    double price_move = tracker.direction == SignalDirection::BUY
        ? exit_price - tracker.entry_price
        : tracker.entry_price - exit_price;

    if (tracker.unit_system == UnitSystem::CRYPTO) {
        return round_to_decimals(price_move, 100.0);
    }
    return round_to_decimals(price_move / pip_size_for_symbol(tracker.symbol), 10.0);
}

double select_exit_side_price(SignalDirection direction, const MarketQuote& quote) {
    return direction == SignalDirection::BUY ? quote.bid : quote.ask;
}

bool is_in_profit(const SignalTracker& tracker, double current_price) {
    if (tracker.direction == SignalDirection::BUY) {
        return current_price > tracker.entry_price;
    }
    return current_price < tracker.entry_price;
}

std::optional<TrackingResult> evaluate_outcome(const OutcomeEvaluationRequest& request) {
    const SignalTracker& tracker = request.tracker;
    double runtime_seconds = request.evaluation_time - tracker.started_at;
    bool tracking_ceiling_reached = runtime_seconds >= static_cast<double>(request.max_tracking_seconds);

    if (request.quote_ptr == nullptr) {
        if (tracking_ceiling_reached) {
            return build_result(request, Outcome::TIMEOUT, ExitReason::TIMEOUT, tracker.entry_price, tracker.entry_price);
        }
        return std::nullopt;
    }

    double current_price = select_exit_side_price(tracker.direction, *request.quote_ptr);

    bool stop_loss_hit = false;
    bool take_profit_hit = false;
    if (tracker.direction == SignalDirection::BUY) {
        stop_loss_hit = current_price <= tracker.stop_loss;
        take_profit_hit = current_price >= tracker.take_profit;
    } else {
        stop_loss_hit = current_price >= tracker.stop_loss;
        take_profit_hit = current_price <= tracker.take_profit;
    }

    if (stop_loss_hit && take_profit_hit) {
        double stop_loss_distance = std::fabs(tracker.entry_price - tracker.stop_loss);
        double take_profit_distance = std::fabs(tracker.entry_price - tracker.take_profit);
        if (take_profit_distance < stop_loss_distance) {
            return build_result(request, Outcome::WIN, ExitReason::TAKE_PROFIT, tracker.take_profit, current_price);
        }
        return build_result(request, Outcome::LOSS, ExitReason::STOP_LOSS, tracker.stop_loss, current_price);
    }
    if (stop_loss_hit) {
        return build_result(request, Outcome::LOSS, ExitReason::STOP_LOSS, tracker.stop_loss, current_price);
    }
    if (take_profit_hit) {
        return build_result(request, Outcome::WIN, ExitReason::TAKE_PROFIT, tracker.take_profit, current_price);
    }

    if (runtime_seconds >= static_cast<double>(request.auto_close_seconds) && is_in_profit(tracker, current_price)) {
        return build_result(request, Outcome::WIN, ExitReason::TIME_CLOSE, current_price, current_price);
    }

    if (tracking_ceiling_reached) {
        return build_result(request, Outcome::TIMEOUT, ExitReason::TIMEOUT, tracker.entry_price, current_price);
    }

    return std::nullopt;
}

} // namespace Core
} // namespace TruthTracker
