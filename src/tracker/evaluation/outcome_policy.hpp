#ifndef OUTCOME_POLICY_HPP
#define OUTCOME_POLICY_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <optional>
#include <string>

namespace TruthTracker {
namespace Core {

constexpr double STANDARD_PIP_SIZE = 0.0001;
constexpr double JPY_PIP_SIZE = 0.01;

// Request object (to avoid multi-parameter functions). quote_ptr is null when the
// feed has no quote for the symbol this tick.
struct OutcomeEvaluationRequest {
    const SignalTracker& tracker;
    const MarketQuote* quote_ptr;
    double evaluation_time;
    int auto_close_seconds;
    int max_tracking_seconds;

    OutcomeEvaluationRequest(const SignalTracker& tracker_ref, const MarketQuote* quote, double now_seconds,
                             int auto_close, int max_tracking)
        : tracker(tracker_ref), quote_ptr(quote), evaluation_time(now_seconds),
          auto_close_seconds(auto_close), max_tracking_seconds(max_tracking) {}
};

/**
 * Applies the exit rules to one tracker at one instant. Pure: the same request
 * always yields the same answer. Returns nothing while the tracker stays active.
 *
 * Order: stop loss / take profit (nearest-to-entry wins when both are hit, equal
 * distance counts as a loss), then time close when in profit, then the hard
 * tracking ceiling which closes at entry with a zero delta.
 */
std::optional<TrackingResult> evaluate_outcome(const OutcomeEvaluationRequest& request);

double pip_size_for_symbol(const std::string& symbol);

// Signed in the tracker's favour; pips (0.1 resolution) for forex, currency (0.01) for crypto.
double compute_delta(const SignalTracker& tracker, double exit_price);

// Bid closes a BUY, ask closes a SELL.
double select_exit_side_price(SignalDirection direction, const MarketQuote& quote);

bool is_in_profit(const SignalTracker& tracker, double current_price);

} // namespace Core
} // namespace TruthTracker

#endif // OUTCOME_POLICY_HPP
