#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <optional>
#include <unordered_map>

namespace TruthTracker {
namespace Core {

enum class SignalDirection {
    BUY,
    SELL
};

enum class UnitSystem {
    FOREX,
    CRYPTO
};

enum class Outcome {
    WIN,
    LOSS,
    TIMEOUT
};

enum class ExitReason {
    STOP_LOSS,
    TAKE_PROFIT,
    TIME_CLOSE,
    TIMEOUT
};

// Written in place of absent optional metadata in truth log records
constexpr const char* UNKNOWN_METADATA_SENTINEL = "unknown";

std::string direction_to_string(SignalDirection direction);
bool parse_direction(const std::string& direction_text, SignalDirection& direction_out);

std::string unit_system_to_string(UnitSystem unit_system);

std::string outcome_to_string(Outcome outcome);
std::string exit_reason_to_string(ExitReason exit_reason);

struct SignalTracker {
    std::string signal_id;
    std::string symbol;
    SignalDirection direction;
    double entry_price;
    double stop_loss;
    double take_profit;
    std::optional<double> confidence_score;
    double created_at;                  // unix seconds
    double started_at;                  // unix seconds, >= created_at
    UnitSystem unit_system;
    std::string source_tag;
    std::string engine_tag;
    std::optional<double> citadel_score;
    std::optional<bool> ml_filter_passed;
    std::string origin_file;

    // Mutated only by the evaluation loop
    double last_observed_price;
    double max_favorable_excursion;
    double max_adverse_excursion;
    long evaluation_ticks;

    SignalTracker()
        : direction(SignalDirection::BUY), entry_price(0.0), stop_loss(0.0), take_profit(0.0),
          created_at(0.0), started_at(0.0), unit_system(UnitSystem::FOREX),
          last_observed_price(0.0), max_favorable_excursion(0.0), max_adverse_excursion(0.0),
          evaluation_ticks(0) {}
};

// Checks that stop loss and take profit sit on the correct side of entry for the direction.
bool validate_level_sides(const SignalTracker& tracker, std::string& rejection_reason);

struct TrackingResult {
    SignalTracker tracker;
    Outcome outcome;
    ExitReason exit_reason;
    double exit_price;
    double runtime_seconds;
    double delta;                       // pips for forex, currency units for crypto
    double observed_market_price;
    double completed_at;
    int auto_close_seconds;

    TrackingResult()
        : outcome(Outcome::TIMEOUT), exit_reason(ExitReason::TIMEOUT), exit_price(0.0),
          runtime_seconds(0.0), delta(0.0), observed_market_price(0.0), completed_at(0.0),
          auto_close_seconds(0) {}
};

struct MarketQuote {
    double bid;
    double ask;
    double observed_at;

    MarketQuote() : bid(0.0), ask(0.0), observed_at(0.0) {}
    MarketQuote(double bid_price, double ask_price, double observed_at_seconds)
        : bid(bid_price), ask(ask_price), observed_at(observed_at_seconds) {}
};

// Symbol (upper case) to latest quote
using QuoteSnapshot = std::unordered_map<std::string, MarketQuote>;

} // namespace Core
} // namespace TruthTracker

#endif // DATA_STRUCTURES_HPP
