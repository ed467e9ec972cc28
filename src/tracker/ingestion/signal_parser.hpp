#ifndef SIGNAL_PARSER_HPP
#define SIGNAL_PARSER_HPP

#include "signal_source.hpp"
#include <optional>
#include <string>

namespace TruthTracker {
namespace Core {

// Fields lifted out of one declaration, before authorization and completeness checks.
// Numeric levels stay 0.0 when absent.
struct SignalRecord {
    std::string signal_id;
    std::string symbol;
    std::string direction_text;
    double entry_price;
    double stop_loss;
    double take_profit;
    std::optional<double> confidence_score;
    double created_at;
    std::string source_tag;
    std::string engine_tag;
    std::optional<double> citadel_score;
    std::optional<bool> ml_filter_passed;
    std::string origin_name;

    SignalRecord() : entry_price(0.0), stop_loss(0.0), take_profit(0.0), created_at(0.0) {}
};

enum class SignalParseStatus {
    PARSED,
    MALFORMED
};

struct SignalParseResult {
    SignalParseStatus status;
    std::string reason;
    SignalRecord record;

    SignalParseResult() : status(SignalParseStatus::MALFORMED) {}
    bool parsed() const { return status == SignalParseStatus::PARSED; }
};

// Accepts the flat shape and the enhanced_signal nested shape.
SignalParseResult parse_signal_declaration(const SignalDeclaration& declaration);

// Rejects records with a missing or zero symbol, direction, entry, stop loss or take profit.
bool check_signal_completeness(const SignalRecord& record, std::string& missing_reason);

} // namespace Core
} // namespace TruthTracker

#endif // SIGNAL_PARSER_HPP
