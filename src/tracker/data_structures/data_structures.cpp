#include "data_structures.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace TruthTracker {
namespace Core {

namespace {
    std::string to_upper_copy(const std::string& text) {
        std::string upper_text = text;
        std::transform(upper_text.begin(), upper_text.end(), upper_text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper_text;
    }
}

std::string direction_to_string(SignalDirection direction) {
    switch (direction) {
        case SignalDirection::BUY:
            return "BUY";
        case SignalDirection::SELL:
            return "SELL";
        default:
            throw std::runtime_error("Unknown signal direction");
    }
}

bool parse_direction(const std::string& direction_text, SignalDirection& direction_out) {
    std::string normalized_direction = to_upper_copy(direction_text);
    if (normalized_direction == "BUY") {
        direction_out = SignalDirection::BUY;
        return true;
    }
    if (normalized_direction == "SELL") {
        direction_out = SignalDirection::SELL;
        return true;
    }
    return false;
}

std::string unit_system_to_string(UnitSystem unit_system) {
    switch (unit_system) {
        case UnitSystem::FOREX:
            return "forex";
        case UnitSystem::CRYPTO:
            return "crypto";
        default:
            throw std::runtime_error("Unknown unit system");
    }
}

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::WIN:
            return "WIN";
        case Outcome::LOSS:
            return "LOSS";
        case Outcome::TIMEOUT:
            return "TIMEOUT";
        default:
            throw std::runtime_error("Unknown outcome");
    }
}

std::string exit_reason_to_string(ExitReason exit_reason) {
    switch (exit_reason) {
        case ExitReason::STOP_LOSS:
            return "STOP_LOSS";
        case ExitReason::TAKE_PROFIT:
            return "TAKE_PROFIT";
        case ExitReason::TIME_CLOSE:
            return "TIME_CLOSE";
        case ExitReason::TIMEOUT:
            return "TIMEOUT";
        default:
            throw std::runtime_error("Unknown exit reason");
    }
}

bool validate_level_sides(const SignalTracker& tracker, std::string& rejection_reason) {
    if (tracker.entry_price <= 0.0 || tracker.stop_loss <= 0.0 || tracker.take_profit <= 0.0) {
        rejection_reason = "entry, stop loss and take profit must be positive";
        return false;
    }
    if (tracker.direction == SignalDirection::BUY) {
        if (!(tracker.stop_loss < tracker.entry_price)) {
            rejection_reason = "BUY stop loss must be below entry";
            return false;
        }
        if (!(tracker.take_profit > tracker.entry_price)) {
            rejection_reason = "BUY take profit must be above entry";
            return false;
        }
    } else {
        if (!(tracker.stop_loss > tracker.entry_price)) {
            rejection_reason = "SELL stop loss must be above entry";
            return false;
        }
        if (!(tracker.take_profit < tracker.entry_price)) {
            rejection_reason = "SELL take profit must be below entry";
            return false;
        }
    }
    return true;
}

} // namespace Core
} // namespace TruthTracker
