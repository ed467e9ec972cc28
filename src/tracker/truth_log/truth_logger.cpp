#include "truth_logger.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace TruthTracker {
namespace Core {

namespace {
    json optional_number_or_unknown(const std::optional<double>& value) {
        if (value) {
            return *value;
        }
        return UNKNOWN_METADATA_SENTINEL;
    }

    json optional_flag_or_unknown(const std::optional<bool>& value) {
        if (value) {
            return *value;
        }
        return UNKNOWN_METADATA_SENTINEL;
    }

    std::string text_or_unknown(const std::string& value) {
        return value.empty() ? std::string(UNKNOWN_METADATA_SENTINEL) : value;
    }

    double round_to_decimals(double value, double decimal_scale) {
        return std::round(value * decimal_scale) / decimal_scale;
    }
}

TruthLogger::TruthLogger(const Config::LoggingConfig& logging_config, const AuthorizationPolicy& authorization_policy)
    : forex_partition_path(logging_config.forex_truth_log_path),
      crypto_partition_path(logging_config.crypto_truth_log_path),
      authorization_policy_ref(authorization_policy) {
    if (forex_partition_path.empty() || crypto_partition_path.empty()) {
        throw std::runtime_error("Truth log partitions must both be configured");
    }
    if (forex_partition_path == crypto_partition_path) {
        throw std::runtime_error("Truth log partitions must be separate files: " + forex_partition_path);
    }
}

const std::string& TruthLogger::partition_path_for(UnitSystem unit_system) const {
    return unit_system == UnitSystem::CRYPTO ? crypto_partition_path : forex_partition_path;
}

json TruthLogger::build_record(const TrackingResult& tracking_result) {
    const SignalTracker& tracker = tracking_result.tracker;

    json record = json::object();
    record["signal_id"] = tracker.signal_id;
    record["symbol"] = tracker.symbol;
    record["direction"] = direction_to_string(tracker.direction);
    record["result"] = outcome_to_string(tracking_result.outcome);
    record["exit_type"] = exit_reason_to_string(tracking_result.exit_reason);
    record["entry_price"] = tracker.entry_price;
    record["exit_price"] = tracking_result.exit_price;
    record["stop_loss"] = tracker.stop_loss;
    record["take_profit"] = tracker.take_profit;
    record["tcs_score"] = optional_number_or_unknown(tracker.confidence_score);
    record["citadel_score"] = optional_number_or_unknown(tracker.citadel_score);
    record["ml_filter_passed"] = optional_flag_or_unknown(tracker.ml_filter_passed);
    record["source"] = text_or_unknown(tracker.source_tag);
    record["engine"] = text_or_unknown(tracker.engine_tag);
    record["unit_system"] = unit_system_to_string(tracker.unit_system);
    record["created_at"] = tracker.created_at;
    record["started_at"] = tracker.started_at;
    record["completed_at"] = tracking_result.completed_at;
    record["runtime_seconds"] = static_cast<long long>(tracking_result.runtime_seconds);
    record["runtime_minutes"] = round_to_decimals(tracking_result.runtime_seconds / 60.0, 10.0);
    record["delta"] = tracking_result.delta;
    if (tracker.unit_system == UnitSystem::CRYPTO) {
        record["dollar_result"] = tracking_result.delta;
    } else {
        record["pips_result"] = tracking_result.delta;
    }
    record["market_price"] = tracking_result.observed_market_price;
    record["auto_close_seconds"] = tracking_result.auto_close_seconds;
    record["max_favorable_excursion"] = tracker.max_favorable_excursion;
    record["max_adverse_excursion"] = tracker.max_adverse_excursion;
    return record;
}

bool TruthLogger::validate_mandatory_fields(const TrackingResult& tracking_result, std::string& rejection_reason) const {
    const SignalTracker& tracker = tracking_result.tracker;
    if (tracker.signal_id.empty()) {
        rejection_reason = "missing signal_id";
        return false;
    }
    if (tracker.symbol.empty()) {
        rejection_reason = "missing symbol";
        return false;
    }
    if (!(tracker.entry_price > 0.0) || !(tracker.stop_loss > 0.0) || !(tracker.take_profit > 0.0)) {
        rejection_reason = "non-positive price level";
        return false;
    }
    if (!std::isfinite(tracking_result.exit_price) || !std::isfinite(tracking_result.delta)) {
        rejection_reason = "non-finite exit price or delta";
        return false;
    }
    if (tracking_result.completed_at < tracker.started_at) {
        rejection_reason = "completion precedes start";
        return false;
    }
    return true;
}

void TruthLogger::append_record_line(const std::string& partition_path, const std::string& record_line) {
    std::filesystem::path partition_file_path(partition_path);
    if (partition_file_path.has_parent_path()) {
        std::error_code directory_error;
        std::filesystem::create_directories(partition_file_path.parent_path(), directory_error);
        if (directory_error) {
            throw TruthLogWriteError("Failed to create truth log directory " + partition_file_path.parent_path().string() +
                                     ": " + directory_error.message(), record_line);
        }
    }

    std::ofstream partition_stream(partition_path, std::ios::app);
    if (!partition_stream.is_open()) {
        throw TruthLogWriteError("Failed to open truth log " + partition_path + " for append", record_line);
    }
    partition_stream << record_line << '\n';
    partition_stream.flush();
    if (!partition_stream.good()) {
        throw TruthLogWriteError("Failed to write truth log " + partition_path, record_line);
    }
}

TruthLogWriteResult TruthLogger::log(const TrackingResult& tracking_result) {
    TruthLogWriteResult write_result;
    const SignalTracker& tracker = tracking_result.tracker;

    AuthorizationDecision authorization_decision = authorization_policy_ref.authorize(tracker.source_tag, tracker.engine_tag);
    if (!authorization_decision.authorized) {
        write_result.reason = "unauthorized: " + authorization_decision.reason;
        return write_result;
    }
    if (authorization_decision.unit_system != tracker.unit_system) {
        write_result.reason = "unit system " + unit_system_to_string(tracker.unit_system) +
                              " does not match authorizing tag '" + authorization_decision.authorizing_tag + "'";
        return write_result;
    }

    std::string rejection_reason;
    if (!validate_mandatory_fields(tracking_result, rejection_reason)) {
        write_result.reason = rejection_reason;
        return write_result;
    }

    std::string record_line = build_record(tracking_result).dump();
    write_result.partition_path = partition_path_for(tracker.unit_system);

    {
        std::lock_guard<std::mutex> lock(write_mutex);
        append_record_line(write_result.partition_path, record_line);
    }

    write_result.status = TruthLogWriteStatus::LOGGED;
    return write_result;
}

} // namespace Core
} // namespace TruthTracker
