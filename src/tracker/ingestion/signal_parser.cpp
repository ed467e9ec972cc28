#include "signal_parser.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include "utils/time_utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

using json = nlohmann::json;

namespace TruthTracker {
namespace Core {

namespace {
    // Numbers may arrive as JSON numbers or numeric strings
    std::optional<double> read_number(const json& container, const char* key) {
        if (!container.is_object() || !container.contains(key)) {
            return std::nullopt;
        }
        const json& value = container.at(key);
        if (value.is_number()) {
            return value.get<double>();
        }
        if (value.is_string()) {
            const std::string text = value.get<std::string>();
            if (text.empty()) {
                return std::nullopt;
            }
            char* parse_end = nullptr;
            double parsed_value = std::strtod(text.c_str(), &parse_end);
            if (parse_end != text.c_str() && *parse_end == '\0') {
                return parsed_value;
            }
        }
        return std::nullopt;
    }

    std::string read_text(const json& container, const char* key) {
        if (!container.is_object() || !container.contains(key)) {
            return "";
        }
        const json& value = container.at(key);
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_number_integer()) {
            return std::to_string(value.get<long long>());
        }
        return "";
    }

    std::optional<bool> read_flag(const json& container, const char* key) {
        if (!container.is_object() || !container.contains(key)) {
            return std::nullopt;
        }
        const json& value = container.at(key);
        if (value.is_boolean()) {
            return value.get<bool>();
        }
        if (value.is_string()) {
            std::string text = value.get<std::string>();
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (text == "true" || text == "1" || text == "yes") return true;
            if (text == "false" || text == "0" || text == "no") return false;
        }
        if (value.is_number()) {
            return value.get<double>() != 0.0;
        }
        return std::nullopt;
    }

    const json& child_object(const json& container, const char* key) {
        static const json empty_object = json::object();
        if (container.is_object() && container.contains(key) && container.at(key).is_object()) {
            return container.at(key);
        }
        return empty_object;
    }

    double first_non_zero(std::initializer_list<std::optional<double>> candidates) {
        for (const std::optional<double>& candidate : candidates) {
            if (candidate && *candidate != 0.0) {
                return *candidate;
            }
        }
        return 0.0;
    }

    std::string first_non_empty(std::initializer_list<std::string> candidates) {
        for (const std::string& candidate : candidates) {
            if (!candidate.empty()) {
                return candidate;
            }
        }
        return "";
    }

    // Epoch number or ISO-8601 text; anything else falls back to the file time
    double read_creation_time(const json& container, const char* key, double fallback_time) {
        if (!container.is_object() || !container.contains(key)) {
            return fallback_time;
        }
        const json& value = container.at(key);
        if (value.is_number()) {
            return value.get<double>();
        }
        if (value.is_string()) {
            double parsed_epoch_seconds = 0.0;
            if (TimeUtils::parse_iso_time_to_epoch(value.get<std::string>(), parsed_epoch_seconds)) {
                return parsed_epoch_seconds;
            }
            std::optional<double> numeric_time = read_number(container, key);
            if (numeric_time) {
                return *numeric_time;
            }
        }
        return fallback_time;
    }

    void extract_enhanced_shape(const json& data, double file_time, SignalRecord& record) {
        const json& enhanced_signal = child_object(data, "enhanced_signal");
        const json& basic_signal = child_object(data, "signal");

        record.symbol = first_non_empty({read_text(data, "pair"), read_text(enhanced_signal, "symbol"), read_text(basic_signal, "symbol")});
        record.direction_text = first_non_empty({read_text(data, "direction"), read_text(enhanced_signal, "direction")});
        record.entry_price = first_non_zero({read_number(enhanced_signal, "entry_price"), read_number(enhanced_signal, "entry")});
        record.stop_loss = first_non_zero({read_number(enhanced_signal, "stop_loss"), read_number(enhanced_signal, "sl")});
        record.take_profit = first_non_zero({read_number(enhanced_signal, "take_profit"), read_number(enhanced_signal, "tp")});
        record.confidence_score = read_number(data, "confidence");
        if (!record.confidence_score) {
            record.confidence_score = read_number(data, "tcs_score");
        }
        record.created_at = read_creation_time(data, "timestamp", file_time);
    }

    void extract_flat_shape(const json& data, double file_time, SignalRecord& record) {
        record.symbol = read_text(data, "symbol");
        record.direction_text = read_text(data, "direction");
        record.entry_price = first_non_zero({read_number(data, "entry_price"), read_number(data, "entry")});
        record.stop_loss = first_non_zero({read_number(data, "stop_loss"), read_number(data, "sl")});
        record.take_profit = first_non_zero({read_number(data, "take_profit"), read_number(data, "tp")});
        record.confidence_score = read_number(data, "tcs_score");
        if (data.contains("created_at")) {
            record.created_at = read_creation_time(data, "created_at", file_time);
        } else {
            record.created_at = read_creation_time(data, "timestamp", file_time);
        }
    }
}

SignalParseResult parse_signal_declaration(const SignalDeclaration& declaration) {
    SignalParseResult parse_result;
    parse_result.record.origin_name = declaration.origin_name;

    if (!declaration.read_error.empty()) {
        parse_result.reason = declaration.read_error;
        return parse_result;
    }

    json data;
    try {
        data = json::parse(declaration.raw_content);
    } catch (const json::parse_error& parse_exception_error) {
        parse_result.reason = std::string("invalid JSON: ") + parse_exception_error.what();
        return parse_result;
    }

    if (!data.is_object()) {
        parse_result.reason = "declaration is not a JSON object";
        return parse_result;
    }

    SignalRecord& record = parse_result.record;
    record.signal_id = first_non_empty({read_text(data, "signal_id"), read_text(data, "mission_id")});

    if (data.contains("enhanced_signal") && data.at("enhanced_signal").is_object()) {
        extract_enhanced_shape(data, declaration.modified_at, record);
    } else {
        extract_flat_shape(data, declaration.modified_at, record);
    }

    std::transform(record.symbol.begin(), record.symbol.end(), record.symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    record.source_tag = read_text(data, "source");
    record.engine_tag = read_text(data, "engine");

    record.citadel_score = read_number(data, "citadel_score");
    if (!record.citadel_score) {
        record.citadel_score = read_number(child_object(data, "citadel_shield"), "score");
    }
    record.ml_filter_passed = read_flag(data, "ml_filter_passed");
    if (!record.ml_filter_passed) {
        record.ml_filter_passed = read_flag(child_object(data, "ml_result"), "passed");
    }

    parse_result.status = SignalParseStatus::PARSED;
    return parse_result;
}

bool check_signal_completeness(const SignalRecord& record, std::string& missing_reason) {
    if (record.signal_id.empty()) {
        missing_reason = "missing signal_id";
        return false;
    }
    if (record.symbol.empty()) {
        missing_reason = "missing symbol";
        return false;
    }
    SignalDirection parsed_direction;
    if (record.direction_text.empty()) {
        missing_reason = "missing direction";
        return false;
    }
    if (!parse_direction(record.direction_text, parsed_direction)) {
        missing_reason = "unrecognized direction '" + record.direction_text + "'";
        return false;
    }
    if (record.entry_price == 0.0) {
        missing_reason = "missing or zero entry price";
        return false;
    }
    if (record.stop_loss == 0.0) {
        missing_reason = "missing or zero stop loss";
        return false;
    }
    if (record.take_profit == 0.0) {
        missing_reason = "missing or zero take profit";
        return false;
    }
    return true;
}

} // namespace Core
} // namespace TruthTracker
