#include "truth_log_inspector.hpp"
#include "tracker/truth_log/truth_log_reader.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace TruthTracker {
namespace Core {

namespace {
    constexpr int TABLE_WIDTH = 132;

    std::string text_field(const json& record, const char* key, const std::string& fallback) {
        if (!record.contains(key)) {
            return fallback;
        }
        const json& value = record.at(key);
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_boolean()) {
            return value.get<bool>() ? "true" : "false";
        }
        if (value.is_number()) {
            std::ostringstream number_stream;
            number_stream << std::fixed << std::setprecision(1) << value.get<double>();
            return number_stream.str();
        }
        return fallback;
    }

    double number_field(const json& record, const char* key, double fallback) {
        if (record.contains(key) && record.at(key).is_number()) {
            return record.at(key).get<double>();
        }
        return fallback;
    }

    bool is_crypto_record(const json& record) {
        return record.contains("unit_system") && record.at("unit_system").is_string() &&
               record.at("unit_system").get<std::string>() == "crypto";
    }

    std::string format_signed(double value, int precision) {
        std::ostringstream number_stream;
        number_stream << std::fixed << std::setprecision(precision) << std::showpos << value;
        return number_stream.str();
    }

    std::string format_delta(const json& record) {
        if (is_crypto_record(record)) {
            if (record.contains("dollar_result") && record.at("dollar_result").is_number()) {
                return format_signed(record.at("dollar_result").get<double>(), 2) + " $";
            }
        } else if (record.contains("pips_result") && record.at("pips_result").is_number()) {
            return format_signed(record.at("pips_result").get<double>(), 1) + " pips";
        }
        return "N/A";
    }

    std::string truncate_to(const std::string& text, size_t width) {
        return text.size() > width ? text.substr(0, width) : text;
    }
}

bool parse_inspection_partition(const std::string& partition_text, InspectionPartition& partition_out) {
    std::string normalized_partition = partition_text;
    std::transform(normalized_partition.begin(), normalized_partition.end(), normalized_partition.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized_partition == "forex") {
        partition_out = InspectionPartition::FOREX;
        return true;
    }
    if (normalized_partition == "crypto") {
        partition_out = InspectionPartition::CRYPTO;
        return true;
    }
    if (normalized_partition == "both") {
        partition_out = InspectionPartition::BOTH;
        return true;
    }
    return false;
}

TruthLogInspector::TruthLogInspector(const Config::LoggingConfig& logging_config)
    : forex_partition_path(logging_config.forex_truth_log_path),
      crypto_partition_path(logging_config.crypto_truth_log_path) {}

InspectionSummary TruthLogInspector::summarize(const std::vector<json>& records) {
    InspectionSummary summary;
    summary.record_count = records.size();
    for (const json& record : records) {
        std::string result_text = text_field(record, "result", "");
        if (result_text == "WIN") summary.win_count++;
        else if (result_text == "LOSS") summary.loss_count++;
        else if (result_text == "TIMEOUT") summary.timeout_count++;

        if (is_crypto_record(record)) {
            summary.total_dollars += number_field(record, "dollar_result", 0.0);
        } else {
            summary.total_pips += number_field(record, "pips_result", 0.0);
        }
    }
    if (summary.record_count > 0) {
        summary.win_rate_percent = static_cast<double>(summary.win_count) * 100.0 / static_cast<double>(summary.record_count);
    }
    return summary;
}

void TruthLogInspector::render_table(const std::vector<json>& records, std::ostream& output_stream) {
    output_stream << std::string(TABLE_WIDTH, '=') << "\n";
    output_stream << std::left
                  << std::setw(30) << "Signal ID" << " "
                  << std::setw(10) << "Symbol" << " "
                  << std::setw(4) << "Dir" << " "
                  << std::setw(6) << "Unit" << " "
                  << std::setw(7) << "Result" << " "
                  << std::setw(11) << "Exit" << " "
                  << std::setw(6) << "TCS" << " "
                  << std::setw(7) << "CITADEL" << " "
                  << std::setw(7) << "ML" << " "
                  << std::setw(13) << "Delta" << " "
                  << std::setw(8) << "Runtime" << " "
                  << "Source" << "\n";
    output_stream << std::string(TABLE_WIDTH, '-') << "\n";

    for (const json& record : records) {
        std::string runtime_text = "N/A";
        if (record.contains("runtime_minutes") && record.at("runtime_minutes").is_number()) {
            std::ostringstream runtime_stream;
            runtime_stream << std::fixed << std::setprecision(1) << record.at("runtime_minutes").get<double>() << "m";
            runtime_text = runtime_stream.str();
        }

        output_stream << std::left
                      << std::setw(30) << truncate_to(text_field(record, "signal_id", "unknown"), 29) << " "
                      << std::setw(10) << truncate_to(text_field(record, "symbol", "N/A"), 10) << " "
                      << std::setw(4) << text_field(record, "direction", "N/A") << " "
                      << std::setw(6) << text_field(record, "unit_system", "N/A") << " "
                      << std::setw(7) << text_field(record, "result", "N/A") << " "
                      << std::setw(11) << text_field(record, "exit_type", "N/A") << " "
                      << std::setw(6) << text_field(record, "tcs_score", "unknown") << " "
                      << std::setw(7) << text_field(record, "citadel_score", "unknown") << " "
                      << std::setw(7) << text_field(record, "ml_filter_passed", "unknown") << " "
                      << std::setw(13) << format_delta(record) << " "
                      << std::setw(8) << runtime_text << " "
                      << truncate_to(text_field(record, "source", "unknown"), 18) << "\n";
    }
    output_stream << std::string(TABLE_WIDTH, '=') << "\n";
}

void TruthLogInspector::render_summary(const InspectionSummary& summary, std::ostream& output_stream) {
    output_stream << "SUMMARY: " << summary.win_count << " wins, " << summary.loss_count << " losses, "
                  << summary.timeout_count << " timeouts, "
                  << std::fixed << std::setprecision(1) << summary.win_rate_percent << "% win rate\n";
    output_stream << "TOTALS: " << format_signed(summary.total_pips, 1) << " pips, "
                  << format_signed(summary.total_dollars, 2) << " $\n";
}

int TruthLogInspector::inspect(const InspectionRequest& request, std::ostream& output_stream) const {
    std::vector<std::pair<std::string, std::string>> selected_partitions;
    if (request.partition != InspectionPartition::CRYPTO) {
        selected_partitions.emplace_back("forex", forex_partition_path);
    }
    if (request.partition != InspectionPartition::FOREX) {
        selected_partitions.emplace_back("crypto", crypto_partition_path);
    }

    bool filtering_by_signal = !request.signal_id_filter.empty();
    size_t tail_line_count = filtering_by_signal ? 0 : request.latest_count;

    int exit_code = 0;
    size_t malformed_line_total = 0;
    std::vector<json> merged_records;

    for (const auto& partition_entry : selected_partitions) {
        TruthLogReadResult read_result = read_truth_log(partition_entry.second, tail_line_count);
        if (!read_result.partition_exists) {
            output_stream << "[" << partition_entry.first << "] no readable log at " << partition_entry.second << "\n";
            continue;
        }
        if (!read_result.readable) {
            output_stream << "[" << partition_entry.first << "] ERROR: " << read_result.read_error << "\n";
            exit_code = 1;
            continue;
        }
        malformed_line_total += read_result.malformed_line_count;
        for (json& record : read_result.records) {
            if (filtering_by_signal && text_field(record, "signal_id", "") != request.signal_id_filter) {
                continue;
            }
            merged_records.push_back(std::move(record));
        }
    }

    std::stable_sort(merged_records.begin(), merged_records.end(), [](const json& left, const json& right) {
        return number_field(left, "completed_at", 0.0) < number_field(right, "completed_at", 0.0);
    });

    if (!filtering_by_signal && request.latest_count > 0 && merged_records.size() > request.latest_count) {
        merged_records.erase(merged_records.begin(), merged_records.end() - static_cast<std::ptrdiff_t>(request.latest_count));
    }

    if (merged_records.empty()) {
        if (filtering_by_signal) {
            output_stream << "No entries found for signal " << request.signal_id_filter << "\n";
        } else {
            output_stream << "No entries to display\n";
        }
    } else {
        if (filtering_by_signal) {
            output_stream << "TRUTH LOG INSPECTION - Signal " << request.signal_id_filter << " (" << merged_records.size() << " entries)\n";
        } else {
            output_stream << "TRUTH LOG INSPECTION - Latest " << merged_records.size() << " Entries\n";
        }
        render_table(merged_records, output_stream);
        render_summary(summarize(merged_records), output_stream);
    }

    if (malformed_line_total > 0) {
        output_stream << "Skipped " << malformed_line_total << " malformed line(s)\n";
    }
    return exit_code;
}

} // namespace Core
} // namespace TruthTracker
