#include "truth_log_reader.hpp"
#include <deque>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace TruthTracker {
namespace Core {

TruthLogReadResult read_truth_log(const std::string& partition_path, size_t tail_line_count) {
    TruthLogReadResult read_result;

    std::error_code status_error;
    std::filesystem::file_status partition_status = std::filesystem::status(partition_path, status_error);
    if (status_error || !std::filesystem::exists(partition_status)) {
        read_result.read_error = "no readable log at " + partition_path;
        return read_result;
    }
    read_result.partition_exists = true;

    if (!std::filesystem::is_regular_file(partition_status)) {
        read_result.read_error = partition_path + " is not a regular file";
        return read_result;
    }

    std::ifstream partition_stream(partition_path);
    if (!partition_stream.is_open()) {
        read_result.read_error = "unable to open " + partition_path;
        return read_result;
    }

    std::deque<std::string> retained_lines;
    std::string line;
    while (std::getline(partition_stream, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        retained_lines.push_back(line);
        if (tail_line_count > 0 && retained_lines.size() > tail_line_count) {
            retained_lines.pop_front();
        }
    }
    if (partition_stream.bad()) {
        read_result.read_error = "I/O error while reading " + partition_path;
        return read_result;
    }

    read_result.readable = true;
    for (const std::string& retained_line : retained_lines) {
        json record = json::parse(retained_line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            read_result.malformed_line_count++;
            continue;
        }
        read_result.records.push_back(std::move(record));
    }
    return read_result;
}

std::vector<std::string> collect_logged_signal_ids(const std::string& partition_path, size_t& malformed_line_count) {
    std::vector<std::string> logged_signal_ids;
    TruthLogReadResult read_result = read_truth_log(partition_path, 0);
    malformed_line_count += read_result.malformed_line_count;

    if (!read_result.partition_exists) {
        return logged_signal_ids;
    }
    if (!read_result.readable) {
        throw std::runtime_error("Truth log unreadable: " + read_result.read_error);
    }

    for (const json& record : read_result.records) {
        if (record.contains("signal_id") && record["signal_id"].is_string()) {
            logged_signal_ids.push_back(record["signal_id"].get<std::string>());
        }
    }
    return logged_signal_ids;
}

} // namespace Core
} // namespace TruthTracker
