#ifndef TRUTH_LOG_READER_HPP
#define TRUTH_LOG_READER_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace TruthTracker {
namespace Core {

struct TruthLogReadResult {
    bool partition_exists;
    bool readable;
    std::string read_error;
    std::vector<nlohmann::json> records;     // file order
    size_t malformed_line_count;

    TruthLogReadResult() : partition_exists(false), readable(false), malformed_line_count(0) {}
};

// Reads the last tail_line_count non-empty lines of a partition (0 reads everything).
// Lines that are not JSON objects are skipped and counted. Never writes.
TruthLogReadResult read_truth_log(const std::string& partition_path, size_t tail_line_count);

// Every signal_id present in the partition. An absent partition yields nothing.
// Malformed lines are added to malformed_line_count so one counter can span partitions.
std::vector<std::string> collect_logged_signal_ids(const std::string& partition_path, size_t& malformed_line_count);

} // namespace Core
} // namespace TruthTracker

#endif // TRUTH_LOG_READER_HPP
