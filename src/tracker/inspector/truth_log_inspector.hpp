#ifndef TRUTH_LOG_INSPECTOR_HPP
#define TRUTH_LOG_INSPECTOR_HPP

#include "configs/logging_config.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace TruthTracker {
namespace Core {

enum class InspectionPartition {
    FOREX,
    CRYPTO,
    BOTH
};

bool parse_inspection_partition(const std::string& partition_text, InspectionPartition& partition_out);

struct InspectionRequest {
    size_t latest_count;
    InspectionPartition partition;
    std::string signal_id_filter;       // non-empty: every record for this id instead of the tail

    InspectionRequest() : latest_count(3), partition(InspectionPartition::BOTH) {}
};

struct InspectionSummary {
    size_t record_count;
    int win_count;
    int loss_count;
    int timeout_count;
    double win_rate_percent;
    double total_pips;
    double total_dollars;

    InspectionSummary()
        : record_count(0), win_count(0), loss_count(0), timeout_count(0), win_rate_percent(0.0),
          total_pips(0.0), total_dollars(0.0) {}
};

/**
 * Read-only view over the truth log partitions.
 * inspect() returns the process exit code: 0, or 1 when a partition exists but cannot be read.
 */
class TruthLogInspector {
public:
    explicit TruthLogInspector(const Config::LoggingConfig& logging_config);

    int inspect(const InspectionRequest& request, std::ostream& output_stream) const;

    static InspectionSummary summarize(const std::vector<nlohmann::json>& records);
    static void render_table(const std::vector<nlohmann::json>& records, std::ostream& output_stream);
    static void render_summary(const InspectionSummary& summary, std::ostream& output_stream);

private:
    std::string forex_partition_path;
    std::string crypto_partition_path;
};

} // namespace Core
} // namespace TruthTracker

#endif // TRUTH_LOG_INSPECTOR_HPP
