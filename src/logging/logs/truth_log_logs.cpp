#include "truth_log_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace TruthTracker {
namespace Logging {

void TruthLogLogs::log_record_written(const std::string& signal_id, const std::string& partition_path) {
    log_message("TRUTH_LOG: " + signal_id + " appended to " + partition_path, "");
}

void TruthLogLogs::log_record_rejected(const std::string& signal_id, const std::string& reason) {
    log_message("[REJECTED] TRUTH_LOG refused " + signal_id + ": " + reason, "");
}

void TruthLogLogs::log_write_failure(const std::string& signal_id, const std::string& error_message) {
    log_message("ERROR: TRUTH_LOG write failed for " + signal_id + ": " + error_message, "");
}

} // namespace Logging
} // namespace TruthTracker
