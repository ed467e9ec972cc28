#ifndef TRUTH_LOG_LOGS_HPP
#define TRUTH_LOG_LOGS_HPP

#include <string>

namespace TruthTracker {
namespace Logging {

class TruthLogLogs {
public:
    static void log_record_written(const std::string& signal_id, const std::string& partition_path);
    static void log_record_rejected(const std::string& signal_id, const std::string& reason);
    static void log_write_failure(const std::string& signal_id, const std::string& error_message);
};

} // namespace Logging
} // namespace TruthTracker

#endif // TRUTH_LOG_LOGS_HPP
