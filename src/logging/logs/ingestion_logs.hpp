#ifndef INGESTION_LOGS_HPP
#define INGESTION_LOGS_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <cstddef>
#include <string>

namespace TruthTracker {
namespace Logging {

class IngestionLogs {
public:
    // Thread lifecycle logging
    static void log_thread_startup(int poll_interval_seconds);
    static void log_thread_exception(const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& error_message);

    // Per-declaration outcomes
    static void log_malformed_declaration(const std::string& origin_name, const std::string& reason);
    static void log_unauthorized_declaration(const std::string& origin_name, const std::string& signal_id, const std::string& reason);
    static void log_incomplete_declaration(const std::string& origin_name, const std::string& signal_id, const std::string& reason);
    static void log_signal_admitted(const Core::SignalTracker& tracker);
    static void log_duplicate_signal(const std::string& origin_name, const std::string& signal_id);
    static void log_admission_rejected(const std::string& origin_name, const std::string& signal_id, const std::string& reason);

    static void log_cycle_summary(size_t new_declaration_count, size_t admitted_count);
};

} // namespace Logging
} // namespace TruthTracker

#endif // INGESTION_LOGS_HPP
