#include "ingestion_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace TruthTracker {
namespace Logging {

namespace {
    std::string format_price(double price) {
        std::ostringstream price_stream;
        price_stream << std::setprecision(10) << price;
        return price_stream.str();
    }

    std::string id_or_missing(const std::string& signal_id) {
        return signal_id.empty() ? "MISSING" : signal_id;
    }
}

void IngestionLogs::log_thread_startup(int poll_interval_seconds) {
    log_message("IngestionThread started, scanning every " + std::to_string(poll_interval_seconds) + "s", "");
}

void IngestionLogs::log_thread_exception(const std::string& error_message) {
    log_message("IngestionThread exception: " + error_message, "");
}

void IngestionLogs::log_loop_iteration_exception(const std::string& error_message) {
    log_message("IngestionThread loop iteration exception: " + error_message, "");
}

void IngestionLogs::log_malformed_declaration(const std::string& origin_name, const std::string& reason) {
    log_message("ERROR: Skipping malformed declaration " + origin_name + ": " + reason, "");
}

void IngestionLogs::log_unauthorized_declaration(const std::string& origin_name, const std::string& signal_id, const std::string& reason) {
    log_message("[REJECTED] UNAUTHORIZED signal " + id_or_missing(signal_id) + " from " + origin_name + ": " + reason, "");
}

void IngestionLogs::log_incomplete_declaration(const std::string& origin_name, const std::string& signal_id, const std::string& reason) {
    log_message("[REJECTED] Incomplete signal " + id_or_missing(signal_id) + " from " + origin_name + ": " + reason, "");
}

void IngestionLogs::log_signal_admitted(const Core::SignalTracker& tracker) {
    LOG_THREAD_SIGNAL_ADMITTED_HEADER(tracker.signal_id);
    TABLE_HEADER_48("Signal", tracker.origin_file);
    TABLE_ROW_48("Symbol", tracker.symbol);
    TABLE_ROW_48("Direction", Core::direction_to_string(tracker.direction));
    TABLE_ROW_48("Unit System", Core::unit_system_to_string(tracker.unit_system));
    TABLE_ROW_48("Entry", format_price(tracker.entry_price));
    TABLE_ROW_48("Stop Loss", format_price(tracker.stop_loss));
    TABLE_ROW_48("Take Profit", format_price(tracker.take_profit));
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Source", tracker.source_tag.empty() ? "-" : tracker.source_tag);
    TABLE_ROW_48("Engine", tracker.engine_tag.empty() ? "-" : tracker.engine_tag);
    TABLE_ROW_48("Created", TimeUtils::format_epoch_as_human_readable(tracker.created_at));
    TABLE_FOOTER_48();
}

void IngestionLogs::log_duplicate_signal(const std::string& origin_name, const std::string& signal_id) {
    log_message("Signal " + signal_id + " from " + origin_name + " already tracked or resolved, ignoring", "");
}

void IngestionLogs::log_admission_rejected(const std::string& origin_name, const std::string& signal_id, const std::string& reason) {
    log_message("[REJECTED] Signal " + id_or_missing(signal_id) + " from " + origin_name + " failed admission: " + reason, "");
}

void IngestionLogs::log_cycle_summary(size_t new_declaration_count, size_t admitted_count) {
    log_message("INGESTION: " + std::to_string(new_declaration_count) + " new declaration(s), " +
                std::to_string(admitted_count) + " admitted", "");
}

} // namespace Logging
} // namespace TruthTracker
