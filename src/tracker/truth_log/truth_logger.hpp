#ifndef TRUTH_LOGGER_HPP
#define TRUTH_LOGGER_HPP

#include "configs/logging_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include "tracker/ingestion/authorization_policy.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <stdexcept>
#include <string>

namespace TruthTracker {
namespace Core {

enum class TruthLogWriteStatus {
    LOGGED,
    REJECTED
};

struct TruthLogWriteResult {
    TruthLogWriteStatus status;
    std::string reason;
    std::string partition_path;

    TruthLogWriteResult() : status(TruthLogWriteStatus::REJECTED) {}
    bool logged() const { return status == TruthLogWriteStatus::LOGGED; }
};

// Raised when a validated record cannot be appended. Carries the record so the
// operator alert can include it.
class TruthLogWriteError : public std::runtime_error {
public:
    TruthLogWriteError(const std::string& error_message, const std::string& record_line)
        : std::runtime_error(error_message), unwritten_record_line(record_line) {}

    const std::string& get_record_line() const { return unwritten_record_line; }

private:
    std::string unwritten_record_line;
};

/**
 * Append-only JSONL writer, one partition file per unit system.
 * Records are re-checked against the allow-list before they are written.
 */
class TruthLogger {
public:
    TruthLogger(const Config::LoggingConfig& logging_config, const AuthorizationPolicy& authorization_policy);

    TruthLogger(const TruthLogger&) = delete;
    TruthLogger& operator=(const TruthLogger&) = delete;

    // Throws TruthLogWriteError when the partition cannot be appended to.
    TruthLogWriteResult log(const TrackingResult& tracking_result);

    const std::string& partition_path_for(UnitSystem unit_system) const;

    static nlohmann::json build_record(const TrackingResult& tracking_result);

private:
    bool validate_mandatory_fields(const TrackingResult& tracking_result, std::string& rejection_reason) const;
    void append_record_line(const std::string& partition_path, const std::string& record_line);

    std::mutex write_mutex;
    std::string forex_partition_path;
    std::string crypto_partition_path;
    const AuthorizationPolicy& authorization_policy_ref;
};

} // namespace Core
} // namespace TruthTracker

#endif // TRUTH_LOGGER_HPP
