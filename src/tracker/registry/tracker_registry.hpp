#ifndef TRACKER_REGISTRY_HPP
#define TRACKER_REGISTRY_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace TruthTracker {
namespace Core {

enum class AdmissionStatus {
    ADMITTED,
    ALREADY_PROCESSED,
    REJECTED
};

struct AdmissionResult {
    AdmissionStatus status;
    std::string reason;

    AdmissionResult() : status(AdmissionStatus::REJECTED) {}
    AdmissionResult(AdmissionStatus admission_status, const std::string& admission_reason)
        : status(admission_status), reason(admission_reason) {}

    bool admitted() const { return status == AdmissionStatus::ADMITTED; }
};

struct RegistryStatistics {
    size_t active_count;
    size_t processed_count;
    long admitted_total;
    long duplicate_total;
    long rejected_total;
    long win_total;
    long loss_total;
    long timeout_total;

    RegistryStatistics()
        : active_count(0), processed_count(0), admitted_total(0), duplicate_total(0), rejected_total(0),
          win_total(0), loss_total(0), timeout_total(0) {}
};

/**
 * TrackerRegistry - Owns every live SignalTracker.
 *
 * One mutex guards the active map, the permanent processed-id set and the
 * counters. Iteration works on a copy taken under the lock so callbacks may
 * do slow work (network, disk) without blocking admission.
 */
class TrackerRegistry {
public:
    TrackerRegistry() = default;
    TrackerRegistry(const TrackerRegistry&) = delete;
    TrackerRegistry& operator=(const TrackerRegistry&) = delete;

    AdmissionResult admit(const SignalTracker& tracker);

    // Invokes the callback outside the lock on a snapshot of the active trackers.
    void for_each_active(const std::function<void(const SignalTracker&)>& tracker_callback) const;
    std::vector<SignalTracker> snapshot_active() const;

    // Updates last observed price, excursions and tick count. Returns the updated
    // tracker, or nothing when the id is no longer active.
    std::optional<SignalTracker> record_observation(const std::string& signal_id, double observed_price, double observed_delta);

    // Removes the tracker and seals its id into the processed set. Returns false
    // when the id was not active (already resolved by someone else).
    bool resolve(const std::string& signal_id, const TrackingResult& tracking_result);

    // Marks ids as processed without them ever being active (restart rehydration).
    size_t seed_processed_ids(const std::vector<std::string>& signal_ids);

    bool is_processed(const std::string& signal_id) const;
    bool is_active(const std::string& signal_id) const;
    size_t active_count() const;
    size_t processed_count() const;
    RegistryStatistics get_statistics() const;

private:
    mutable std::mutex registry_mutex;
    std::unordered_map<std::string, SignalTracker> active_trackers;
    std::unordered_set<std::string> processed_signal_ids;
    RegistryStatistics statistics;
};

} // namespace Core
} // namespace TruthTracker

#endif // TRACKER_REGISTRY_HPP
