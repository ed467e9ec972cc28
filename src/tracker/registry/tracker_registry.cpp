#include "tracker_registry.hpp"
#include <algorithm>

namespace TruthTracker {
namespace Core {

AdmissionResult TrackerRegistry::admit(const SignalTracker& tracker) {
    if (tracker.signal_id.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex);
        statistics.rejected_total++;
        return AdmissionResult(AdmissionStatus::REJECTED, "signal id is empty");
    }

    std::string level_rejection_reason;
    bool levels_valid = validate_level_sides(tracker, level_rejection_reason);

    std::lock_guard<std::mutex> lock(registry_mutex);
    if (processed_signal_ids.count(tracker.signal_id) > 0 || active_trackers.count(tracker.signal_id) > 0) {
        statistics.duplicate_total++;
        return AdmissionResult(AdmissionStatus::ALREADY_PROCESSED, "signal " + tracker.signal_id + " already tracked");
    }
    if (!levels_valid) {
        statistics.rejected_total++;
        return AdmissionResult(AdmissionStatus::REJECTED, level_rejection_reason);
    }

    active_trackers.emplace(tracker.signal_id, tracker);
    statistics.admitted_total++;
    return AdmissionResult(AdmissionStatus::ADMITTED, "");
}

void TrackerRegistry::for_each_active(const std::function<void(const SignalTracker&)>& tracker_callback) const {
    std::vector<SignalTracker> active_snapshot = snapshot_active();
    for (const SignalTracker& tracker : active_snapshot) {
        tracker_callback(tracker);
    }
}

std::vector<SignalTracker> TrackerRegistry::snapshot_active() const {
    std::vector<SignalTracker> active_snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        active_snapshot.reserve(active_trackers.size());
        for (const auto& active_entry : active_trackers) {
            active_snapshot.push_back(active_entry.second);
        }
    }
    // Stable order keeps evaluation and status output reproducible
    std::sort(active_snapshot.begin(), active_snapshot.end(),
              [](const SignalTracker& left, const SignalTracker& right) {
                  if (left.started_at != right.started_at) return left.started_at < right.started_at;
                  return left.signal_id < right.signal_id;
              });
    return active_snapshot;
}

std::optional<SignalTracker> TrackerRegistry::record_observation(const std::string& signal_id, double observed_price, double observed_delta) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto active_iterator = active_trackers.find(signal_id);
    if (active_iterator == active_trackers.end()) {
        return std::nullopt;
    }

    SignalTracker& tracker = active_iterator->second;
    tracker.last_observed_price = observed_price;
    tracker.max_favorable_excursion = std::max(tracker.max_favorable_excursion, observed_delta);
    tracker.max_adverse_excursion = std::min(tracker.max_adverse_excursion, observed_delta);
    tracker.evaluation_ticks++;
    return tracker;
}

bool TrackerRegistry::resolve(const std::string& signal_id, const TrackingResult& tracking_result) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto active_iterator = active_trackers.find(signal_id);
    if (active_iterator == active_trackers.end()) {
        return false;
    }

    active_trackers.erase(active_iterator);
    processed_signal_ids.insert(signal_id);

    switch (tracking_result.outcome) {
        case Outcome::WIN:
            statistics.win_total++;
            break;
        case Outcome::LOSS:
            statistics.loss_total++;
            break;
        case Outcome::TIMEOUT:
            statistics.timeout_total++;
            break;
    }
    return true;
}

size_t TrackerRegistry::seed_processed_ids(const std::vector<std::string>& signal_ids) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    size_t processed_before = processed_signal_ids.size();
    for (const std::string& signal_id : signal_ids) {
        if (!signal_id.empty()) {
            processed_signal_ids.insert(signal_id);
        }
    }
    return processed_signal_ids.size() - processed_before;
}

bool TrackerRegistry::is_processed(const std::string& signal_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return processed_signal_ids.count(signal_id) > 0;
}

bool TrackerRegistry::is_active(const std::string& signal_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return active_trackers.count(signal_id) > 0;
}

size_t TrackerRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return active_trackers.size();
}

size_t TrackerRegistry::processed_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return processed_signal_ids.size();
}

RegistryStatistics TrackerRegistry::get_statistics() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    RegistryStatistics statistics_snapshot = statistics;
    statistics_snapshot.active_count = active_trackers.size();
    statistics_snapshot.processed_count = processed_signal_ids.size();
    return statistics_snapshot;
}

} // namespace Core
} // namespace TruthTracker
