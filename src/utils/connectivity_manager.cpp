#include "connectivity_manager.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {
    void validate_feed_backoff(const TruthTracker::Config::TimingConfig& timing_config) {
        if (timing_config.connectivity_max_retry_delay_seconds <= 0) {
            throw std::runtime_error("Quote feed backoff: timing.connectivity_max_retry_delay_seconds must be > 0");
        }
        if (timing_config.connectivity_degraded_threshold <= 0) {
            throw std::runtime_error("Quote feed backoff: timing.connectivity_degraded_threshold must be > 0");
        }
        if (timing_config.connectivity_disconnected_threshold <= timing_config.connectivity_degraded_threshold) {
            throw std::runtime_error("Quote feed backoff: timing.connectivity_disconnected_threshold must exceed the degraded threshold");
        }
        if (timing_config.connectivity_backoff_multiplier <= 1.0) {
            throw std::runtime_error("Quote feed backoff: timing.connectivity_backoff_multiplier must be > 1.0");
        }
    }
}

ConnectivityManager::ConnectivityManager(const TruthTracker::Config::TimingConfig& timing_config)
    : max_retry_delay_seconds(timing_config.connectivity_max_retry_delay_seconds),
      degraded_threshold(timing_config.connectivity_degraded_threshold),
      disconnected_threshold(timing_config.connectivity_disconnected_threshold),
      backoff_multiplier(timing_config.connectivity_backoff_multiplier) {
    validate_feed_backoff(timing_config);

    auto now = std::chrono::steady_clock::now();
    feed_state.last_success = now;
    feed_state.next_retry_time = now;
}

ConnectivityManager::ConnectionStatus ConnectivityManager::status_for_failure_count(int consecutive_failures) const {
    if (consecutive_failures >= disconnected_threshold) {
        return ConnectionStatus::DISCONNECTED;
    }
    if (consecutive_failures >= degraded_threshold) {
        return ConnectionStatus::DEGRADED;
    }
    return ConnectionStatus::CONNECTED;
}

void ConnectivityManager::report_success() {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    auto now = std::chrono::steady_clock::now();

    feed_state = ConnectivityState();
    feed_state.last_success = now;
    feed_state.next_retry_time = now;
}

void ConnectivityManager::report_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    auto now = std::chrono::steady_clock::now();

    feed_state.consecutive_failures++;
    feed_state.last_failure = now;
    feed_state.last_error_message = error_message;
    feed_state.status = status_for_failure_count(feed_state.consecutive_failures);

    // Backoff grows at least one second per failure until the cap
    int grown_delay = static_cast<int>(std::ceil(feed_state.retry_delay_seconds * backoff_multiplier));
    feed_state.retry_delay_seconds = std::min(std::max(grown_delay, feed_state.retry_delay_seconds + 1),
                                              max_retry_delay_seconds);
    feed_state.next_retry_time = now + std::chrono::seconds(feed_state.retry_delay_seconds);
}

int ConnectivityManager::seconds_until_retry_locked(std::chrono::steady_clock::time_point now) const {
    if (feed_state.next_retry_time <= now) {
        return 0;
    }
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(feed_state.next_retry_time - now).count());
}

bool ConnectivityManager::should_attempt_connection() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return feed_state.status == ConnectionStatus::CONNECTED ||
           seconds_until_retry_locked(std::chrono::steady_clock::now()) == 0;
}

int ConnectivityManager::get_seconds_until_retry() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return seconds_until_retry_locked(std::chrono::steady_clock::now());
}

ConnectivityManager::ConnectionStatus ConnectivityManager::get_status() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return feed_state.status;
}

ConnectivityManager::ConnectivityState ConnectivityManager::get_state() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    return feed_state;
}

std::string ConnectivityManager::get_status_string() const {
    return connection_status_to_string(get_status());
}

std::string ConnectivityManager::describe_feed_state() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    std::string description = connection_status_to_string(feed_state.status);
    if (feed_state.consecutive_failures == 0) {
        return description;
    }

    description += " (" + std::to_string(feed_state.consecutive_failures) + " failures, retry in " +
                   std::to_string(seconds_until_retry_locked(std::chrono::steady_clock::now())) + "s)";
    if (!feed_state.last_error_message.empty()) {
        description += ": " + feed_state.last_error_message;
    }
    return description;
}

std::string connection_status_to_string(ConnectivityManager::ConnectionStatus status) {
    switch (status) {
        case ConnectivityManager::ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectivityManager::ConnectionStatus::DEGRADED:
            return "DEGRADED";
        case ConnectivityManager::ConnectionStatus::DISCONNECTED:
            return "DISCONNECTED";
        default:
            return "UNKNOWN";
    }
}
