#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <chrono>
#include <mutex>
#include <string>
#include "configs/timing_config.hpp"

/**
 * ConnectivityManager - Reachability of the quote feed
 *
 * Every request to the quotes endpoints (primary and fallbacks) reports here.
 * Consecutive transport failures move the feed from CONNECTED to DEGRADED to
 * DISCONNECTED; while not CONNECTED the next request waits out an
 * exponentially growing backoff. One success restores the feed.
 */
class ConnectivityManager {
public:
    enum class ConnectionStatus {
        CONNECTED,          // Quote requests answering
        DEGRADED,           // Failing, still requested every tick once backoff expires
        DISCONNECTED        // Failing repeatedly; evaluation runs on the cached snapshot
    };

    struct ConnectivityState {
        ConnectionStatus status = ConnectionStatus::CONNECTED;
        std::chrono::steady_clock::time_point last_success;
        std::chrono::steady_clock::time_point last_failure;
        std::chrono::steady_clock::time_point next_retry_time;
        int consecutive_failures = 0;
        int retry_delay_seconds = 1;
        std::string last_error_message;
    };

    explicit ConnectivityManager(const TruthTracker::Config::TimingConfig& timing_config);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    void report_success();
    void report_failure(const std::string& error_message);

    // False while backing off from a failing feed
    bool should_attempt_connection() const;
    int get_seconds_until_retry() const;

    ConnectionStatus get_status() const;
    ConnectivityState get_state() const;
    std::string get_status_string() const;

    // One line for the status report, e.g. "DEGRADED (3 failures, retry in 8s): timeout"
    std::string describe_feed_state() const;

private:
    ConnectionStatus status_for_failure_count(int consecutive_failures) const;
    int seconds_until_retry_locked(std::chrono::steady_clock::time_point now) const;

    mutable std::mutex state_mutex;
    ConnectivityState feed_state;
    int max_retry_delay_seconds;
    int degraded_threshold;
    int disconnected_threshold;
    double backoff_multiplier;
};

std::string connection_status_to_string(ConnectivityManager::ConnectionStatus status);

#endif // CONNECTIVITY_MANAGER_HPP
