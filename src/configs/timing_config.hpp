// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

namespace TruthTracker {
namespace Config {

struct TimingConfig {
    // ========================================================================
    // THREAD POLLING INTERVALS
    // ========================================================================

    int ingestion_poll_interval_sec;                 // Signal directory scan interval in seconds
    int evaluation_poll_interval_sec;                // Outcome evaluation tick interval in seconds
    int logging_poll_interval_sec;                   // Logging thread flush interval in seconds
    int status_report_interval_sec;                  // Main loop status line interval in seconds

    // ========================================================================
    // THREAD LIFECYCLE MANAGEMENT
    // ========================================================================

    int thread_startup_sequence_delay_milliseconds;  // Delay before a thread enters its loop

    // ========================================================================
    // CONNECTIVITY BACKOFF
    // ========================================================================

    int connectivity_max_retry_delay_seconds;        // Upper bound for exponential backoff
    int connectivity_degraded_threshold;             // Consecutive failures before DEGRADED
    int connectivity_disconnected_threshold;         // Consecutive failures before DISCONNECTED
    double connectivity_backoff_multiplier;          // Backoff growth factor (> 1.0)

    TimingConfig()
        : ingestion_poll_interval_sec(2),
          evaluation_poll_interval_sec(1),
          logging_poll_interval_sec(1),
          status_report_interval_sec(30),
          thread_startup_sequence_delay_milliseconds(100),
          connectivity_max_retry_delay_seconds(60),
          connectivity_degraded_threshold(3),
          connectivity_disconnected_threshold(10),
          connectivity_backoff_multiplier(2.0) {}
};

} // namespace Config
} // namespace TruthTracker

#endif // TIMING_CONFIG_HPP
