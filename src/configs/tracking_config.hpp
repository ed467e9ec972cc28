#ifndef TRACKING_CONFIG_HPP
#define TRACKING_CONFIG_HPP

#include <string>
#include <vector>

namespace TruthTracker {
namespace Config {

struct TrackingConfig {
    // ========================================================================
    // SIGNAL SOURCE
    // ========================================================================

    std::string signals_directory;                 // Directory scanned for declaration files
    std::vector<std::string> signal_file_patterns; // Accepted file name globs

    // ========================================================================
    // EXIT POLICY
    // ========================================================================

    int default_auto_close_seconds;                // Used when the runtime state file has no value
    int max_tracking_seconds;                      // Hard ceiling before TIMEOUT
    std::string runtime_state_path;                // JSON file holding global.auto_close_seconds

    // ========================================================================
    // DEDUPLICATION
    // ========================================================================

    bool rehydrate_processed_ids;                  // Seed processed ids from truth logs at startup

    TrackingConfig()
        : signals_directory("missions"),
          signal_file_patterns{"mission_*.json", "5_*_USER*.json"},
          default_auto_close_seconds(7200),
          max_tracking_seconds(86400),
          runtime_state_path("citadel_state.json"),
          rehydrate_processed_ids(true) {}
};

} // namespace Config
} // namespace TruthTracker

#endif // TRACKING_CONFIG_HPP
