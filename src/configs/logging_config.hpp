// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace TruthTracker {
namespace Config {

struct LoggingConfig {
    std::string log_file;                  // Base name of the run log inside the run folder
    std::string runtime_logs_directory;    // Parent directory for run folders
    std::string forex_truth_log_path;      // Truth log partition for pip-measured signals
    std::string crypto_truth_log_path;     // Truth log partition for dollar-measured signals

    LoggingConfig()
        : log_file("truth_tracker.log"),
          runtime_logs_directory("runtime_logs"),
          forex_truth_log_path("truth_log.jsonl"),
          crypto_truth_log_path("truth_log_crypto.jsonl") {}
};

} // namespace Config
} // namespace TruthTracker

#endif // LOGGING_CONFIG_HPP
