#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>

namespace TruthTracker {
namespace Config {

struct SystemConfig;

// Default location of the runtime CSV; overridden by TRUTH_TRACKER_CONFIG.
constexpr const char* DEFAULT_RUNTIME_CONFIG_PATH = "config/runtime_config.csv";
constexpr const char* RUNTIME_CONFIG_ENV_VARIABLE = "TRUTH_TRACKER_CONFIG";

// Config path after applying the environment override.
std::string resolve_runtime_config_path();

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns true on success.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Load complete system configuration. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& errorMessage);

// Split a ';'-separated config value into trimmed, non-empty entries.
std::vector<std::string> split_config_list(const std::string& value);

} // namespace Config
} // namespace TruthTracker

#endif // CONFIG_LOADER_HPP
