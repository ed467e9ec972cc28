#include "runtime_settings.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

using json = nlohmann::json;

namespace TruthTracker {
namespace Config {

StateFileAutoCloseSetting::StateFileAutoCloseSetting(const std::string& state_file_path, int default_auto_close_seconds)
    : runtime_state_file_path(state_file_path), fallback_auto_close_seconds(default_auto_close_seconds) {}

AutoCloseSetting StateFileAutoCloseSetting::read_auto_close_setting() const {
    AutoCloseSetting setting;
    setting.auto_close_seconds = fallback_auto_close_seconds;

    std::error_code existence_error;
    if (runtime_state_file_path.empty() || !std::filesystem::exists(runtime_state_file_path, existence_error)) {
        return setting;
    }

    std::ifstream state_stream(runtime_state_file_path);
    if (!state_stream.is_open()) {
        setting.read_error = "unable to open " + runtime_state_file_path;
        return setting;
    }

    try {
        json runtime_state = json::parse(state_stream);
        if (!runtime_state.is_object() || !runtime_state.contains("global") || !runtime_state["global"].is_object()) {
            return setting;
        }
        const json& global_settings = runtime_state["global"];
        if (!global_settings.contains("auto_close_seconds")) {
            return setting;
        }
        const json& auto_close_value = global_settings["auto_close_seconds"];
        if (!auto_close_value.is_number()) {
            setting.read_error = "global.auto_close_seconds is not a number";
            return setting;
        }
        // Range-checked as a double before the int conversion
        double configured_seconds = auto_close_value.get<double>();
        if (!(configured_seconds >= 1.0) || configured_seconds > static_cast<double>(std::numeric_limits<int>::max())) {
            setting.read_error = "global.auto_close_seconds must be between 1 and " +
                                 std::to_string(std::numeric_limits<int>::max());
            return setting;
        }
        setting.auto_close_seconds = static_cast<int>(configured_seconds);
        setting.read_from_state_file = true;
    } catch (const json::exception& state_exception_error) {
        setting.read_error = std::string("invalid runtime state JSON: ") + state_exception_error.what();
    }
    return setting;
}

} // namespace Config
} // namespace TruthTracker
