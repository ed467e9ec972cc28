#ifndef RUNTIME_SETTINGS_HPP
#define RUNTIME_SETTINGS_HPP

#include <string>

namespace TruthTracker {
namespace Config {

struct AutoCloseSetting {
    int auto_close_seconds;
    bool read_from_state_file;
    std::string read_error;     // set when the state file exists but could not be used

    AutoCloseSetting() : auto_close_seconds(0), read_from_state_file(false) {}
};

// Hot setting consulted on every evaluation tick
class AutoCloseSettingSource {
public:
    virtual ~AutoCloseSettingSource() = default;
    virtual AutoCloseSetting read_auto_close_setting() const = 0;
};

/**
 * Reads global.auto_close_seconds from a JSON runtime state file on every call.
 * A missing file, missing key or unusable value yields the configured default.
 */
class StateFileAutoCloseSetting : public AutoCloseSettingSource {
public:
    StateFileAutoCloseSetting(const std::string& state_file_path, int default_auto_close_seconds);

    AutoCloseSetting read_auto_close_setting() const override;

private:
    std::string runtime_state_file_path;
    int fallback_auto_close_seconds;
};

} // namespace Config
} // namespace TruthTracker

#endif // RUNTIME_SETTINGS_HPP
