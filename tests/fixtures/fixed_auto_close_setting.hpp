#pragma once
#include <string>
#include "configs/runtime_settings.hpp"

/// Auto-close setting the test can change between ticks
namespace fixtures {

class FixedAutoCloseSetting : public TruthTracker::Config::AutoCloseSettingSource {
public:
    explicit FixedAutoCloseSetting(int seconds) : auto_close_seconds(seconds) {}

    TruthTracker::Config::AutoCloseSetting read_auto_close_setting() const override {
        TruthTracker::Config::AutoCloseSetting setting;
        setting.auto_close_seconds = auto_close_seconds;
        setting.read_from_state_file = true;
        setting.read_error = read_error;
        return setting;
    }

    int auto_close_seconds;
    std::string read_error;
};

} // namespace fixtures
