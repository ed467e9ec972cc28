#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <cstddef>
#include <string>

namespace TruthTracker {
namespace Logging {

class StartupLogs {
public:
    static void log_application_header();
    static void log_configuration_summary(const Config::SystemConfig& config, const std::string& config_path);
    static void log_signal_source(const std::string& source_description, bool directory_exists);
    static void log_rehydration_result(size_t seeded_id_count, size_t malformed_line_count);
    static void log_rehydration_disabled();
};

} // namespace Logging
} // namespace TruthTracker

#endif // STARTUP_LOGS_HPP
