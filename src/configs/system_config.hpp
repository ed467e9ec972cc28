#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "authorization_config.hpp"
#include "logging_config.hpp"
#include "market_data_config.hpp"
#include "timing_config.hpp"
#include "tracking_config.hpp"

namespace TruthTracker {
namespace Config {

/**
 * Main tracking engine configuration.
 */
struct SystemConfig {
    SystemConfig() {}

    MarketDataConfig market_data;        // Quote feed endpoint and transport settings
    TimingConfig timing;                 // Loop intervals and connectivity backoff
    TrackingConfig tracking;             // Signal source, exit policy and dedup settings
    AuthorizationConfig authorization;   // Trusted generator tags per unit system
    LoggingConfig logging;               // Run log and truth log partitions
};

} // namespace Config
} // namespace TruthTracker

#endif // SYSTEM_CONFIG_HPP
