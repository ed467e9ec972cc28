#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace TruthTracker {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<TruthTracker::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - config, logging foundation, modules and dedup rehydration
SystemInitializationResult initialize();

// System lifecycle management
void startup(SystemState& system_state, std::shared_ptr<TruthTracker::Logging::AsyncLogger> logger);
void run(SystemState& system_state);

// Stops and joins every thread. Returns the process exit code.
int shutdown(SystemState& system_state, std::shared_ptr<TruthTracker::Logging::AsyncLogger> logger);

} // namespace System
} // namespace TruthTracker

#endif // SYSTEM_MANAGER_HPP
