#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include "system/system_modules.hpp"
#include "system/system_threads.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 * 
 * Contains configuration, modules, thread handles and synchronization primitives.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards loop waits and shutdown flags
    std::condition_variable cv;        // Wakes loops and the main thread on shutdown

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};               // Observed at the top of every loop iteration
    std::atomic<bool> shutdown_requested{false};   // Set by signals or a fatal persistence failure
    std::atomic<bool> persistence_failed{false};   // A truth log write failed; exit non-zero

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    TruthTracker::Config::SystemConfig config;                      // Complete system configuration
    std::string config_path;                                         // Where the configuration was loaded from
    ConnectivityManager connectivity_manager;                        // Quote feed connectivity state
    std::shared_ptr<TruthTracker::Logging::LoggingContext> logging_context;  // Logging context
    std::unique_ptr<SystemModules> tracking_modules;                 // All system modules
    SystemThreads thread_handles;                                    // Thread handles and counters

    explicit SystemState(const TruthTracker::Config::SystemConfig& initial)
        : config(initial), connectivity_manager(config.timing) {}
};

#endif // SYSTEM_STATE_HPP
