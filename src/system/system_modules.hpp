#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/market/http_market_data_provider.hpp"
#include "configs/runtime_settings.hpp"
#include "threads/system_threads/evaluation_thread.hpp"
#include "threads/system_threads/ingestion_thread.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "tracker/coordinators/evaluation_coordinator.hpp"
#include "tracker/coordinators/ingestion_coordinator.hpp"
#include "tracker/ingestion/authorization_policy.hpp"
#include "tracker/ingestion/directory_signal_source.hpp"
#include "tracker/registry/tracker_registry.hpp"
#include "tracker/truth_log/truth_logger.hpp"

/**
 * @brief Runtime module container
 * 
 * Holds active system modules as smart pointers for centralized ownership.
 * Members are declared in dependency order so destruction runs in reverse.
 */
struct SystemModules {
    // =========================================================================
    // TRACKING COMPONENTS
    // =========================================================================
    std::unique_ptr<TruthTracker::API::HttpMarketDataProvider> market_data_provider;   // Quote feed with fallback and cache
    std::unique_ptr<TruthTracker::Core::TrackerRegistry> tracker_registry;             // Active trackers and processed ids
    std::unique_ptr<TruthTracker::Core::AuthorizationPolicy> authorization_policy;     // Trusted tag allow-list
    std::unique_ptr<TruthTracker::Core::DirectorySignalSource> signal_source;          // Declaration file scanner
    std::unique_ptr<TruthTracker::Core::TruthLogger> truth_logger;                     // Partitioned append-only result log
    std::unique_ptr<TruthTracker::Config::StateFileAutoCloseSetting> auto_close_setting; // Hot auto-close setting

    // =========================================================================
    // COORDINATORS
    // =========================================================================
    std::unique_ptr<TruthTracker::Core::IngestionCoordinator> ingestion_coordinator;
    std::unique_ptr<TruthTracker::Core::EvaluationCoordinator> evaluation_coordinator;

    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<TruthTracker::Threads::IngestionThread> ingestion_thread;    // Signal ingestion loop
    std::unique_ptr<TruthTracker::Threads::EvaluationThread> evaluation_thread;  // Outcome evaluation loop
    std::unique_ptr<TruthTracker::Threads::LoggingThread> logging_thread;        // Run log writer
};

#endif // SYSTEM_MODULES_HPP
