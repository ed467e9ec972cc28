#include "system_manager.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "configs/config_loader.hpp"
#include "configs/system_config.hpp"
#include "threads/thread_logic/thread_manager.hpp"
#include "tracker/truth_log/truth_log_reader.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace TruthTracker::Logging;
using namespace TruthTracker::Threads;

namespace TruthTracker {
namespace System {

static void rehydrate_processed_ids(SystemState& state) {
    if (!state.config.tracking.rehydrate_processed_ids) {
        StartupLogs::log_rehydration_disabled();
        return;
    }

    std::vector<std::string> partition_paths{
        state.config.logging.forex_truth_log_path,
        state.config.logging.crypto_truth_log_path
    };

    size_t seeded_id_count = 0;
    size_t malformed_line_count = 0;
    for (const std::string& partition_path : partition_paths) {
        std::vector<std::string> logged_signal_ids = TruthTracker::Core::collect_logged_signal_ids(partition_path, malformed_line_count);
        seeded_id_count += state.tracking_modules->tracker_registry->seed_processed_ids(logged_signal_ids);
    }

    StartupLogs::log_rehydration_result(seeded_id_count, malformed_line_count);
}

static void create_tracking_modules(SystemState& state, std::shared_ptr<AsyncLogger> logger) {
    auto modules = std::make_unique<SystemModules>();
    const TruthTracker::Config::SystemConfig& config = state.config;

    modules->market_data_provider = std::make_unique<TruthTracker::API::HttpMarketDataProvider>(config.market_data, state.connectivity_manager);
    modules->tracker_registry = std::make_unique<TruthTracker::Core::TrackerRegistry>();
    modules->authorization_policy = std::make_unique<TruthTracker::Core::AuthorizationPolicy>(config.authorization);
    modules->signal_source = std::make_unique<TruthTracker::Core::DirectorySignalSource>(config.tracking.signals_directory,
                                                                                         config.tracking.signal_file_patterns);
    modules->truth_logger = std::make_unique<TruthTracker::Core::TruthLogger>(config.logging, *modules->authorization_policy);
    modules->auto_close_setting = std::make_unique<TruthTracker::Config::StateFileAutoCloseSetting>(config.tracking.runtime_state_path,
                                                                                                    config.tracking.default_auto_close_seconds);

    modules->ingestion_coordinator = std::make_unique<TruthTracker::Core::IngestionCoordinator>(
        *modules->signal_source, *modules->authorization_policy, *modules->tracker_registry);
    modules->evaluation_coordinator = std::make_unique<TruthTracker::Core::EvaluationCoordinator>(
        *modules->tracker_registry, *modules->market_data_provider, *modules->truth_logger,
        *modules->auto_close_setting, config.tracking);

    // Create INGESTION thread
    modules->ingestion_thread = std::make_unique<IngestionThread>(*modules->ingestion_coordinator, config.timing,
                                                                  state.mtx, state.cv, state.running);
    modules->ingestion_thread->set_iteration_counter(state.thread_handles.ingestion_iterations);

    // Create EVALUATION thread
    modules->evaluation_thread = std::make_unique<EvaluationThread>(*modules->evaluation_coordinator, config.timing,
                                                                    state.mtx, state.cv, state.running,
                                                                    state.shutdown_requested, state.persistence_failed);
    modules->evaluation_thread->set_iteration_counter(state.thread_handles.evaluation_iterations);

    // Create LOGGING thread
    modules->logging_thread = std::make_unique<LoggingThread>(logger, state.thread_handles.logger_iterations, config.timing);

    state.tracking_modules = std::move(modules);
}

SystemInitializationResult initialize() {
    SystemInitializationResult initialization_result;

    try {
        // Initialize minimal logging context early - required before any logging calls
        auto early_logging_context = std::make_shared<LoggingContext>();
        set_logging_context(*early_logging_context);

        TruthTracker::Config::SystemConfig initial_config;
        int config_load_result = TruthTracker::Config::load_system_config(initial_config);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->config_path = TruthTracker::Config::resolve_runtime_config_path();
        initialization_result.system_state->logging_context = early_logging_context;

        // Validates the configuration, creates the run folder and the async logger
        initialization_result.logger = initialize_application_foundation(initialization_result.system_state->config);

        StartupLogs::log_application_header();
        StartupLogs::log_configuration_summary(initialization_result.system_state->config,
                                               initialization_result.system_state->config_path);

        create_tracking_modules(*initialization_result.system_state, initialization_result.logger);
        rehydrate_processed_ids(*initialization_result.system_state);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

void startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context || !system_state.tracking_modules) {
        throw std::runtime_error("System startup failed: initialize() must run before startup()");
    }

    SystemModules& modules = *system_state.tracking_modules;
    SystemThreads& handles = system_state.thread_handles;

    StartupLogs::log_signal_source(modules.signal_source->describe(), modules.signal_source->directory_exists());

    // Thread bodies are owned by the modules; the lambdas only forward to them
    IngestionThread* ingestion_thread_ptr = modules.ingestion_thread.get();
    EvaluationThread* evaluation_thread_ptr = modules.evaluation_thread.get();
    LoggingThread* logging_thread_ptr = modules.logging_thread.get();

    std::vector<TruthTracker::Core::ThreadSystem::ThreadDefinition> thread_definitions{
        TruthTracker::Core::ThreadSystem::ThreadDefinition("LOGGER", [logging_thread_ptr]() { (*logging_thread_ptr)(); }, handles.logger_thread),
        TruthTracker::Core::ThreadSystem::ThreadDefinition("INGESTION", [ingestion_thread_ptr]() { (*ingestion_thread_ptr)(); }, handles.ingestion_thread),
        TruthTracker::Core::ThreadSystem::ThreadDefinition("EVALUATION", [evaluation_thread_ptr]() { (*evaluation_thread_ptr)(); }, handles.evaluation_thread)
    };

    int expected_thread_count = static_cast<int>(thread_definitions.size());
    int actual_thread_count = TruthTracker::Core::Manager::start_threads(thread_definitions, *system_state.logging_context);
    SystemLogs::log_threads_started(expected_thread_count, actual_thread_count);

    if (actual_thread_count != expected_thread_count) {
        throw std::runtime_error("Thread startup failed");
    }

    SystemLogs::log_startup_complete();
}

static void log_status_report(SystemState& state) {
    SystemModules& modules = *state.tracking_modules;
    SystemLogs::log_status_report(modules.tracker_registry->get_statistics(),
                                  modules.market_data_provider->get_snapshot_age_seconds(),
                                  state.connectivity_manager.describe_feed_state());
}

static void run_until_shutdown(SystemState& state) {
    auto last_status_time = std::chrono::steady_clock::now();

    while (state.running.load() && !state.shutdown_requested.load()) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_status_time).count() >=
                state.config.timing.status_report_interval_sec) {
                log_status_report(state);
                last_status_time = now;
            }

            // Signal handlers only set flags, so the wait is bounded
            std::unique_lock<std::mutex> state_lock(state.mtx);
            state.cv.wait_for(state_lock, std::chrono::seconds(1),
                              [&state] { return state.shutdown_requested.load() || !state.running.load(); });
        } catch (const std::exception& exception_error) {
            SystemLogs::log_main_loop_error(exception_error.what());
        }
    }
}

void run(SystemState& system_state) {
    run_until_shutdown(system_state);
}

int shutdown(SystemState& system_state, std::shared_ptr<AsyncLogger> logger) {
    int exit_code = 0;

    try {
        SystemLogs::log_shutdown_requested(system_state.persistence_failed.load() ? "truth log write failure" : "signal");

        {
            std::lock_guard<std::mutex> state_lock(system_state.mtx);
            system_state.running.store(false);
            system_state.shutdown_requested.store(true);
        }
        system_state.cv.notify_all();

        SystemThreads& handles = system_state.thread_handles;
        bool ingestion_joined = TruthTracker::Core::Manager::join_thread("INGESTION", handles.ingestion_thread);
        bool evaluation_joined = TruthTracker::Core::Manager::join_thread("EVALUATION", handles.evaluation_thread);
        if (!ingestion_joined || !evaluation_joined) {
            SystemLogs::log_system_shutdown_error("Failed to join tracking threads");
            exit_code = 1;
        }

        if (system_state.persistence_failed.load()) {
            exit_code = 1;
        }

        if (system_state.tracking_modules) {
            log_status_report(system_state);
        }
        SystemLogs::log_shutdown_complete(exit_code);

        // Logger goes last so the lines above still reach the run log
        if (logger) {
            shutdown_global_logger(*logger);
        }
        TruthTracker::Core::Manager::join_thread("LOGGER", handles.logger_thread);
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error("Exception in shutdown: " + std::string(shutdown_exception_error.what()));
        exit_code = 1;
    }

    return exit_code;
}

} // namespace System
} // namespace TruthTracker
