// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <memory>

using namespace TruthTracker::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only lock-free flag stores happen here; the main loop polls them
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                state->shutdown_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Fatal error: libcurl global initialization failed" << std::endl;
        return 1;
    }

    int exit_code = 1;
    try {
        SystemInitializationResult initialization_result = initialize();

        ShutdownHandler::get_instance().set_system_state(initialization_result.system_state.get());
        // A signal that arrived during initialization had no state to flag yet
        if (ShutdownHandler::get_instance().is_shutdown_requested()) {
            initialization_result.system_state->shutdown_requested.store(true);
        }

        try {
            startup(*initialization_result.system_state, initialization_result.logger);
            run(*initialization_result.system_state);
        } catch (const std::exception& exception_error) {
            TruthTracker::Logging::SystemLogs::log_system_startup_error(exception_error.what());
            // Threads that did start still have to be joined
            shutdown(*initialization_result.system_state, initialization_result.logger);
            ShutdownHandler::get_instance().set_system_state(nullptr);
            curl_global_cleanup();
            return 1;
        }

        exit_code = shutdown(*initialization_result.system_state, initialization_result.logger);
        ShutdownHandler::get_instance().set_system_state(nullptr);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        exit_code = 1;
    }

    curl_global_cleanup();
    return exit_code;
}
