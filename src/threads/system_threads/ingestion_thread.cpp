/**
 * Signal ingestion thread.
 *
 * Polls the signal source, gates each declaration on the allow-list and
 * admits complete, trusted signals into the tracker registry.
 */
#include "ingestion_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/ingestion_logs.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <thread>

using namespace TruthTracker::Threads;
using namespace TruthTracker::Logging;
using namespace TruthTracker::Core;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void IngestionThread::operator()() {
    set_log_thread_tag("INGEST");

    try {
        IngestionLogs::log_thread_startup(timing.ingestion_poll_interval_sec);

        // Wait for main thread to finish starting the other threads
        std::this_thread::sleep_for(std::chrono::milliseconds(timing.thread_startup_sequence_delay_milliseconds));

        execute_ingestion_loop();
    } catch (const std::exception& exception_error) {
        IngestionLogs::log_thread_exception(exception_error.what());
    }
}

void IngestionThread::execute_ingestion_loop() {
    while (running.load()) {
        try {
            ingestion_coordinator.run_ingestion_cycle(TimeUtils::get_current_epoch_seconds());

            if (iteration_counter) {
                iteration_counter->fetch_add(1);
            }
        } catch (const std::exception& exception_error) {
            IngestionLogs::log_loop_iteration_exception(exception_error.what());
        }

        wait_for_next_scan();
    }
}

void IngestionThread::wait_for_next_scan() {
    std::unique_lock<std::mutex> state_lock(state_mtx);
    state_cv.wait_for(state_lock, std::chrono::seconds(timing.ingestion_poll_interval_sec),
                      [this] { return !running.load(); });
}
