/**
 * Outcome evaluation thread.
 *
 * Once per tick: fetch quotes, advance every active tracker, resolve the
 * terminal ones and append their results to the truth log. A failed truth
 * log write stops this loop and asks the main thread to shut down.
 */
#include "evaluation_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/evaluation_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <thread>

using namespace TruthTracker::Threads;
using namespace TruthTracker::Logging;
using namespace TruthTracker::Core;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void EvaluationThread::operator()() {
    set_log_thread_tag("EVAL");

    try {
        EvaluationLogs::log_thread_startup(timing.evaluation_poll_interval_sec);

        std::this_thread::sleep_for(std::chrono::milliseconds(timing.thread_startup_sequence_delay_milliseconds));

        execute_evaluation_loop();
    } catch (const std::exception& exception_error) {
        EvaluationLogs::log_thread_exception(exception_error.what());
    }
}

void EvaluationThread::execute_evaluation_loop() {
    while (running.load()) {
        try {
            evaluation_coordinator.run_evaluation_cycle(TimeUtils::get_current_epoch_seconds());

            if (iteration_counter) {
                iteration_counter->fetch_add(1);
            }
        } catch (const TruthLogWriteError& write_exception_error) {
            handle_persistence_failure(write_exception_error);
            return;
        } catch (const std::exception& exception_error) {
            EvaluationLogs::log_loop_iteration_exception(exception_error.what());
        }

        wait_for_next_tick();
    }
}

void EvaluationThread::handle_persistence_failure(const TruthLogWriteError& write_error) {
    SystemLogs::log_persistence_failure_alert(write_error.what(), write_error.get_record_line());

    {
        std::lock_guard<std::mutex> state_lock(state_mtx);
        persistence_failed.store(true);
        shutdown_requested.store(true);
    }
    state_cv.notify_all();
}

void EvaluationThread::wait_for_next_tick() {
    std::unique_lock<std::mutex> state_lock(state_mtx);
    state_cv.wait_for(state_lock, std::chrono::seconds(timing.evaluation_poll_interval_sec),
                      [this] { return !running.load(); });
}
