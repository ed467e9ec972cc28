#ifndef EVALUATION_THREAD_HPP
#define EVALUATION_THREAD_HPP

#include "configs/timing_config.hpp"
#include "tracker/coordinators/evaluation_coordinator.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace TruthTracker {
namespace Threads {

struct EvaluationThread {
    Core::EvaluationCoordinator& evaluation_coordinator;
    const Config::TimingConfig& timing;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<bool>& shutdown_requested;
    std::atomic<bool>& persistence_failed;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    EvaluationThread(Core::EvaluationCoordinator& coordinator,
                     const Config::TimingConfig& timing_config,
                     std::mutex& mtx,
                     std::condition_variable& cv,
                     std::atomic<bool>& running_flag,
                     std::atomic<bool>& shutdown_requested_flag,
                     std::atomic<bool>& persistence_failed_flag)
        : evaluation_coordinator(coordinator), timing(timing_config), state_mtx(mtx), state_cv(cv),
          running(running_flag), shutdown_requested(shutdown_requested_flag),
          persistence_failed(persistence_failed_flag) {}

    // Set iteration counter for monitoring
    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

    // Thread entrypoint
    void operator()();

private:
    void execute_evaluation_loop();
    void handle_persistence_failure(const Core::TruthLogWriteError& write_error);
    void wait_for_next_tick();
};

} // namespace Threads
} // namespace TruthTracker

#endif // EVALUATION_THREAD_HPP
