#ifndef INGESTION_THREAD_HPP
#define INGESTION_THREAD_HPP

#include "configs/timing_config.hpp"
#include "tracker/coordinators/ingestion_coordinator.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace TruthTracker {
namespace Threads {

struct IngestionThread {
    Core::IngestionCoordinator& ingestion_coordinator;
    const Config::TimingConfig& timing;
    std::mutex& state_mtx;
    std::condition_variable& state_cv;
    std::atomic<bool>& running;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    IngestionThread(Core::IngestionCoordinator& coordinator,
                    const Config::TimingConfig& timing_config,
                    std::mutex& mtx,
                    std::condition_variable& cv,
                    std::atomic<bool>& running_flag)
        : ingestion_coordinator(coordinator), timing(timing_config), state_mtx(mtx), state_cv(cv),
          running(running_flag) {}

    // Set iteration counter for monitoring
    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

    // Thread entrypoint
    void operator()();

private:
    void execute_ingestion_loop();
    void wait_for_next_scan();
};

} // namespace Threads
} // namespace TruthTracker

#endif // INGESTION_THREAD_HPP
