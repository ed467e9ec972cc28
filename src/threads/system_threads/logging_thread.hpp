#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <memory>
#include "logging/logger/async_logger.hpp"
#include "configs/timing_config.hpp"

namespace TruthTracker {
namespace Threads {

class LoggingThread {
public:
    LoggingThread(std::shared_ptr<TruthTracker::Logging::AsyncLogger> logger,
                  std::atomic<unsigned long>& iterations,
                  const TruthTracker::Config::TimingConfig& timing_config)
        : logger_ptr(logger), logger_iterations(&iterations), timing(timing_config) {}

    void operator()();

private:
    std::shared_ptr<TruthTracker::Logging::AsyncLogger> logger_ptr;
    std::atomic<unsigned long>* logger_iterations;
    const TruthTracker::Config::TimingConfig& timing;

    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace TruthTracker

#endif // LOGGING_THREAD_HPP
