#ifndef THREAD_MANAGER_HPP
#define THREAD_MANAGER_HPP

#include "logging/logger/async_logger.hpp"
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace TruthTracker {
namespace Core {

namespace ThreadSystem {

// A named thread body and the handle it is started into
struct ThreadDefinition {
    std::string name;
    std::function<void()> thread_function;
    std::thread* thread_handle;

    ThreadDefinition(const std::string& thread_name, std::function<void()> function, std::thread& handle)
        : name(thread_name), thread_function(std::move(function)), thread_handle(&handle) {}
};

} // namespace ThreadSystem

class Manager {
public:
    // Starts every definition with the caller's logging context installed. Returns the number started.
    static int start_threads(const std::vector<ThreadSystem::ThreadDefinition>& thread_definitions,
                             TruthTracker::Logging::LoggingContext& logging_context);

    // Joins one handle if it is joinable. Returns false if the join threw.
    static bool join_thread(const std::string& thread_name, std::thread& thread_handle);
};

} // namespace Core
} // namespace TruthTracker

#endif // THREAD_MANAGER_HPP
