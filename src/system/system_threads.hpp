#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and performance monitoring
 * 
 * Contains thread handles and iteration counters. Thread bodies hold pointers
 * to the counters, so instances are neither copied nor moved.
 */
struct SystemThreads {
    // =========================================================================
    // THREAD HANDLES
    // =========================================================================
    std::thread ingestion_thread;   // Signal ingestion loop
    std::thread evaluation_thread;  // Outcome evaluation loop
    std::thread logger_thread;      // Logging system thread

    // =========================================================================
    // PERFORMANCE MONITORING
    // =========================================================================
    std::chrono::steady_clock::time_point start_time;  // System startup timestamp

    /// Thread iteration counters for performance monitoring
    std::atomic<unsigned long> ingestion_iterations{0};   // Ingestion scans completed
    std::atomic<unsigned long> evaluation_iterations{0};  // Evaluation ticks completed
    std::atomic<unsigned long> logger_iterations{0};      // Logger flushes performed

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

#endif // SYSTEM_THREADS_HPP
