#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "logger/async_logger.hpp"
#include <algorithm>
#include <string>

// Startup-specific macros (no indentation for top-level sections)
#define LOG_STARTUP_SECTION_HEADER(title) log_message(std::string("+-- ") + title, "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Thread-agnostic macros
#define LOG_THREAD_SECTION_HEADER(title) log_message(std::string("+-- ") + title, "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

// Specialized thread macros for common patterns
#define LOG_THREAD_SIGNAL_ADMITTED_HEADER(signal_id) LOG_THREAD_SECTION_HEADER("SIGNAL ADMITTED - " + std::string(signal_id))
#define LOG_THREAD_SIGNAL_RESOLVED_HEADER(signal_id) LOG_THREAD_SECTION_HEADER("SIGNAL RESOLVED - " + std::string(signal_id))
#define LOG_THREAD_STATUS_HEADER() LOG_THREAD_SECTION_HEADER("TRACKER STATUS")

// Comprehensive table formatting macros for structured logging
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬──────────────────────────────────────────────────┐"); \
    LOG_THREAD_CONTENT("│ " + std::string(title).substr(0,17) + std::string(17 - std::min(17, (int)std::string(title).length()), ' ') + " │ " + std::string(subtitle).substr(0,48) + std::string(48 - std::min(48, (int)std::string(subtitle).length()), ' ') + " │"); \
    LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while(0)

#define TABLE_ROW_48(label, value) do { \
    std::string label_str = std::string(label).substr(0,17); \
    std::string value_str = std::string(value).substr(0,48); \
    LOG_THREAD_CONTENT("│ " + label_str + std::string(17 - label_str.length(), ' ') + " │ " + value_str + std::string(48 - value_str.length(), ' ') + " │"); \
} while(0)

#define TABLE_SEPARATOR_48() do { \
    LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while(0)

#define TABLE_FOOTER_48() do { \
    LOG_THREAD_CONTENT("└───────────────────┴──────────────────────────────────────────────────┘"); \
} while(0)

#endif // LOGGING_MACROS_HPP
