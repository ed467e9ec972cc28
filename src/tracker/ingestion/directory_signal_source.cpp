#include "directory_signal_source.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fnmatch.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace TruthTracker {
namespace Core {

namespace {
    double file_modification_epoch_seconds(const std::filesystem::path& file_path) {
        std::error_code modification_time_error;
        auto file_time = std::filesystem::last_write_time(file_path, modification_time_error);
        if (modification_time_error) {
            return 0.0;
        }
        // file_clock and system_clock share an epoch offset that is fixed for the process
        auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            file_time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
        return std::chrono::duration_cast<std::chrono::duration<double>>(system_time.time_since_epoch()).count();
    }
}

DirectorySignalSource::DirectorySignalSource(const std::string& directory_path, const std::vector<std::string>& file_name_patterns)
    : signals_directory_path(directory_path), accepted_file_patterns(file_name_patterns) {}

bool DirectorySignalSource::matches_any_pattern(const std::string& file_name) const {
    for (const std::string& file_pattern : accepted_file_patterns) {
        if (fnmatch(file_pattern.c_str(), file_name.c_str(), 0) == 0) {
            return true;
        }
    }
    return false;
}

std::vector<SignalDeclaration> DirectorySignalSource::poll_new_declarations() {
    std::vector<SignalDeclaration> new_declarations;
    if (!directory_exists()) {
        return new_declarations;
    }

    std::vector<std::filesystem::path> candidate_paths;
    std::error_code iteration_error;
    for (std::filesystem::directory_iterator entry_iterator(signals_directory_path, iteration_error), end_iterator;
         !iteration_error && entry_iterator != end_iterator; entry_iterator.increment(iteration_error)) {
        const std::filesystem::directory_entry& signal_file_entry = *entry_iterator;
        std::error_code entry_type_error;
        if (!signal_file_entry.is_regular_file(entry_type_error)) {
            continue;
        }
        std::string file_name = signal_file_entry.path().filename().string();
        if (matches_any_pattern(file_name)) {
            candidate_paths.push_back(signal_file_entry.path());
        }
    }
    if (iteration_error) {
        throw std::runtime_error("Failed to list signals directory " + signals_directory_path + ": " + iteration_error.message());
    }

    std::sort(candidate_paths.begin(), candidate_paths.end());

    std::lock_guard<std::mutex> lock(seen_files_mutex);
    for (const std::filesystem::path& candidate_path : candidate_paths) {
        std::string file_name = candidate_path.filename().string();
        if (!seen_file_names.insert(file_name).second) {
            continue;
        }

        SignalDeclaration declaration;
        declaration.origin_name = file_name;
        declaration.modified_at = file_modification_epoch_seconds(candidate_path);

        std::ifstream declaration_stream(candidate_path);
        if (!declaration_stream.is_open()) {
            declaration.read_error = "unable to open " + candidate_path.string();
        } else {
            std::stringstream content_buffer;
            content_buffer << declaration_stream.rdbuf();
            declaration.raw_content = content_buffer.str();
        }
        new_declarations.push_back(std::move(declaration));
    }
    return new_declarations;
}

void DirectorySignalSource::reset() {
    std::lock_guard<std::mutex> lock(seen_files_mutex);
    seen_file_names.clear();
}

std::string DirectorySignalSource::describe() const {
    std::string pattern_list;
    for (const std::string& file_pattern : accepted_file_patterns) {
        if (!pattern_list.empty()) pattern_list += ", ";
        pattern_list += file_pattern;
    }
    return signals_directory_path + " [" + pattern_list + "]";
}

bool DirectorySignalSource::directory_exists() const {
    std::error_code status_error;
    return std::filesystem::is_directory(signals_directory_path, status_error);
}

size_t DirectorySignalSource::seen_file_count() const {
    std::lock_guard<std::mutex> lock(seen_files_mutex);
    return seen_file_names.size();
}

} // namespace Core
} // namespace TruthTracker
