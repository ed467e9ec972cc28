#ifndef DIRECTORY_SIGNAL_SOURCE_HPP
#define DIRECTORY_SIGNAL_SOURCE_HPP

#include "signal_source.hpp"
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace TruthTracker {
namespace Core {

/**
 * SignalSource backed by a directory of JSON files.
 * A file is handed out once per process lifetime, whether or not it parses.
 */
class DirectorySignalSource : public SignalSource {
public:
    DirectorySignalSource(const std::string& directory_path, const std::vector<std::string>& file_name_patterns);

    std::vector<SignalDeclaration> poll_new_declarations() override;
    void reset() override;
    std::string describe() const override;

    bool directory_exists() const;
    size_t seen_file_count() const;

private:
    bool matches_any_pattern(const std::string& file_name) const;

    std::string signals_directory_path;
    std::vector<std::string> accepted_file_patterns;
    mutable std::mutex seen_files_mutex;
    std::unordered_set<std::string> seen_file_names;
};

} // namespace Core
} // namespace TruthTracker

#endif // DIRECTORY_SIGNAL_SOURCE_HPP
