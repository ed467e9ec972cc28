#ifndef SIGNAL_SOURCE_HPP
#define SIGNAL_SOURCE_HPP

#include <string>
#include <vector>

namespace TruthTracker {
namespace Core {

// One declaration file as handed to the ingestion loop
struct SignalDeclaration {
    std::string origin_name;        // file name, used for seen-set and logging
    std::string raw_content;
    double modified_at;             // unix seconds, fallback creation time
    std::string read_error;         // non-empty when the content could not be read

    SignalDeclaration() : modified_at(0.0) {}
};

/**
 * Restartable sequence of signal declarations.
 *
 * poll_new_declarations() returns each declaration at most once for the
 * lifetime of the source; reset() forgets what has been handed out.
 */
class SignalSource {
public:
    virtual ~SignalSource() = default;

    virtual std::vector<SignalDeclaration> poll_new_declarations() = 0;
    virtual void reset() = 0;
    virtual std::string describe() const = 0;
};

} // namespace Core
} // namespace TruthTracker

#endif // SIGNAL_SOURCE_HPP
