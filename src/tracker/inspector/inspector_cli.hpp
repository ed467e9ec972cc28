#ifndef INSPECTOR_CLI_HPP
#define INSPECTOR_CLI_HPP

#include "tracker/inspector/truth_log_inspector.hpp"
#include <string>

namespace TruthTracker {
namespace Core {

struct InspectorCliArgs {
    InspectionRequest request;
    bool show_help;
    bool valid;
    std::string error_msg;

    InspectorCliArgs() : show_help(false), valid(true) {}
};

void print_inspector_usage(const char* prog_name);

// truth_inspect [--inspect-latest [N]] [--type forex|crypto|both] [--signal ID]
InspectorCliArgs parse_inspector_cli(int argc, char* argv[]);

} // namespace Core
} // namespace TruthTracker

#endif // INSPECTOR_CLI_HPP
