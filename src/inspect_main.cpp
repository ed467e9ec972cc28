// inspect_main.cpp
#include "configs/config_loader.hpp"
#include "configs/system_config.hpp"
#include "tracker/inspector/inspector_cli.hpp"
#include "tracker/inspector/truth_log_inspector.hpp"
#include <iostream>

using namespace TruthTracker::Core;

int main(int argc, char* argv[]) {
    InspectorCliArgs args = parse_inspector_cli(argc, argv);
    if (args.show_help) {
        print_inspector_usage(argv[0]);
        return 0;
    }
    if (!args.valid) {
        std::cerr << "ERROR: " << args.error_msg << "\n";
        print_inspector_usage(argv[0]);
        return 2;
    }

    // Partition paths come from the runtime config; built-in defaults apply without one
    TruthTracker::Config::SystemConfig config;
    if (TruthTracker::Config::load_system_config(config) != 0) {
        std::cerr << "WARNING: using default truth log paths\n";
    }

    try {
        TruthLogInspector inspector(config.logging);
        return inspector.inspect(args.request, std::cout);
    } catch (const std::exception& exception_error) {
        std::cerr << "ERROR: " << exception_error.what() << std::endl;
        return 1;
    }
}
