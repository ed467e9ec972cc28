// Inspector CLI argument parsing

#include "inspector_cli.hpp"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace TruthTracker {
namespace Core {

namespace {
    bool is_count_argument(const std::string& argument_text) {
        if (argument_text.empty()) return false;
        for (char argument_char : argument_text) {
            if (!std::isdigit(static_cast<unsigned char>(argument_char))) return false;
        }
        return true;
    }
}

void print_inspector_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name
              << " [--inspect-latest [N]] [--type forex|crypto|both] [--signal ID]\n"
              << "       N defaults to 3, type defaults to both\n";
}

InspectorCliArgs parse_inspector_cli(int argc, char* argv[]) {
    InspectorCliArgs args{};

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--inspect-latest") {
            // Count is optional
            if (i + 1 < argc && is_count_argument(argv[i + 1])) {
                try {
                    args.request.latest_count = static_cast<size_t>(std::stoul(argv[++i]));
                } catch (const std::out_of_range&) {
                    args.valid = false;
                    args.error_msg = "Count out of range: " + std::string(argv[i]);
                    return args;
                }
            }
        } else if (arg == "--type") {
            if (i + 1 >= argc) {
                args.valid = false;
                args.error_msg = "--type needs forex, crypto or both";
                return args;
            }
            const std::string partition_text = argv[++i];
            if (!parse_inspection_partition(partition_text, args.request.partition)) {
                args.valid = false;
                args.error_msg = "Unknown log type: " + partition_text;
                return args;
            }
        } else if (arg == "--signal") {
            if (i + 1 >= argc) {
                args.valid = false;
                args.error_msg = "--signal needs a signal id";
                return args;
            }
            args.request.signal_id_filter = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        } else {
            args.valid = false;
            args.error_msg = "Unknown argument: " + arg;
            return args;
        }
    }

    if (args.request.latest_count == 0 && args.request.signal_id_filter.empty()) {
        args.valid = false;
        args.error_msg = "Count must be at least 1";
    }
    return args;
}

} // namespace Core
} // namespace TruthTracker
