/*
Truth Tracker - Inspector CLI Tests
Role: Verify truth_inspect argument parsing
Testing Strategy: Argument vectors → assert parsed request or rejection
Coverage: Defaults, optional count, partition selection, signal filter, help, invalid input
*/
#include <gtest/gtest.h>
#include "tracker/inspector/inspector_cli.hpp"
#include <string>
#include <vector>

using namespace TruthTracker::Core;

namespace {
    InspectorCliArgs parse(std::vector<std::string> arguments) {
        arguments.insert(arguments.begin(), "truth_inspect");
        std::vector<char*> argv;
        for (std::string& argument : arguments) {
            argv.push_back(&argument[0]);
        }
        return parse_inspector_cli(static_cast<int>(argv.size()), argv.data());
    }
}

// =============================================================================
// Accepted forms
// =============================================================================

TEST(InspectorCli, NoArgumentsUsesDefaults) {
    InspectorCliArgs args = parse({});
    EXPECT_TRUE(args.valid);
    EXPECT_FALSE(args.show_help);
    EXPECT_EQ(args.request.latest_count, 3u);
    EXPECT_EQ(args.request.partition, InspectionPartition::BOTH);
    EXPECT_TRUE(args.request.signal_id_filter.empty());
}

TEST(InspectorCli, InspectLatestWithoutCountKeepsDefault) {
    InspectorCliArgs args = parse({"--inspect-latest", "--type", "forex"});
    EXPECT_TRUE(args.valid);
    EXPECT_EQ(args.request.latest_count, 3u);
    EXPECT_EQ(args.request.partition, InspectionPartition::FOREX);
}

TEST(InspectorCli, InspectLatestWithCount) {
    InspectorCliArgs args = parse({"--inspect-latest", "10", "--type", "crypto"});
    EXPECT_TRUE(args.valid);
    EXPECT_EQ(args.request.latest_count, 10u);
    EXPECT_EQ(args.request.partition, InspectionPartition::CRYPTO);
}

TEST(InspectorCli, SignalFilter) {
    InspectorCliArgs args = parse({"--signal", "VENOM_EURUSD_001"});
    EXPECT_TRUE(args.valid);
    EXPECT_EQ(args.request.signal_id_filter, "VENOM_EURUSD_001");
}

TEST(InspectorCli, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
}

// =============================================================================
// Rejections
// =============================================================================

TEST(InspectorCli, UnknownTypeIsInvalid) {
    InspectorCliArgs args = parse({"--type", "stocks"});
    EXPECT_FALSE(args.valid);
    EXPECT_NE(args.error_msg.find("stocks"), std::string::npos);
}

TEST(InspectorCli, MissingOptionValuesAreInvalid) {
    EXPECT_FALSE(parse({"--type"}).valid);
    EXPECT_FALSE(parse({"--signal"}).valid);
}

TEST(InspectorCli, ZeroCountIsInvalid) {
    EXPECT_FALSE(parse({"--inspect-latest", "0"}).valid);
}

TEST(InspectorCli, NegativeCountIsNotTakenAsCount) {
    InspectorCliArgs args = parse({"--inspect-latest", "-5"});
    EXPECT_FALSE(args.valid);
    EXPECT_NE(args.error_msg.find("-5"), std::string::npos);
}

TEST(InspectorCli, UnknownArgumentIsInvalid) {
    InspectorCliArgs args = parse({"--verbose"});
    EXPECT_FALSE(args.valid);
    EXPECT_EQ(args.error_msg, "Unknown argument: --verbose");
}
