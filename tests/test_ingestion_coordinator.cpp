/*
Truth Tracker - Ingestion Coordinator Tests
Role: Verify one ingestion pass from declaration to admitted tracker
Testing Strategy: Queue-backed signal source + real registry and policy → assert cycle report and registry state
Coverage: Admission per unit system, authorization gate, dedup across restarts, clamped creation time, incomplete and malformed declarations, level-side rejection
*/
#include <gtest/gtest.h>
#include "tracker/coordinators/ingestion_coordinator.hpp"
#include "fixtures/fake_signal_source.hpp"
#include "fixtures/signal_files.hpp"

using namespace TruthTracker::Core;

namespace {
    constexpr double NOW = 1748780000.0;
}

class IngestionCoordinatorTest : public ::testing::Test {
protected:
    fixtures::FakeSignalSource signal_source;
    AuthorizationPolicy authorization_policy{TruthTracker::Config::AuthorizationConfig()};
    TrackerRegistry tracker_registry;
    IngestionCoordinator coordinator{signal_source, authorization_policy, tracker_registry};
};

// =============================================================================
// Admission
// =============================================================================

TEST_F(IngestionCoordinatorTest, AdmitsForexDeclaration) {
    signal_source.push(fixtures::declaration_from("mission_1.json",
        fixtures::flat_signal("VENOM_EURUSD_001", "EURUSD", "BUY", 1.1000, 1.0980, 1.1040)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.new_declaration_count, 1u);
    EXPECT_EQ(cycle_report.admitted_count, 1u);

    std::vector<SignalTracker> active_trackers = tracker_registry.snapshot_active();
    ASSERT_EQ(active_trackers.size(), 1u);
    const SignalTracker& tracker = active_trackers.front();
    EXPECT_EQ(tracker.signal_id, "VENOM_EURUSD_001");
    EXPECT_EQ(tracker.direction, SignalDirection::BUY);
    EXPECT_EQ(tracker.unit_system, UnitSystem::FOREX);
    EXPECT_DOUBLE_EQ(tracker.started_at, NOW);
    EXPECT_DOUBLE_EQ(tracker.created_at, 1748779200.0);
    EXPECT_EQ(tracker.origin_file, "mission_1.json");
    ASSERT_TRUE(tracker.confidence_score.has_value());
    EXPECT_DOUBLE_EQ(*tracker.confidence_score, 82.5);
}

TEST_F(IngestionCoordinatorTest, AdmitsCryptoDeclarationAsCrypto) {
    signal_source.push(fixtures::declaration_from("5_BTCUSD_USER01.json",
        fixtures::enhanced_signal("CORE_BTC_1", "BTCUSD", "SELL", 60000.0, 61000.0, 58000.0)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    ASSERT_EQ(cycle_report.admitted_count, 1u);

    SignalTracker tracker = tracker_registry.snapshot_active().front();
    EXPECT_EQ(tracker.unit_system, UnitSystem::CRYPTO);
    EXPECT_EQ(tracker.direction, SignalDirection::SELL);
    EXPECT_EQ(tracker.engine_tag, "C.O.R.E");
}

TEST_F(IngestionCoordinatorTest, FutureCreationTimeIsClamped) {
    nlohmann::json payload = fixtures::flat_signal("FUTURE", "EURUSD", "BUY", 1.1, 1.09, 1.11);
    payload["created_at"] = NOW + 3600.0;
    signal_source.push(fixtures::declaration_from("mission_future.json", payload));

    coordinator.run_ingestion_cycle(NOW);

    SignalTracker tracker = tracker_registry.snapshot_active().front();
    EXPECT_DOUBLE_EQ(tracker.created_at, NOW);
    EXPECT_GE(tracker.started_at, tracker.created_at);
}

TEST_F(IngestionCoordinatorTest, EmptyPollProducesEmptyReport) {
    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.new_declaration_count, 0u);
    EXPECT_EQ(signal_source.poll_count, 1);
    EXPECT_EQ(tracker_registry.active_count(), 0u);
}

// =============================================================================
// Gates
// =============================================================================

TEST_F(IngestionCoordinatorTest, UnauthorizedDeclarationIsNeverAdmitted) {
    signal_source.push(fixtures::declaration_from("mission_rogue.json",
        fixtures::flat_signal("ROGUE_1", "EURUSD", "BUY", 1.1, 1.09, 1.11, "apex_v5")));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.unauthorized_count, 1u);
    EXPECT_EQ(cycle_report.admitted_count, 0u);
    EXPECT_FALSE(tracker_registry.is_active("ROGUE_1"));
    EXPECT_FALSE(tracker_registry.is_processed("ROGUE_1"));
}

TEST_F(IngestionCoordinatorTest, DeclarationWithoutTagsIsUnauthorized) {
    nlohmann::json payload = fixtures::flat_signal("NOTAG", "EURUSD", "BUY", 1.1, 1.09, 1.11);
    payload.erase("source");
    signal_source.push(fixtures::declaration_from("mission_notag.json", payload));

    EXPECT_EQ(coordinator.run_ingestion_cycle(NOW).unauthorized_count, 1u);
    EXPECT_EQ(tracker_registry.active_count(), 0u);
}

TEST_F(IngestionCoordinatorTest, IncompleteDeclarationIsCounted) {
    signal_source.push(fixtures::declaration_from("mission_zero.json",
        fixtures::flat_signal("ZERO_TP", "EURUSD", "BUY", 1.1, 1.09, 0.0)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.incomplete_count, 1u);
    EXPECT_EQ(tracker_registry.active_count(), 0u);
}

TEST_F(IngestionCoordinatorTest, MalformedDeclarationIsCounted) {
    signal_source.push(fixtures::raw_declaration("mission_broken.json", "{\"signal_id\": \"X\", "));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.malformed_count, 1u);
    EXPECT_EQ(cycle_report.admitted_count, 0u);
}

TEST_F(IngestionCoordinatorTest, LevelsOnWrongSideAreRejected) {
    signal_source.push(fixtures::declaration_from("mission_sides.json",
        fixtures::flat_signal("BAD_SIDES", "EURUSD", "BUY", 1.1000, 1.1050, 1.1040)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.rejected_count, 1u);
    EXPECT_FALSE(tracker_registry.is_active("BAD_SIDES"));
}

// =============================================================================
// Deduplication
// =============================================================================

TEST_F(IngestionCoordinatorTest, ReplayedDeclarationIsDuplicate) {
    signal_source.push(fixtures::declaration_from("mission_1.json",
        fixtures::flat_signal("ONCE", "EURUSD", "BUY", 1.1, 1.09, 1.11)));
    coordinator.run_ingestion_cycle(NOW);

    signal_source.reset();
    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW + 5.0);
    EXPECT_EQ(cycle_report.duplicate_count, 1u);
    EXPECT_EQ(cycle_report.admitted_count, 0u);
    EXPECT_EQ(tracker_registry.active_count(), 1u);
}

TEST_F(IngestionCoordinatorTest, RehydratedIdIsNotAdmittedAgain) {
    tracker_registry.seed_processed_ids({"ALREADY_LOGGED"});
    signal_source.push(fixtures::declaration_from("mission_old.json",
        fixtures::flat_signal("ALREADY_LOGGED", "EURUSD", "BUY", 1.1, 1.09, 1.11)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.duplicate_count, 1u);
    EXPECT_FALSE(tracker_registry.is_active("ALREADY_LOGGED"));
}

TEST_F(IngestionCoordinatorTest, SameIdInTwoFilesIsAdmittedOnce) {
    signal_source.push(fixtures::declaration_from("mission_a.json",
        fixtures::flat_signal("TWIN", "EURUSD", "BUY", 1.1, 1.09, 1.11)));
    signal_source.push(fixtures::declaration_from("mission_b.json",
        fixtures::flat_signal("TWIN", "EURUSD", "BUY", 1.1, 1.09, 1.11)));

    IngestionCycleReport cycle_report = coordinator.run_ingestion_cycle(NOW);
    EXPECT_EQ(cycle_report.admitted_count, 1u);
    EXPECT_EQ(cycle_report.duplicate_count, 1u);
}
