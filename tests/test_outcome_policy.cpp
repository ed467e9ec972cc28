/*
Truth Tracker - Outcome Policy Tests
Role: Verify the exit rules applied to one tracker at one instant
Testing Strategy: Fixed trackers and quotes at chosen runtimes → assert outcome, exit and delta
Coverage: SL/TP in both directions, tie-break law, time close guard, 24h ceiling, pip sizes, determinism
*/
#include <gtest/gtest.h>
#include "tracker/evaluation/outcome_policy.hpp"
#include "fixtures/trackers.hpp"

using namespace TruthTracker::Core;

namespace {
constexpr int AUTO_CLOSE_SECONDS = 7200;
constexpr int MAX_TRACKING_SECONDS = 86400;

std::optional<TrackingResult> evaluate_at(const SignalTracker& tracker, const MarketQuote* quote, double runtime_seconds,
                                          int auto_close_seconds = AUTO_CLOSE_SECONDS) {
    OutcomeEvaluationRequest request(tracker, quote, tracker.started_at + runtime_seconds, auto_close_seconds, MAX_TRACKING_SECONDS);
    return evaluate_outcome(request);
}
}

// =============================================================================
// Scenarios
// =============================================================================

TEST(OutcomePolicy, BuyTakeProfitWinsFortyPips) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.1045, 1.1047, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 600.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::WIN);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 1.1040);
    EXPECT_DOUBLE_EQ(tracking_result->delta, 40.0);
    EXPECT_DOUBLE_EQ(tracking_result->observed_market_price, 1.1045);
    EXPECT_DOUBLE_EQ(tracking_result->runtime_seconds, 600.0);
}

TEST(OutcomePolicy, SellJpyStopLossLosesTwentyPips) {
    SignalTracker tracker = fixtures::usdjpy_sell();
    MarketQuote quote(150.22, 150.25, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 300.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::LOSS);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 150.20);
    EXPECT_DOUBLE_EQ(tracking_result->delta, -20.0);
}

TEST(OutcomePolicy, CryptoTimeCloseInProfitWinsThreeHundredDollars) {
    SignalTracker tracker = fixtures::btcusd_buy();
    MarketQuote quote(60300.0, 60310.0, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 7200.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::WIN);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TIME_CLOSE);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 60300.0);
    EXPECT_DOUBLE_EQ(tracking_result->delta, 300.0);
    EXPECT_EQ(tracking_result->auto_close_seconds, 7200);
}

TEST(OutcomePolicy, BuyUsesBidAndSellUsesAsk) {
    // Ask touches the BUY target but the bid does not
    SignalTracker buy_tracker = fixtures::eurusd_buy();
    MarketQuote buy_quote(1.1035, 1.1041, 0.0);
    EXPECT_FALSE(evaluate_at(buy_tracker, &buy_quote, 10.0).has_value());

    // Bid touches the SELL target but the ask does not
    SignalTracker sell_tracker = fixtures::usdjpy_sell();
    MarketQuote sell_quote(149.49, 149.52, 0.0);
    EXPECT_FALSE(evaluate_at(sell_tracker, &sell_quote, 10.0).has_value());
}

TEST(OutcomePolicy, PriceBetweenLevelsStaysActive) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.1010, 1.1012, 0.0);
    EXPECT_FALSE(evaluate_at(tracker, &quote, 60.0).has_value());
}

TEST(OutcomePolicy, LevelTouchedExactlyCountsAsHit) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.0980, 1.0982, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 60.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(tracking_result->delta, -20.0);
}

// =============================================================================
// Tie-break law: both levels hit in the same tick
// =============================================================================

TEST(OutcomePolicy, BuyBothHitTakeProfitCloserWins) {
    // Levels crossed so one price satisfies both conditions; TP is 5 pips from entry, SL 10
    SignalTracker tracker = fixtures::make_tracker("TIE_BUY_TP", "EURUSD", SignalDirection::BUY, 1.1000, 1.1010, 1.0995);
    MarketQuote quote(1.1000, 1.1002, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 5.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::WIN);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 1.0995);
}

TEST(OutcomePolicy, BuyBothHitStopLossCloserLoses) {
    SignalTracker tracker = fixtures::make_tracker("TIE_BUY_SL", "EURUSD", SignalDirection::BUY, 1.1000, 1.1005, 1.0990);
    MarketQuote quote(1.1000, 1.1002, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 5.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::LOSS);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 1.1005);
}

TEST(OutcomePolicy, SellBothHitTakeProfitCloserWins) {
    SignalTracker tracker = fixtures::make_tracker("TIE_SELL_TP", "USDJPY", SignalDirection::SELL, 150.00, 149.80, 150.05);
    MarketQuote quote(149.98, 150.00, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 5.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::WIN);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TAKE_PROFIT);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 150.05);
}

TEST(OutcomePolicy, SellBothHitStopLossCloserLoses) {
    SignalTracker tracker = fixtures::make_tracker("TIE_SELL_SL", "USDJPY", SignalDirection::SELL, 150.00, 149.90, 150.20);
    MarketQuote quote(149.98, 150.00, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 5.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::LOSS);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::STOP_LOSS);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 149.90);
}

TEST(OutcomePolicy, BothHitAtEqualDistanceIsLoss) {
    SignalTracker buy_tracker = fixtures::make_tracker("TIE_EQ_BUY", "BTCUSD", SignalDirection::BUY, 100.0, 110.0, 90.0, UnitSystem::CRYPTO);
    MarketQuote buy_quote(100.0, 100.5, 0.0);
    auto buy_result = evaluate_at(buy_tracker, &buy_quote, 5.0);
    ASSERT_TRUE(buy_result.has_value());
    EXPECT_EQ(buy_result->outcome, Outcome::LOSS);
    EXPECT_EQ(buy_result->exit_reason, ExitReason::STOP_LOSS);

    SignalTracker sell_tracker = fixtures::make_tracker("TIE_EQ_SELL", "BTCUSD", SignalDirection::SELL, 100.0, 90.0, 110.0, UnitSystem::CRYPTO);
    MarketQuote sell_quote(99.5, 100.0, 0.0);
    auto sell_result = evaluate_at(sell_tracker, &sell_quote, 5.0);
    ASSERT_TRUE(sell_result.has_value());
    EXPECT_EQ(sell_result->outcome, Outcome::LOSS);
    EXPECT_EQ(sell_result->exit_reason, ExitReason::STOP_LOSS);
}

// =============================================================================
// Time close and ceiling
// =============================================================================

TEST(OutcomePolicy, TimeCloseNotInProfitStaysActive) {
    SignalTracker tracker = fixtures::btcusd_buy();
    MarketQuote quote(59900.0, 59910.0, 0.0);
    EXPECT_FALSE(evaluate_at(tracker, &quote, 7200.0).has_value());
}

TEST(OutcomePolicy, TimeCloseAtBreakEvenStaysActive) {
    SignalTracker tracker = fixtures::btcusd_buy();
    MarketQuote quote(60000.0, 60010.0, 0.0);
    EXPECT_FALSE(evaluate_at(tracker, &quote, 9000.0).has_value());
}

TEST(OutcomePolicy, TimeCloseWaitsForAutoCloseSeconds) {
    SignalTracker tracker = fixtures::btcusd_buy();
    MarketQuote quote(60300.0, 60310.0, 0.0);
    EXPECT_FALSE(evaluate_at(tracker, &quote, 7199.0).has_value());
}

TEST(OutcomePolicy, TimeCloseFollowsHotAutoCloseValue) {
    SignalTracker tracker = fixtures::btcusd_buy();
    MarketQuote quote(60300.0, 60310.0, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 1800.0, 1800);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TIME_CLOSE);
    EXPECT_EQ(tracking_result->auto_close_seconds, 1800);
}

TEST(OutcomePolicy, CeilingTimesOutAtEntryWithZeroDelta) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.0990, 1.0992, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 86400.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::TIMEOUT);
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TIMEOUT);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 1.1000);
    EXPECT_DOUBLE_EQ(tracking_result->delta, 0.0);
    EXPECT_DOUBLE_EQ(tracking_result->observed_market_price, 1.0990);
}

TEST(OutcomePolicy, CeilingAppliesWithoutQuote) {
    SignalTracker tracker = fixtures::usdjpy_sell();

    EXPECT_FALSE(evaluate_at(tracker, nullptr, 86399.0).has_value());

    auto tracking_result = evaluate_at(tracker, nullptr, 86400.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->outcome, Outcome::TIMEOUT);
    EXPECT_DOUBLE_EQ(tracking_result->exit_price, 150.00);
    EXPECT_DOUBLE_EQ(tracking_result->observed_market_price, 150.00);
}

TEST(OutcomePolicy, ProfitableAtCeilingIsTimeCloseNotTimeout) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.1010, 1.1012, 0.0);

    auto tracking_result = evaluate_at(tracker, &quote, 90000.0);
    ASSERT_TRUE(tracking_result.has_value());
    EXPECT_EQ(tracking_result->exit_reason, ExitReason::TIME_CLOSE);
    EXPECT_DOUBLE_EQ(tracking_result->delta, 10.0);
}

// =============================================================================
// Units and determinism
// =============================================================================

TEST(OutcomePolicy, PipSizeDependsOnJpyQuote) {
    EXPECT_DOUBLE_EQ(pip_size_for_symbol("USDJPY"), JPY_PIP_SIZE);
    EXPECT_DOUBLE_EQ(pip_size_for_symbol("GBPJPY"), JPY_PIP_SIZE);
    EXPECT_DOUBLE_EQ(pip_size_for_symbol("EURUSD"), STANDARD_PIP_SIZE);
}

TEST(OutcomePolicy, DeltaIsSignedInTrackerFavour) {
    EXPECT_DOUBLE_EQ(compute_delta(fixtures::eurusd_buy(), 1.0985), -15.0);
    EXPECT_DOUBLE_EQ(compute_delta(fixtures::usdjpy_sell(), 149.75), 25.0);
    EXPECT_DOUBLE_EQ(compute_delta(fixtures::btcusd_buy(), 60123.456), 123.46);
}

TEST(OutcomePolicy, SameInputsGiveSameResult) {
    SignalTracker tracker = fixtures::eurusd_buy();
    MarketQuote quote(1.1045, 1.1047, 0.0);

    auto first_result = evaluate_at(tracker, &quote, 600.0);
    auto second_result = evaluate_at(tracker, &quote, 600.0);
    ASSERT_TRUE(first_result.has_value());
    ASSERT_TRUE(second_result.has_value());
    EXPECT_EQ(first_result->outcome, second_result->outcome);
    EXPECT_EQ(first_result->exit_reason, second_result->exit_reason);
    EXPECT_DOUBLE_EQ(first_result->exit_price, second_result->exit_price);
    EXPECT_DOUBLE_EQ(first_result->delta, second_result->delta);
    EXPECT_DOUBLE_EQ(first_result->completed_at, second_result->completed_at);
}
