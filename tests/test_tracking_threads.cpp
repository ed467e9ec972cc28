/*
Truth Tracker - Tracking Thread Tests
Role: Verify the ingestion and evaluation loops as they run on their own threads
Testing Strategy: Real thread bodies started through the thread manager with fake feed and source → assert flags, registry and bounded joins
Coverage: Prompt cancellation, iteration failures that do not stop the loop, truth log write failure ending the evaluation loop
*/
#include <gtest/gtest.h>
#include "threads/system_threads/evaluation_thread.hpp"
#include "threads/system_threads/ingestion_thread.hpp"
#include "threads/thread_logic/thread_manager.hpp"
#include "fixtures/fake_market_data_provider.hpp"
#include "fixtures/fake_signal_source.hpp"
#include "fixtures/fixed_auto_close_setting.hpp"
#include "fixtures/signal_files.hpp"
#include "fixtures/temp_directory.hpp"
#include "fixtures/trackers.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace TruthTracker::Core;
using namespace TruthTracker::Threads;
using TruthTracker::Logging::LoggingContext;

namespace {
    bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    size_t count_lines(const std::string& file_path) {
        std::ifstream file_stream(file_path);
        size_t line_count = 0;
        std::string line;
        while (std::getline(file_stream, line)) {
            line_count++;
        }
        return line_count;
    }

    // Feed that fails the first fetch and then serves a fixed set of quotes
    class FailingOnceMarketDataProvider : public TruthTracker::API::MarketDataProvider {
    public:
        void set_quote(const std::string& symbol, double bid, double ask) {
            quotes[symbol] = MarketQuote(bid, ask, 0.0);
        }

        TruthTracker::API::QuoteSnapshotPtr fetch_all_quotes() override {
            if (fetch_count.fetch_add(1) == 0) {
                throw std::runtime_error("quote feed unreachable");
            }
            return std::make_shared<const QuoteSnapshot>(quotes);
        }

        double get_snapshot_age_seconds() const override { return 0.0; }
        std::string get_provider_name() const override { return "failing once"; }

        std::atomic<int> fetch_count{0};

    private:
        QuoteSnapshot quotes;
    };

    // Source whose first poll throws; later polls hand out the queued declarations once
    class FailingOnceSignalSource : public SignalSource {
    public:
        void push(const SignalDeclaration& declaration) { pending.push_back(declaration); }

        std::vector<SignalDeclaration> poll_new_declarations() override {
            if (poll_count.fetch_add(1) == 0) {
                throw std::runtime_error("signal directory unreadable");
            }
            std::vector<SignalDeclaration> handed_out;
            handed_out.swap(pending);
            return handed_out;
        }

        void reset() override {}
        std::string describe() const override { return "failing once source"; }

        std::atomic<int> poll_count{0};

    private:
        std::vector<SignalDeclaration> pending;
    };
}

class TrackingThreadsTest : public ::testing::Test {
protected:
    void SetUp() override {
        timing.ingestion_poll_interval_sec = 1;
        timing.evaluation_poll_interval_sec = 1;
        timing.thread_startup_sequence_delay_milliseconds = 0;

        logging_config.forex_truth_log_path = scratch.file("truth_log.jsonl");
        logging_config.crypto_truth_log_path = scratch.file("truth_log_crypto.jsonl");
        truth_logger = std::make_unique<TruthLogger>(logging_config, authorization_policy);
    }

    void TearDown() override {
        request_stop();
        Manager::join_thread("TEST", worker_thread);
    }

    void start_worker(const std::function<void()>& thread_body) {
        std::vector<ThreadSystem::ThreadDefinition> thread_definitions{
            ThreadSystem::ThreadDefinition("TEST", [this, thread_body]() {
                thread_body();
                loop_finished.store(true);
            }, worker_thread)
        };
        ASSERT_EQ(Manager::start_threads(thread_definitions, logging_context), 1);
    }

    void request_stop() {
        {
            std::lock_guard<std::mutex> state_lock(state_mtx);
            running.store(false);
        }
        state_cv.notify_all();
    }

    // Stop and join, returning how long the join took
    std::chrono::milliseconds stop_and_join() {
        auto stop_requested_at = std::chrono::steady_clock::now();
        request_stop();
        EXPECT_TRUE(Manager::join_thread("TEST", worker_thread));
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - stop_requested_at);
    }

    fixtures::TempDirectory scratch;
    LoggingContext logging_context;
    TruthTracker::Config::TimingConfig timing;
    TruthTracker::Config::LoggingConfig logging_config;
    TruthTracker::Config::TrackingConfig tracking_config;
    AuthorizationPolicy authorization_policy{TruthTracker::Config::AuthorizationConfig()};
    TrackerRegistry tracker_registry;
    fixtures::FixedAutoCloseSetting auto_close_setting{7200};
    std::unique_ptr<TruthLogger> truth_logger;

    std::mutex state_mtx;
    std::condition_variable state_cv;
    std::atomic<bool> running{true};
    std::atomic<bool> shutdown_requested{false};
    std::atomic<bool> persistence_failed{false};
    std::atomic<unsigned long> iteration_count{0};
    std::atomic<bool> loop_finished{false};
    std::thread worker_thread;
};

// =============================================================================
// Ingestion loop
// =============================================================================

TEST_F(TrackingThreadsTest, IngestionLoopAdmitsAndStopsPromptly) {
    fixtures::FakeSignalSource signal_source;
    signal_source.push(fixtures::declaration_from("mission_EURUSD_1.json",
        fixtures::flat_signal("EURUSD_1", "EURUSD", "BUY", 1.1000, 1.0980, 1.1040)));
    IngestionCoordinator ingestion_coordinator(signal_source, authorization_policy, tracker_registry);
    IngestionThread ingestion_thread(ingestion_coordinator, timing, state_mtx, state_cv, running);
    ingestion_thread.set_iteration_counter(iteration_count);

    start_worker([&ingestion_thread]() { ingestion_thread(); });

    EXPECT_TRUE(wait_until([this] { return iteration_count.load() >= 1; }, std::chrono::milliseconds(3000)));
    EXPECT_TRUE(tracker_registry.is_active("EURUSD_1"));

    EXPECT_LT(stop_and_join().count(), 900);
    EXPECT_TRUE(loop_finished.load());
}

TEST_F(TrackingThreadsTest, IngestionLoopSurvivesFailingPoll) {
    FailingOnceSignalSource signal_source;
    signal_source.push(fixtures::declaration_from("mission_EURUSD_2.json",
        fixtures::flat_signal("EURUSD_2", "EURUSD", "BUY", 1.1000, 1.0980, 1.1040)));
    IngestionCoordinator ingestion_coordinator(signal_source, authorization_policy, tracker_registry);
    IngestionThread ingestion_thread(ingestion_coordinator, timing, state_mtx, state_cv, running);
    ingestion_thread.set_iteration_counter(iteration_count);

    start_worker([&ingestion_thread]() { ingestion_thread(); });

    EXPECT_TRUE(wait_until([this] { return tracker_registry.is_active("EURUSD_2"); }, std::chrono::milliseconds(5000)));
    EXPECT_GE(signal_source.poll_count.load(), 2);
    EXPECT_FALSE(loop_finished.load());

    stop_and_join();
    EXPECT_TRUE(loop_finished.load());
}

// =============================================================================
// Evaluation loop
// =============================================================================

TEST_F(TrackingThreadsTest, EvaluationLoopStopsPromptly) {
    fixtures::FakeMarketDataProvider market_data_provider;
    EvaluationCoordinator evaluation_coordinator(tracker_registry, market_data_provider, *truth_logger,
                                                 auto_close_setting, tracking_config);
    EvaluationThread evaluation_thread(evaluation_coordinator, timing, state_mtx, state_cv, running,
                                       shutdown_requested, persistence_failed);
    evaluation_thread.set_iteration_counter(iteration_count);

    start_worker([&evaluation_thread]() { evaluation_thread(); });

    EXPECT_TRUE(wait_until([this] { return iteration_count.load() >= 1; }, std::chrono::milliseconds(3000)));
    EXPECT_LT(stop_and_join().count(), 900);
    EXPECT_TRUE(loop_finished.load());
    EXPECT_FALSE(shutdown_requested.load());
    EXPECT_FALSE(persistence_failed.load());
}

TEST_F(TrackingThreadsTest, EvaluationLoopSurvivesFailingFetch) {
    FailingOnceMarketDataProvider market_data_provider;
    market_data_provider.set_quote("EURUSD", 1.1045, 1.1047);
    tracker_registry.admit(fixtures::eurusd_buy("EURUSD_TP"));
    EvaluationCoordinator evaluation_coordinator(tracker_registry, market_data_provider, *truth_logger,
                                                 auto_close_setting, tracking_config);
    EvaluationThread evaluation_thread(evaluation_coordinator, timing, state_mtx, state_cv, running,
                                       shutdown_requested, persistence_failed);

    start_worker([&evaluation_thread]() { evaluation_thread(); });

    EXPECT_TRUE(wait_until([this] { return tracker_registry.is_processed("EURUSD_TP"); }, std::chrono::milliseconds(5000)));
    EXPECT_GE(market_data_provider.fetch_count.load(), 2);
    EXPECT_FALSE(loop_finished.load());
    EXPECT_FALSE(persistence_failed.load());

    stop_and_join();
    EXPECT_EQ(count_lines(logging_config.forex_truth_log_path), 1u);
}

TEST_F(TrackingThreadsTest, TruthLogWriteFailureEndsEvaluationLoop) {
    fixtures::FakeMarketDataProvider market_data_provider;
    market_data_provider.set_quote("EURUSD", 1.1045, 1.1047);
    tracker_registry.admit(fixtures::eurusd_buy("EURUSD_UNWRITABLE"));
    std::filesystem::create_directories(logging_config.forex_truth_log_path);
    EvaluationCoordinator evaluation_coordinator(tracker_registry, market_data_provider, *truth_logger,
                                                 auto_close_setting, tracking_config);
    EvaluationThread evaluation_thread(evaluation_coordinator, timing, state_mtx, state_cv, running,
                                       shutdown_requested, persistence_failed);

    start_worker([&evaluation_thread]() { evaluation_thread(); });

    // The loop ends on its own while running is still set
    EXPECT_TRUE(wait_until([this] { return loop_finished.load(); }, std::chrono::milliseconds(3000)));
    EXPECT_TRUE(running.load());
    EXPECT_TRUE(persistence_failed.load());
    EXPECT_TRUE(shutdown_requested.load());

    EXPECT_LT(stop_and_join().count(), 900);
}
