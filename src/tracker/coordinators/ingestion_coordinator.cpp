#include "ingestion_coordinator.hpp"
#include "logging/logs/ingestion_logs.hpp"
#include <algorithm>
#include <stdexcept>

using TruthTracker::Logging::IngestionLogs;

namespace TruthTracker {
namespace Core {

IngestionCoordinator::IngestionCoordinator(SignalSource& signal_source_ref, const AuthorizationPolicy& authorization_policy_ref,
                                           TrackerRegistry& tracker_registry_ref)
    : signal_source(signal_source_ref), authorization_policy(authorization_policy_ref), tracker_registry(tracker_registry_ref) {}

IngestionCycleReport IngestionCoordinator::run_ingestion_cycle(double now_seconds) {
    IngestionCycleReport cycle_report;
    std::vector<SignalDeclaration> new_declarations = signal_source.poll_new_declarations();
    cycle_report.new_declaration_count = new_declarations.size();

    for (const SignalDeclaration& declaration : new_declarations) {
        process_declaration(declaration, now_seconds, cycle_report);
    }

    if (cycle_report.new_declaration_count > 0) {
        IngestionLogs::log_cycle_summary(cycle_report.new_declaration_count, cycle_report.admitted_count);
    }
    return cycle_report;
}

void IngestionCoordinator::process_declaration(const SignalDeclaration& declaration, double now_seconds, IngestionCycleReport& cycle_report) {
    SignalParseResult parse_result = parse_signal_declaration(declaration);
    if (!parse_result.parsed()) {
        cycle_report.malformed_count++;
        IngestionLogs::log_malformed_declaration(declaration.origin_name, parse_result.reason);
        return;
    }
    const SignalRecord& record = parse_result.record;

    // Hard gate: nothing from an untrusted generator gets further than this
    AuthorizationDecision authorization_decision = authorization_policy.authorize(record.source_tag, record.engine_tag);
    if (!authorization_decision.authorized) {
        cycle_report.unauthorized_count++;
        IngestionLogs::log_unauthorized_declaration(declaration.origin_name, record.signal_id, authorization_decision.reason);
        return;
    }

    std::string missing_reason;
    if (!check_signal_completeness(record, missing_reason)) {
        cycle_report.incomplete_count++;
        IngestionLogs::log_incomplete_declaration(declaration.origin_name, record.signal_id, missing_reason);
        return;
    }

    SignalTracker tracker = build_tracker(record, authorization_decision, now_seconds);
    AdmissionResult admission_result = tracker_registry.admit(tracker);
    switch (admission_result.status) {
        case AdmissionStatus::ADMITTED:
            cycle_report.admitted_count++;
            IngestionLogs::log_signal_admitted(tracker);
            break;
        case AdmissionStatus::ALREADY_PROCESSED:
            cycle_report.duplicate_count++;
            IngestionLogs::log_duplicate_signal(declaration.origin_name, tracker.signal_id);
            break;
        case AdmissionStatus::REJECTED:
            cycle_report.rejected_count++;
            IngestionLogs::log_admission_rejected(declaration.origin_name, tracker.signal_id, admission_result.reason);
            break;
    }
}

SignalTracker IngestionCoordinator::build_tracker(const SignalRecord& record, const AuthorizationDecision& authorization_decision,
                                                  double now_seconds) const {
    SignalTracker tracker;
    tracker.signal_id = record.signal_id;
    tracker.symbol = record.symbol;
    if (!parse_direction(record.direction_text, tracker.direction)) {
        throw std::runtime_error("Unrecognized direction '" + record.direction_text + "' for " + record.signal_id);
    }
    tracker.entry_price = record.entry_price;
    tracker.stop_loss = record.stop_loss;
    tracker.take_profit = record.take_profit;
    tracker.confidence_score = record.confidence_score;
    tracker.started_at = now_seconds;
    // A declaration stamped in the future is clamped so started_at >= created_at holds
    tracker.created_at = std::min(record.created_at, now_seconds);
    tracker.unit_system = authorization_decision.unit_system;
    tracker.source_tag = record.source_tag;
    tracker.engine_tag = record.engine_tag;
    tracker.citadel_score = record.citadel_score;
    tracker.ml_filter_passed = record.ml_filter_passed;
    tracker.origin_file = record.origin_name;
    return tracker;
}

} // namespace Core
} // namespace TruthTracker
