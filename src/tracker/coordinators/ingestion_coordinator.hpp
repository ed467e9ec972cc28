#ifndef INGESTION_COORDINATOR_HPP
#define INGESTION_COORDINATOR_HPP

#include "tracker/ingestion/authorization_policy.hpp"
#include "tracker/ingestion/signal_parser.hpp"
#include "tracker/ingestion/signal_source.hpp"
#include "tracker/registry/tracker_registry.hpp"
#include <cstddef>

namespace TruthTracker {
namespace Core {

struct IngestionCycleReport {
    size_t new_declaration_count;
    size_t admitted_count;
    size_t duplicate_count;
    size_t unauthorized_count;
    size_t incomplete_count;
    size_t malformed_count;
    size_t rejected_count;

    IngestionCycleReport()
        : new_declaration_count(0), admitted_count(0), duplicate_count(0), unauthorized_count(0),
          incomplete_count(0), malformed_count(0), rejected_count(0) {}
};

/**
 * One ingestion pass: pull unseen declarations, gate them on the allow-list,
 * check completeness, and admit the survivors into the registry.
 */
class IngestionCoordinator {
public:
    IngestionCoordinator(SignalSource& signal_source_ref, const AuthorizationPolicy& authorization_policy_ref,
                         TrackerRegistry& tracker_registry_ref);

    IngestionCycleReport run_ingestion_cycle(double now_seconds);

private:
    void process_declaration(const SignalDeclaration& declaration, double now_seconds, IngestionCycleReport& cycle_report);
    SignalTracker build_tracker(const SignalRecord& record, const AuthorizationDecision& authorization_decision, double now_seconds) const;

    SignalSource& signal_source;
    const AuthorizationPolicy& authorization_policy;
    TrackerRegistry& tracker_registry;
};

} // namespace Core
} // namespace TruthTracker

#endif // INGESTION_COORDINATOR_HPP
