#include "authorization_policy.hpp"
#include <stdexcept>

namespace TruthTracker {
namespace Core {

AuthorizationPolicy::AuthorizationPolicy(const Config::AuthorizationConfig& authorization_config) {
    for (const std::string& forex_tag : authorization_config.forex_tags) {
        trusted_tag_units[forex_tag] = UnitSystem::FOREX;
    }
    for (const std::string& crypto_tag : authorization_config.crypto_tags) {
        auto existing_binding = trusted_tag_units.find(crypto_tag);
        if (existing_binding != trusted_tag_units.end() && existing_binding->second != UnitSystem::CRYPTO) {
            throw std::runtime_error("Authorization tag '" + crypto_tag + "' is bound to both forex and crypto");
        }
        trusted_tag_units[crypto_tag] = UnitSystem::CRYPTO;
    }
    if (trusted_tag_units.empty()) {
        throw std::runtime_error("Authorization policy requires at least one trusted tag");
    }
}

bool AuthorizationPolicy::is_trusted_tag(const std::string& tag) const {
    return trusted_tag_units.count(tag) > 0;
}

std::optional<UnitSystem> AuthorizationPolicy::unit_system_for_tag(const std::string& tag) const {
    auto binding_iterator = trusted_tag_units.find(tag);
    if (binding_iterator == trusted_tag_units.end()) {
        return std::nullopt;
    }
    return binding_iterator->second;
}

AuthorizationDecision AuthorizationPolicy::authorize(const std::string& source_tag, const std::string& engine_tag) const {
    AuthorizationDecision decision;

    if (source_tag.empty() && engine_tag.empty()) {
        decision.reason = "missing source and engine tag";
        return decision;
    }

    std::optional<UnitSystem> source_unit_system;
    if (!source_tag.empty()) {
        source_unit_system = unit_system_for_tag(source_tag);
        if (!source_unit_system) {
            decision.reason = "untrusted source '" + source_tag + "'";
            return decision;
        }
    }

    std::optional<UnitSystem> engine_unit_system;
    if (!engine_tag.empty()) {
        engine_unit_system = unit_system_for_tag(engine_tag);
        if (!engine_unit_system) {
            decision.reason = "untrusted engine '" + engine_tag + "'";
            return decision;
        }
    }

    if (source_unit_system && engine_unit_system && *source_unit_system != *engine_unit_system) {
        decision.reason = "source '" + source_tag + "' and engine '" + engine_tag + "' disagree on unit system";
        return decision;
    }

    decision.authorized = true;
    if (source_unit_system) {
        decision.unit_system = *source_unit_system;
        decision.authorizing_tag = source_tag;
    } else {
        decision.unit_system = *engine_unit_system;
        decision.authorizing_tag = engine_tag;
    }
    return decision;
}

} // namespace Core
} // namespace TruthTracker
