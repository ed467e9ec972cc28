#ifndef AUTHORIZATION_POLICY_HPP
#define AUTHORIZATION_POLICY_HPP

#include "configs/authorization_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace TruthTracker {
namespace Core {

struct AuthorizationDecision {
    bool authorized;
    UnitSystem unit_system;
    std::string authorizing_tag;
    std::string reason;

    AuthorizationDecision() : authorized(false), unit_system(UnitSystem::FOREX) {}
};

/**
 * Allow-list of trusted generator tags, each bound to a unit system.
 *
 * Used as a hard gate twice: at ingestion and again before a record reaches the
 * truth log. A declaration is authorized only when every tag it carries is
 * trusted, at least one tag is present, and the tags agree on a unit system.
 */
class AuthorizationPolicy {
public:
    explicit AuthorizationPolicy(const Config::AuthorizationConfig& authorization_config);

    AuthorizationDecision authorize(const std::string& source_tag, const std::string& engine_tag) const;

    bool is_trusted_tag(const std::string& tag) const;
    std::optional<UnitSystem> unit_system_for_tag(const std::string& tag) const;

private:
    std::unordered_map<std::string, UnitSystem> trusted_tag_units;
};

} // namespace Core
} // namespace TruthTracker

#endif // AUTHORIZATION_POLICY_HPP
