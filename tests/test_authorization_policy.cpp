/*
Truth Tracker - Authorization Policy Tests
Role: Verify the trusted-tag gate and unit system binding
Testing Strategy: Policies built from explicit tag lists → assert decisions
Coverage: Source and engine tags, untrusted tags, unit disagreement, missing tags, invalid tag lists
*/
#include <gtest/gtest.h>
#include "tracker/ingestion/authorization_policy.hpp"
#include <stdexcept>

using namespace TruthTracker::Core;
using TruthTracker::Config::AuthorizationConfig;

namespace {
    AuthorizationPolicy default_policy() {
        return AuthorizationPolicy(AuthorizationConfig());
    }
}

// =============================================================================
// Trusted tags
// =============================================================================

TEST(AuthorizationPolicy, ForexSourceTagAuthorizesAsForex) {
    AuthorizationPolicy policy = default_policy();
    AuthorizationDecision decision = policy.authorize("venom_scalp_master", "");

    EXPECT_TRUE(decision.authorized);
    EXPECT_EQ(decision.unit_system, UnitSystem::FOREX);
    EXPECT_EQ(decision.authorizing_tag, "venom_scalp_master");
}

TEST(AuthorizationPolicy, CryptoEngineTagAuthorizesAsCrypto) {
    AuthorizationPolicy policy = default_policy();
    AuthorizationDecision decision = policy.authorize("", "C.O.R.E");

    EXPECT_TRUE(decision.authorized);
    EXPECT_EQ(decision.unit_system, UnitSystem::CRYPTO);
    EXPECT_EQ(decision.authorizing_tag, "C.O.R.E");
}

TEST(AuthorizationPolicy, AgreeingSourceAndEngineAuthorize) {
    AuthorizationPolicy policy = default_policy();
    AuthorizationDecision decision = policy.authorize("CORE_CRYPTO_SMC", "CORE");

    EXPECT_TRUE(decision.authorized);
    EXPECT_EQ(decision.unit_system, UnitSystem::CRYPTO);
    EXPECT_EQ(decision.authorizing_tag, "CORE_CRYPTO_SMC");
}

TEST(AuthorizationPolicy, TagLookupIsExact) {
    AuthorizationPolicy policy = default_policy();

    EXPECT_TRUE(policy.is_trusted_tag("CORE"));
    EXPECT_FALSE(policy.is_trusted_tag("core"));
    EXPECT_FALSE(policy.is_trusted_tag("CORE "));
    EXPECT_FALSE(policy.unit_system_for_tag("venom").has_value());
    ASSERT_TRUE(policy.unit_system_for_tag("venom_scalp_master").has_value());
    EXPECT_EQ(*policy.unit_system_for_tag("venom_scalp_master"), UnitSystem::FOREX);
}

// =============================================================================
// Rejections
// =============================================================================

TEST(AuthorizationPolicy, MissingTagsAreRejected) {
    AuthorizationDecision decision = default_policy().authorize("", "");
    EXPECT_FALSE(decision.authorized);
    EXPECT_EQ(decision.reason, "missing source and engine tag");
}

TEST(AuthorizationPolicy, UntrustedSourceIsRejected) {
    AuthorizationDecision decision = default_policy().authorize("apex_v5", "");
    EXPECT_FALSE(decision.authorized);
    EXPECT_NE(decision.reason.find("apex_v5"), std::string::npos);
}

TEST(AuthorizationPolicy, UntrustedEngineRejectsEvenWithTrustedSource) {
    AuthorizationDecision decision = default_policy().authorize("venom_scalp_master", "rogue_engine");
    EXPECT_FALSE(decision.authorized);
    EXPECT_NE(decision.reason.find("rogue_engine"), std::string::npos);
}

TEST(AuthorizationPolicy, UnitSystemDisagreementIsRejected) {
    AuthorizationDecision decision = default_policy().authorize("venom_scalp_master", "C.O.R.E");
    EXPECT_FALSE(decision.authorized);
    EXPECT_NE(decision.reason.find("disagree"), std::string::npos);
}

// =============================================================================
// Construction
// =============================================================================

TEST(AuthorizationPolicy, TagBoundToBothUnitSystemsThrows) {
    AuthorizationConfig config;
    config.forex_tags = {"shared_tag"};
    config.crypto_tags = {"shared_tag"};
    EXPECT_THROW(AuthorizationPolicy policy(config), std::runtime_error);
}

TEST(AuthorizationPolicy, EmptyTagListsThrow) {
    AuthorizationConfig config;
    config.forex_tags.clear();
    config.crypto_tags.clear();
    EXPECT_THROW(AuthorizationPolicy policy(config), std::runtime_error);
}
