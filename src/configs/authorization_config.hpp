#ifndef AUTHORIZATION_CONFIG_HPP
#define AUTHORIZATION_CONFIG_HPP

#include <string>
#include <vector>

namespace TruthTracker {
namespace Config {

/**
 * Trusted generator tags. A tag listed here authorizes a declaration and binds
 * it to the unit system of the list it appears in.
 */
struct AuthorizationConfig {
    std::vector<std::string> forex_tags;
    std::vector<std::string> crypto_tags;

    AuthorizationConfig()
        : forex_tags{"venom_scalp_master"},
          crypto_tags{"CORE_CRYPTO_SMC", "C.O.R.E", "CORE"} {}
};

} // namespace Config
} // namespace TruthTracker

#endif // AUTHORIZATION_CONFIG_HPP
