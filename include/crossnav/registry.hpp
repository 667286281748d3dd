#ifndef CROSSNAV_REGISTRY_HPP
#define CROSSNAV_REGISTRY_HPP

#include <cstddef>

#include "types.hpp"
#include "oracle.hpp"
#include "pool.hpp"

namespace crossnav {

// Per-pool cap on active tokens, base token excluded
constexpr size_t DEFAULT_MAX_ACTIVE_TOKENS = 128;

struct ActivationResult {
    int32_t status;
    bool was_already_active;
};

// =============================================================================
// TokenRegistry - Tokens Counted Toward a Pool's NAV
// =============================================================================

class TokenRegistry {
public:
    explicit TokenRegistry(const IValueConverter& converter,
                           size_t max_active_tokens = DEFAULT_MAX_ACTIVE_TOKENS);

    // Activate `token` for `pool` unless it already is. The base token is
    // always active. A new token must have a price route to the base token.
    ActivationResult add_if_new(PoolState& pool, const Currency& token);

    size_t max_active_tokens() const { return max_active_tokens_; }

private:
    const IValueConverter& converter_;
    size_t max_active_tokens_;
};

} // namespace crossnav

#endif // CROSSNAV_REGISTRY_HPP
