// =============================================================================
// registry.cpp - TokenRegistry
// =============================================================================

#include "crossnav/registry.hpp"
#include "crossnav/log.hpp"

namespace crossnav {

TokenRegistry::TokenRegistry(const IValueConverter& converter, size_t max_active_tokens)
    : converter_(converter)
    , max_active_tokens_(max_active_tokens) {}

ActivationResult TokenRegistry::add_if_new(PoolState& pool, const Currency& token) {
    std::lock_guard lock(pool.mutex());

    if (pool.is_active(token)) {
        return {errors::OK, true};
    }

    if (!converter_.has_price_route(token, pool.base_token())) {
        return {errors::NO_PRICE_ROUTE, false};
    }

    if (pool.active_tokens_.size() >= max_active_tokens_) {
        return {errors::TOO_MANY_TOKENS, false};
    }

    pool.active_tokens_.insert(token);
    log::info("registry", "activated " + to_hex(token.addr) + " for pool " + to_hex(pool.id()));
    return {errors::OK, false};
}

} // namespace crossnav
