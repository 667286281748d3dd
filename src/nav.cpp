// =============================================================================
// nav.cpp - NavEngine
// =============================================================================

#include "crossnav/nav.hpp"
#include <mutex>

namespace crossnav {

// =============================================================================
// Fixed-Point Helpers
// =============================================================================

int32_t compute_unitary_value(I128 net_value, I128 effective_supply, uint8_t decimals,
                              I128 fallback, I128& out) {
    if (effective_supply <= 0) {
        // Cannot price shares against zero or negative supply
        if (net_value > 0) return errors::EFFECTIVE_SUPPLY_ZERO;
        out = fallback;
        return errors::OK;
    }

    if (net_value < 0) {
        return errors::NEGATIVE_NAV;
    }

    I128 unitary;
    if (!fp::mul_div(net_value, fp::pow10(decimals), effective_supply, unitary)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    out = (unitary == 0) ? fallback : unitary;
    return errors::OK;
}

int32_t normalize_nav(I128 nav, uint8_t from_decimals, uint8_t to_decimals, I128& out) {
    if (from_decimals == to_decimals) {
        out = nav;
        return errors::OK;
    }
    if (from_decimals > to_decimals) {
        out = nav / fp::pow10(from_decimals - to_decimals);
        return errors::OK;
    }
    if (!fp::mul_div(nav, fp::pow10(to_decimals - from_decimals), 1, out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

int32_t tolerance_amount(I128 nav, uint32_t bps, I128& out) {
    if (!fp::mul_div(nav, static_cast<I128>(bps), BPS_DENOMINATOR, out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

// =============================================================================
// NavEngine
// =============================================================================

NavEngine::NavEngine(const IValueConverter& converter, const IWallet& wallet,
                     const IApplicationAggregator* apps)
    : converter_(converter)
    , wallet_(wallet)
    , apps_(apps) {}

std::optional<I128> NavEngine::value_in_base(const PoolState& pool, const Currency& token,
                                             I128 amount) const {
    if (token == pool.base_token()) return amount;
    if (amount == 0 && converter_.has_price_route(token, pool.base_token())) return 0;
    return converter_.convert(token, amount, pool.base_token());
}

NavResult NavEngine::compute_nav(const PoolState& pool) const {
    std::lock_guard lock(pool.mutex());

    NavResult result{errors::OK, pool.unitary_value(), 0, 0, 0};
    const Currency& base = pool.base_token();

    // Base token counts at face value
    I128 assets = wallet_.balance_of(base, pool.id());

    for (const auto& token : pool.active_tokens()) {
        if (token == base) continue;

        I128 balance = wallet_.balance_of(token, pool.id());
        if (balance == 0) continue;

        auto value = converter_.convert(token, balance, base);
        if (!value) {
            result.status = errors::NO_PRICE_ROUTE;
            return result;
        }
        if (!fp::checked_add(assets, *value, assets)) {
            result.status = errors::ARITHMETIC_OVERFLOW;
            return result;
        }
    }

    if (apps_) {
        for (const auto& position : apps_->positions(pool.id())) {
            if (position.amount == 0) continue;

            auto value = value_in_base(pool, position.token, position.amount);
            if (!value) {
                result.status = errors::NO_PRICE_ROUTE;
                return result;
            }
            if (!fp::checked_add(assets, *value, assets)) {
                result.status = errors::ARITHMETIC_OVERFLOW;
                return result;
            }
        }
    }

    // Virtual balances are already in base-token units
    I128 virtual_total;
    int32_t status = pool.ledger().total_virtual_balance(virtual_total);
    if (status != errors::OK) {
        result.status = status;
        return result;
    }

    I128 net;
    I128 effective_supply;
    if (!fp::checked_add(assets, virtual_total, net) ||
        !fp::checked_add(pool.total_supply(), pool.ledger().get_virtual_supply(), effective_supply)) {
        result.status = errors::ARITHMETIC_OVERFLOW;
        return result;
    }

    result.total_assets = assets;
    result.net_total_value = net;
    result.effective_supply = effective_supply;
    result.status = compute_unitary_value(net, effective_supply, pool.decimals(),
                                          pool.unitary_value(), result.unitary_value);
    return result;
}

} // namespace crossnav
