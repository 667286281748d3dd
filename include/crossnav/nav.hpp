#ifndef CROSSNAV_NAV_HPP
#define CROSSNAV_NAV_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "oracle.hpp"
#include "wallet.hpp"
#include "pool.hpp"

namespace crossnav {

// =============================================================================
// Application Positions (external read-only data source)
// =============================================================================

struct TokenAmount {
    Currency token;
    I128 amount;        // Native units of `token`, may be negative (debt)
};

class IApplicationAggregator {
public:
    virtual ~IApplicationAggregator() = default;

    // Token balances the pool holds inside external applications
    virtual std::vector<TokenAmount> positions(const PoolId& pool) const = 0;
};

// =============================================================================
// NAV Result
// =============================================================================

struct NavResult {
    int32_t status;
    I128 unitary_value;         // NAV per share, scaled by 10^decimals
    I128 net_total_value;       // total_assets plus virtual balances
    I128 total_assets;          // Wallet and application value only
    I128 effective_supply;      // total supply plus virtual supply
};

// Unitary value for `net_value` spread over `effective_supply` shares.
// Falls back to `fallback` when there is nothing to price (no supply and
// no value) or when the result truncates to zero.
int32_t compute_unitary_value(I128 net_value, I128 effective_supply, uint8_t decimals,
                              I128 fallback, I128& out);

// Rescale a NAV between decimal precisions; downscaling truncates.
// ARITHMETIC_OVERFLOW when the upscaled value does not fit.
int32_t normalize_nav(I128 nav, uint8_t from_decimals, uint8_t to_decimals, I128& out);

// nav * bps / 10000
int32_t tolerance_amount(I128 nav, uint32_t bps, I128& out);

// =============================================================================
// NavEngine
// =============================================================================

class NavEngine {
public:
    NavEngine(const IValueConverter& converter, const IWallet& wallet,
              const IApplicationAggregator* apps = nullptr);

    // View-only. Fails as a whole when any held token cannot be priced.
    NavResult compute_nav(const PoolState& pool) const;

    // `amount` of `token` in the pool's base-token units
    std::optional<I128> value_in_base(const PoolState& pool, const Currency& token, I128 amount) const;

    const IValueConverter& converter() const { return converter_; }
    const IWallet& wallet() const { return wallet_; }

private:
    const IValueConverter& converter_;
    const IWallet& wallet_;
    const IApplicationAggregator* apps_;
};

} // namespace crossnav

#endif // CROSSNAV_NAV_HPP
