// crossnav - Shared test doubles

#ifndef CROSSNAV_TESTS_FIXTURES_HPP
#define CROSSNAV_TESTS_FIXTURES_HPP

#include <catch2/catch.hpp>
#include <crossnav/nav.hpp>
#include <crossnav/oracle.hpp>
#include <crossnav/pool.hpp>
#include <crossnav/registry.hpp>
#include <crossnav/session.hpp>
#include <crossnav/wallet.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Catch {
template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 value) { return crossnav::fp::to_string(value); }
};
} // namespace Catch

namespace crossnav::test {

constexpr I128 E6 = 1000000;
constexpr I128 E18 = fp::pow10(18);

inline Currency token(uint8_t tag) {
    Address addr{};
    addr[0] = 0x70;
    addr[19] = tag;
    return Currency(addr);
}

inline Address account(uint8_t tag) {
    Address addr{};
    addr[0] = 0xAC;
    addr[19] = tag;
    return addr;
}

inline const Currency USDC = token(1);     // 6 decimals, base token of the test pool
inline const Currency WETH = token(2);     // 18 decimals, 3000 USDC
inline const Currency DAI = token(3);      // 18 decimals, 1 USDC
inline const Currency UNPRICED = token(4);

inline const PoolId POOL = account(1);
inline const Address DONOR = account(2);
inline const Address SPOKE_POOL = account(3);
inline const Address HANDLER = account(4);

// Each token is priced as rate.first / rate.second reference units per
// native unit; conversions go through the reference unit.
class FixedConverter : public IValueConverter {
public:
    void set_rate(const Currency& token, I128 numerator, I128 denominator = 1) {
        rates_[token] = {numerator, denominator};
    }

    void remove_rate(const Currency& token) { rates_.erase(token); }

    // Called before every conversion; lets a test reenter the session
    std::function<void()> on_convert;

    std::optional<I128> convert(const Currency& token_in, I128 amount,
                                const Currency& token_out) const override {
        if (on_convert) on_convert();
        if (token_in == token_out) return amount;

        auto in = rates_.find(token_in);
        auto out = rates_.find(token_out);
        if (in == rates_.end() || out == rates_.end()) return std::nullopt;

        I128 reference;
        I128 value;
        if (!fp::mul_div(amount, in->second.first, in->second.second, reference)) return std::nullopt;
        if (!fp::mul_div(reference, out->second.second, out->second.first, value)) return std::nullopt;
        return value;
    }

private:
    std::unordered_map<Currency, std::pair<I128, I128>, CurrencyHash> rates_;
};

class FixedPositions : public IApplicationAggregator {
public:
    std::vector<TokenAmount> held;

    std::vector<TokenAmount> positions(const PoolId&) const override { return held; }
};

// Converter, wallet, store and session wired the way a deployment wires them
struct World {
    FixedConverter converter;
    MemoryWallet wallet{WETH};
    PoolStore pools;
    NavEngine nav{converter, wallet};
    TokenRegistry registry{converter};
    ReconciliationSession session{pools, nav, wallet, registry, SessionConfig{WETH, {USDC, WETH, DAI}, 10}};

    World() {
        converter.set_rate(USDC, 1);
        converter.set_rate(WETH, 3, 1000000000);        // 3000e6 per 1e18
        converter.set_rate(NATIVE, 3, 1000000000);
        converter.set_rate(DAI, 1, 1000000000000);      // 1e6 per 1e18
    }

    // 1000 USDC held against 1000 shares: NAV 1.000000
    void seed_pool(I128 supply = 1000 * E6, I128 assets = 1000 * E6) {
        REQUIRE(pools.create_pool(POOL, USDC, 6) == errors::OK);
        REQUIRE(pools.set_total_supply(POOL, supply) == errors::OK);
        if (assets > 0) {
            REQUIRE(wallet.mint(USDC, POOL, assets) == errors::OK);
        }
    }

    PoolState& pool() { return *pools.find(POOL); }

    // Tokens arriving in the pool from outside the session
    void deliver(const Currency& token, I128 amount) {
        REQUIRE(wallet.mint(token, POOL, amount) == errors::OK);
    }
};

inline DestinationMessageParams transfer_params() {
    return DestinationMessageParams{OpType::TRANSFER, false, 0};
}

inline DestinationMessageParams sync_params(uint32_t multiplier_bps) {
    return DestinationMessageParams{OpType::SYNC, false, multiplier_bps};
}

} // namespace crossnav::test

#endif // CROSSNAV_TESTS_FIXTURES_HPP
