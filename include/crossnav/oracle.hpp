#ifndef CROSSNAV_ORACLE_HPP
#define CROSSNAV_ORACLE_HPP

#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <atomic>
#include <functional>

#include "types.hpp"

namespace crossnav {

// =============================================================================
// Value Converter Interface
// =============================================================================

class IValueConverter {
public:
    virtual ~IValueConverter() = default;

    // Convert `amount` of token_in (native units) into token_out units.
    // nullopt when no price route exists.
    virtual std::optional<I128> convert(const Currency& token_in, I128 amount,
                                        const Currency& token_out) const = 0;

    virtual bool has_price_route(const Currency& token, const Currency& base_token) const {
        return token == base_token || convert(token, 1, base_token).has_value();
    }
};

// =============================================================================
// Token Price Configuration
// =============================================================================

struct TokenPriceConfig {
    Currency token;
    uint8_t decimals;
    uint64_t max_staleness;      // Maximum price age in seconds (0 = never stale)
};

struct TokenPriceData {
    I128 price_x18;              // Price of one whole token in the reference unit
    uint64_t timestamp;
};

// =============================================================================
// PriceOracle - Reference-Priced Token Conversion
// =============================================================================
//
// Every registered token carries a price in a shared reference unit (X18).
// Converting between two tokens goes through that reference unit, so a
// route exists exactly when both tokens have a fresh price.

class PriceOracle : public IValueConverter {
public:
    using Clock = std::function<uint64_t()>;

    PriceOracle();
    ~PriceOracle() override = default;

    // Non-copyable
    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    int32_t register_token(const TokenPriceConfig& config);
    std::optional<TokenPriceConfig> get_config(const Currency& token) const;
    bool is_registered(const Currency& token) const;

    // Override the wall clock (seconds since epoch)
    void set_clock(Clock clock);

    // =========================================================================
    // Price Updates
    // =========================================================================

    int32_t update_price(const Currency& token, I128 price_x18, uint64_t timestamp = 0);
    void remove_price(const Currency& token);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<I128> get_price(const Currency& token) const;
    std::optional<TokenPriceData> get_price_data(const Currency& token) const;
    bool is_price_fresh(const Currency& token) const;
    uint64_t price_age(const Currency& token) const;

    std::optional<I128> convert(const Currency& token_in, I128 amount,
                                const Currency& token_out) const override;

    struct Stats {
        uint64_t total_tokens;
        uint64_t total_updates;
        uint64_t stale_prices;
    };
    Stats get_stats() const;

private:
    std::unordered_map<Currency, TokenPriceConfig, CurrencyHash> configs_;
    std::unordered_map<Currency, TokenPriceData, CurrencyHash> prices_;
    mutable std::shared_mutex mutex_;

    Clock clock_;
    std::atomic<uint64_t> total_updates_{0};

    // Requires mutex_ held
    uint64_t current_timestamp() const;

    // Requires mutex_ held (shared)
    bool is_fresh_locked(const TokenPriceConfig& config, const TokenPriceData& data) const;
};

} // namespace crossnav

#endif // CROSSNAV_ORACLE_HPP
