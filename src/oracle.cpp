// =============================================================================
// oracle.cpp - PriceOracle Reference-Priced Conversion
// =============================================================================

#include "crossnav/oracle.hpp"
#include <chrono>
#include <mutex>

namespace crossnav {

// =============================================================================
// Constructor
// =============================================================================

PriceOracle::PriceOracle() = default;

// =============================================================================
// Configuration
// =============================================================================

int32_t PriceOracle::register_token(const TokenPriceConfig& config) {
    if (config.decimals > MAX_DECIMALS) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);

    if (configs_.find(config.token) != configs_.end()) {
        return errors::POOL_ALREADY_INITIALIZED;
    }

    configs_[config.token] = config;
    return errors::OK;
}

std::optional<TokenPriceConfig> PriceOracle::get_config(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = configs_.find(token);
    if (it == configs_.end()) return std::nullopt;
    return it->second;
}

bool PriceOracle::is_registered(const Currency& token) const {
    std::shared_lock lock(mutex_);
    return configs_.find(token) != configs_.end();
}

void PriceOracle::set_clock(Clock clock) {
    std::unique_lock lock(mutex_);
    clock_ = std::move(clock);
}

// =============================================================================
// Price Updates
// =============================================================================

int32_t PriceOracle::update_price(const Currency& token, I128 price_x18, uint64_t timestamp) {
    if (price_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);

    if (configs_.find(token) == configs_.end()) {
        return errors::NO_PRICE_ROUTE;
    }

    // clock_ is guarded by mutex_
    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    prices_[token] = TokenPriceData{price_x18, timestamp};

    total_updates_.fetch_add(1, std::memory_order_relaxed);

    return errors::OK;
}

void PriceOracle::remove_price(const Currency& token) {
    std::unique_lock lock(mutex_);
    prices_.erase(token);
}

// =============================================================================
// Queries
// =============================================================================

std::optional<I128> PriceOracle::get_price(const Currency& token) const {
    auto data = get_price_data(token);
    if (!data) return std::nullopt;
    return data->price_x18;
}

std::optional<TokenPriceData> PriceOracle::get_price_data(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(token);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

bool PriceOracle::is_price_fresh(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto config_it = configs_.find(token);
    auto price_it = prices_.find(token);
    if (config_it == configs_.end() || price_it == prices_.end()) return false;
    return is_fresh_locked(config_it->second, price_it->second);
}

uint64_t PriceOracle::price_age(const Currency& token) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(token);
    if (it == prices_.end()) return UINT64_MAX;

    uint64_t now = current_timestamp();
    return now > it->second.timestamp ? now - it->second.timestamp : 0;
}

std::optional<I128> PriceOracle::convert(const Currency& token_in, I128 amount,
                                         const Currency& token_out) const {
    if (token_in == token_out) {
        return amount;
    }

    std::shared_lock lock(mutex_);

    auto cfg_in = configs_.find(token_in);
    auto cfg_out = configs_.find(token_out);
    auto px_in = prices_.find(token_in);
    auto px_out = prices_.find(token_out);
    if (cfg_in == configs_.end() || cfg_out == configs_.end() ||
        px_in == prices_.end() || px_out == prices_.end()) {
        return std::nullopt;
    }

    if (!is_fresh_locked(cfg_in->second, px_in->second) ||
        !is_fresh_locked(cfg_out->second, px_out->second)) {
        return std::nullopt;
    }

    // value = amount * p_in * 10^dec_out / (p_out * 10^dec_in)
    uint8_t dec_in = cfg_in->second.decimals;
    uint8_t dec_out = cfg_out->second.decimals;
    I128 value;

    if (dec_out >= dec_in) {
        I128 scaled;
        if (!fp::mul_div(amount, fp::pow10(dec_out - dec_in), 1, scaled)) return std::nullopt;
        if (!fp::mul_div(scaled, px_in->second.price_x18, px_out->second.price_x18, value)) {
            return std::nullopt;
        }
    } else {
        I128 denominator;
        if (!fp::mul_div(px_out->second.price_x18, fp::pow10(dec_in - dec_out), 1, denominator)) {
            return std::nullopt;
        }
        if (!fp::mul_div(amount, px_in->second.price_x18, denominator, value)) return std::nullopt;
    }

    return value;
}

PriceOracle::Stats PriceOracle::get_stats() const {
    std::shared_lock lock(mutex_);

    Stats stats;
    stats.total_tokens = configs_.size();
    stats.total_updates = total_updates_.load(std::memory_order_relaxed);
    stats.stale_prices = 0;

    for (const auto& [token, config] : configs_) {
        auto it = prices_.find(token);
        if (it == prices_.end() || !is_fresh_locked(config, it->second)) {
            ++stats.stale_prices;
        }
    }
    return stats;
}

// =============================================================================
// Helpers
// =============================================================================

uint64_t PriceOracle::current_timestamp() const {
    if (clock_) return clock_();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

bool PriceOracle::is_fresh_locked(const TokenPriceConfig& config, const TokenPriceData& data) const {
    if (config.max_staleness == 0) return true;
    uint64_t now = current_timestamp();
    return now <= data.timestamp || now - data.timestamp <= config.max_staleness;
}

} // namespace crossnav
