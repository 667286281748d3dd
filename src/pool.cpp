// =============================================================================
// pool.cpp - PoolState and PoolStore
// =============================================================================

#include "crossnav/pool.hpp"

namespace crossnav {

// =============================================================================
// PoolState
// =============================================================================

PoolState::PoolState(const PoolId& id, const Currency& base_token, uint8_t decimals)
    : id_(id)
    , base_token_(base_token)
    , decimals_(decimals)
    , unitary_value_(fp::pow10(decimals)) {}

bool PoolState::is_active(const Currency& token) const {
    return token == base_token_ || active_tokens_.count(token) > 0;
}

bool PoolState::is_locked(const Currency& token) const {
    return sessions_.find(token) != sessions_.end();
}

std::optional<DonationSnapshot> PoolState::snapshot(const Currency& token) const {
    auto it = sessions_.find(token);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::optional<I128> PoolState::chain_nav_spread(uint64_t chain_id) const {
    auto it = chain_nav_spreads_.find(chain_id);
    if (it == chain_nav_spreads_.end()) return std::nullopt;
    return it->second;
}

PoolState::Checkpoint PoolState::checkpoint() const {
    return Checkpoint{ledger_, active_tokens_, unitary_value_, chain_nav_spreads_};
}

void PoolState::restore(const Checkpoint& checkpoint) {
    ledger_ = checkpoint.ledger;
    active_tokens_ = checkpoint.active_tokens;
    unitary_value_ = checkpoint.unitary_value;
    chain_nav_spreads_ = checkpoint.chain_nav_spreads;
}

// =============================================================================
// PoolStore
// =============================================================================

int32_t PoolStore::create_pool(const PoolId& id, const Currency& base_token, uint8_t decimals) {
    if (decimals > MAX_DECIMALS) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(pools_mutex_);

    if (pools_.find(id) != pools_.end()) {
        return errors::POOL_ALREADY_INITIALIZED;
    }

    pools_[id] = std::make_unique<PoolState>(id, base_token, decimals);
    return errors::OK;
}

bool PoolStore::pool_exists(const PoolId& id) const {
    std::shared_lock lock(pools_mutex_);
    return pools_.find(id) != pools_.end();
}

PoolState* PoolStore::find(const PoolId& id) {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(id);
    return (it != pools_.end()) ? it->second.get() : nullptr;
}

const PoolState* PoolStore::find(const PoolId& id) const {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(id);
    return (it != pools_.end()) ? it->second.get() : nullptr;
}

int32_t PoolStore::set_total_supply(const PoolId& id, I128 total_supply) {
    if (total_supply < 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolState* pool = find(id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard lock(pool->mutex());
    pool->total_supply_ = total_supply;
    return errors::OK;
}

std::vector<PoolId> PoolStore::pool_ids() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<PoolId> ids;
    ids.reserve(pools_.size());
    for (const auto& [id, pool] : pools_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace crossnav
