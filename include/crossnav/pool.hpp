#ifndef CROSSNAV_POOL_HPP
#define CROSSNAV_POOL_HPP

#include <map>
#include <set>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <memory>
#include <optional>
#include <vector>

#include "types.hpp"
#include "ledger.hpp"

namespace crossnav {

// =============================================================================
// Donation Snapshot (captured by the lock leg of a session)
// =============================================================================

struct DonationSnapshot {
    I128 stored_balance;            // Wallet balance of the token at lock
    I128 stored_token_value;        // stored_balance in base-token units
    I128 stored_unitary_value;      // NAV per share at lock
    I128 stored_assets;             // Physical asset value at lock (base units)
    I128 stored_net_value;          // Assets plus virtual balances at lock
    I128 stored_effective_supply;   // total supply plus virtual supply at lock
};

// =============================================================================
// PoolState - NAV State of a Single Pool
// =============================================================================
//
// Read access is public. The virtual ledger, donation sessions and active
// token set are written only by ReconciliationSession, TokenRegistry and
// PoolStore.

class PoolState {
public:
    PoolState(const PoolId& id, const Currency& base_token, uint8_t decimals);

    // Non-copyable
    PoolState(const PoolState&) = delete;
    PoolState& operator=(const PoolState&) = delete;

    const PoolId& id() const { return id_; }
    const Currency& base_token() const { return base_token_; }
    uint8_t decimals() const { return decimals_; }
    I128 unitary_value() const { return unitary_value_; }
    I128 total_supply() const { return total_supply_; }

    const SignedLedger& ledger() const { return ledger_; }

    // Active tokens other than the base token (always implicitly active)
    const std::set<Currency>& active_tokens() const { return active_tokens_; }
    bool is_active(const Currency& token) const;

    bool is_locked(const Currency& token) const;
    std::optional<DonationSnapshot> snapshot(const Currency& token) const;
    size_t open_sessions() const { return sessions_.size(); }

    // Signed spread between this pool's NAV and a source chain's NAV
    std::optional<I128> chain_nav_spread(uint64_t chain_id) const;
    const std::map<uint64_t, I128>& chain_nav_spreads() const { return chain_nav_spreads_; }

    // Held for the whole of a lock/finalize call
    std::recursive_mutex& mutex() const { return mutex_; }

private:
    friend class PoolStore;
    friend class ReconciliationSession;
    friend class TokenRegistry;
    friend class ReentrancyGuard;
    friend class SessionRelease;

    // Everything finalize may change, restored when finalize fails
    struct Checkpoint {
        SignedLedger ledger;
        std::set<Currency> active_tokens;
        I128 unitary_value;
        std::map<uint64_t, I128> chain_nav_spreads;
    };

    Checkpoint checkpoint() const;
    void restore(const Checkpoint& checkpoint);

    PoolId id_;
    Currency base_token_;
    uint8_t decimals_;
    I128 unitary_value_;
    I128 total_supply_{0};

    SignedLedger ledger_;
    std::set<Currency> active_tokens_;
    std::map<uint64_t, I128> chain_nav_spreads_;

    // token -> snapshot; presence means the donation lock is held
    std::unordered_map<Currency, DonationSnapshot, CurrencyHash> sessions_;
    bool entered_{false};

    mutable std::recursive_mutex mutex_;
};

// =============================================================================
// PoolStore - Pools Keyed by Identity
// =============================================================================

class PoolStore {
public:
    PoolStore() = default;

    // Non-copyable
    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    // Initialise a pool at NAV 1.0 (10^decimals)
    int32_t create_pool(const PoolId& id, const Currency& base_token, uint8_t decimals);
    bool pool_exists(const PoolId& id) const;

    // Pools are never removed, so returned pointers stay valid
    PoolState* find(const PoolId& id);
    const PoolState* find(const PoolId& id) const;

    // Real share supply is owned by fund accounting; this sets it directly
    int32_t set_total_supply(const PoolId& id, I128 total_supply);

    std::vector<PoolId> pool_ids() const;

private:
    std::unordered_map<PoolId, std::unique_ptr<PoolState>, PoolIdHash> pools_;
    mutable std::shared_mutex pools_mutex_;
};

} // namespace crossnav

#endif // CROSSNAV_POOL_HPP
