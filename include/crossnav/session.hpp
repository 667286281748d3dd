#ifndef CROSSNAV_SESSION_HPP
#define CROSSNAV_SESSION_HPP

#include <functional>
#include <utility>
#include <set>
#include <string>

#include "types.hpp"
#include "pool.hpp"
#include "nav.hpp"
#include "wallet.hpp"
#include "registry.hpp"
#include "modes.hpp"
#include "message.hpp"

namespace crossnav {

// =============================================================================
// Scoped Guards
// =============================================================================

// Single-call reentrancy guard for a pool. Requires the pool mutex held.
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(PoolState& pool);
    ~ReentrancyGuard();

    // Non-copyable
    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    PoolState& pool_;
    bool acquired_;
};

// Releases a token's donation lock and snapshot when it goes out of scope
class SessionRelease {
public:
    SessionRelease(PoolState& pool, const Currency& token);
    ~SessionRelease();

    // Non-copyable
    SessionRelease(const SessionRelease&) = delete;
    SessionRelease& operator=(const SessionRelease&) = delete;

private:
    PoolState& pool_;
    Currency token_;
};

// =============================================================================
// Session Types
// =============================================================================

struct SessionConfig {
    Currency wrapped_native;
    std::set<Currency> cross_chain_tokens;      // Tokens accepted by finalize
    uint64_t chain_id = 0;                      // Stamped on outbound messages
};

// Emitted after every successful finalize
struct TokensReceived {
    PoolId pool;
    Currency token;                 // Token the pool ends up holding
    I128 amount;                    // Nominal amount declared by the caller
    I128 amount_delta;              // Balance increase observed since lock
    OpType op_type;
    I128 virtual_balance_cleared;
    I128 virtual_supply_minted;
    I128 unitary_value;             // NAV after the delivery
};

// =============================================================================
// ReconciliationSession - Donation Lock / Finalize Protocol
// =============================================================================
//
// lock() snapshots the pool before an inbound transfer lands. finalize()
// measures what actually arrived, applies the mode handler to the virtual
// ledger and checks the recomputed NAV against the snapshot. A failed
// finalize leaves the pool exactly as it was and always releases the lock.

class ReconciliationSession {
public:
    using EventCallback = std::function<void(const TokensReceived&)>;

    ReconciliationSession(PoolStore& pools, const NavEngine& nav, IWallet& wallet,
                          TokenRegistry& registry, SessionConfig config);

    // Non-copyable
    ReconciliationSession(const ReconciliationSession&) = delete;
    ReconciliationSession& operator=(const ReconciliationSession&) = delete;

    // =========================================================================
    // Session Protocol
    // =========================================================================

    int32_t lock(const PoolId& pool_id, const Currency& token);

    int32_t finalize(const PoolId& pool_id, const Currency& token, I128 amount,
                     const DestinationMessageParams& params);

    // Same as above; also records the spread against the source chain's NAV
    int32_t finalize(const PoolId& pool_id, const Currency& token, I128 amount,
                     const DestinationMessage& message);

    // Source-leg bookkeeping: value leaving this pool for another chain.
    // Transfer keeps NAV unchanged by crediting the full value as a virtual
    // balance; Sync credits only multiplier/10000 of it.
    int32_t record_outbound(const PoolId& pool_id, I128 amount_in_base, OpType op_type,
                            uint32_t sync_multiplier_bps = 0);

    // record_outbound plus the encoded DestinationMessage for the bridge,
    // carrying this pool's NAV after the departure is booked. Call once the
    // tokens have left the pool.
    int32_t prepare_outbound(const PoolId& pool_id, I128 amount_in_base,
                             const SourceMessage& intent, std::string& payload);

    // =========================================================================
    // Administration
    // =========================================================================

    bool is_locked(const PoolId& pool_id, const Currency& token) const;

    // Clears a lock whose finalize never arrived
    int32_t force_unlock(const PoolId& pool_id, const Currency& token);

    NavResult current_nav(const PoolId& pool_id) const;

    // Recompute and persist the pool's unitary value
    int32_t update_unitary_value(const PoolId& pool_id);

    void set_event_callback(EventCallback callback) { on_received_ = std::move(callback); }

    const SessionConfig& config() const { return config_; }
    const PoolStore& pools() const { return pools_; }

private:
    PoolStore& pools_;
    const NavEngine& nav_;
    IWallet& wallet_;
    TokenRegistry& registry_;
    SessionConfig config_;
    EventCallback on_received_;

    TransferModeHandler transfer_handler_;
    SyncModeHandler sync_handler_;

    struct Delivery;

    // nullptr for an op type outside the closed set
    const IModeHandler* handler_for(OpType op_type) const;

    int32_t finalize_impl(const PoolId& pool_id, const Currency& token, I128 amount,
                          const DestinationMessageParams& params, const DestinationMessage* message);

    // Validates the delivery and applies it, rolling back on failure.
    // Requires the pool mutex held.
    int32_t settle(PoolState& pool, const Currency& token, I128 amount,
                   const DonationSnapshot& snapshot, const DestinationMessageParams& params,
                   const DestinationMessage* message, TokensReceived& event);

    int32_t apply_delivery(PoolState& pool, const Delivery& delivery, I128& unwrapped,
                           TokensReceived& event);

    // Requires the pool mutex held
    int32_t credit_outbound(PoolState& pool, I128 amount_in_base, OpType op_type,
                            uint32_t sync_multiplier_bps);
};

} // namespace crossnav

#endif // CROSSNAV_SESSION_HPP
