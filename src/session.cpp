// =============================================================================
// session.cpp - ReconciliationSession
// =============================================================================

#include "crossnav/session.hpp"
#include "crossnav/log.hpp"
#include <mutex>

namespace crossnav {

// =============================================================================
// Scoped Guards
// =============================================================================

ReentrancyGuard::ReentrancyGuard(PoolState& pool)
    : pool_(pool)
    , acquired_(!pool.entered_) {
    if (acquired_) pool_.entered_ = true;
}

ReentrancyGuard::~ReentrancyGuard() {
    if (acquired_) pool_.entered_ = false;
}

SessionRelease::SessionRelease(PoolState& pool, const Currency& token)
    : pool_(pool)
    , token_(token) {}

SessionRelease::~SessionRelease() {
    pool_.sessions_.erase(token_);
}

// =============================================================================
// Delivery - What finalize measured before touching any state
// =============================================================================

struct ReconciliationSession::Delivery {
    const Currency& token;
    I128 amount;
    I128 amount_delta;
    I128 amount_in_base;
    I128 delta_in_base;
    I128 source_nav;                // At pool precision, 0 when not sent
    const DonationSnapshot& snapshot;
    const DestinationMessageParams& params;
    const DestinationMessage* message;
    const IModeHandler& handler;
};

ReconciliationSession::ReconciliationSession(PoolStore& pools, const NavEngine& nav,
                                             IWallet& wallet, TokenRegistry& registry,
                                             SessionConfig config)
    : pools_(pools)
    , nav_(nav)
    , wallet_(wallet)
    , registry_(registry)
    , config_(std::move(config)) {}

const IModeHandler* ReconciliationSession::handler_for(OpType op_type) const {
    switch (op_type) {
        case OpType::TRANSFER:
            return &transfer_handler_;
        case OpType::REBALANCE:
        case OpType::SYNC:
            return &sync_handler_;
    }
    return nullptr;
}

// =============================================================================
// Lock
// =============================================================================

int32_t ReconciliationSession::lock(const PoolId& pool_id, const Currency& token) {
    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    if (pool->is_locked(token)) {
        return errors::DONATION_LOCK;
    }

    I128 balance = wallet_.balance_of(token, pool->id());
    auto token_value = nav_.value_in_base(*pool, token, balance);
    if (!token_value) {
        return errors::NO_PRICE_ROUTE;
    }

    NavResult nav = nav_.compute_nav(*pool);
    if (nav.status != errors::OK) {
        return nav.status;
    }

    // A token that is not active yet is not in the NAV; finalize activates
    // it, so count its current holding as part of the baseline.
    I128 uncounted = pool->is_active(token) ? 0 : *token_value;

    pool->sessions_[token] = DonationSnapshot{
        balance,
        *token_value,
        nav.unitary_value,
        nav.total_assets + uncounted,
        nav.net_total_value + uncounted,
        nav.effective_supply
    };

    log::debug("session", "locked " + to_hex(token.addr) + " on pool " + to_hex(pool->id()));
    return errors::OK;
}

// =============================================================================
// Finalize
// =============================================================================

int32_t ReconciliationSession::finalize(const PoolId& pool_id, const Currency& token, I128 amount,
                                        const DestinationMessageParams& params) {
    return finalize_impl(pool_id, token, amount, params, nullptr);
}

int32_t ReconciliationSession::finalize(const PoolId& pool_id, const Currency& token, I128 amount,
                                        const DestinationMessage& message) {
    return finalize_impl(pool_id, token, amount, message.params(), &message);
}

int32_t ReconciliationSession::finalize_impl(const PoolId& pool_id, const Currency& token,
                                             I128 amount, const DestinationMessageParams& params,
                                             const DestinationMessage* message) {
    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    auto snapshot = pool->snapshot(token);
    if (!snapshot) {
        return errors::DONATION_LOCK;
    }

    TokensReceived event{};
    int32_t status;
    {
        SessionRelease release(*pool, token);
        status = settle(*pool, token, amount, *snapshot, params, message, event);
    }

    if (status != errors::OK) {
        log::warn("session", std::string("finalize rejected: ") + errors::name(status) +
                  " token=" + to_hex(token.addr) + " pool=" + to_hex(pool->id()));
        return status;
    }

    log::info("session", std::string(op_type_name(event.op_type)) + " received " +
              fp::to_string(event.amount_delta) + " of " + to_hex(event.token.addr) +
              " pool=" + to_hex(pool->id()) + " nav=" + fp::to_string(event.unitary_value));

    // Runs under the pool lock; nested session calls see REENTRANCY
    if (on_received_) {
        on_received_(event);
    }
    return errors::OK;
}

int32_t ReconciliationSession::settle(PoolState& pool, const Currency& token, I128 amount,
                                      const DonationSnapshot& snapshot,
                                      const DestinationMessageParams& params,
                                      const DestinationMessage* message, TokensReceived& event) {
    // An amount of 1 is the lock sentinel, never a delivery
    if (amount <= LOCK_SENTINEL) {
        return errors::INVALID_AMOUNT;
    }

    I128 balance = wallet_.balance_of(token, pool.id());
    if (balance < snapshot.stored_balance) {
        return errors::BALANCE_UNDERFLOW;
    }

    I128 amount_delta = balance - snapshot.stored_balance;
    if (amount_delta < amount) {
        return errors::CALLER_TRANSFER_AMOUNT;
    }

    if (config_.cross_chain_tokens.count(token) == 0) {
        return errors::UNSUPPORTED_CROSS_CHAIN_TOKEN;
    }

    const IModeHandler* handler = handler_for(params.op_type);
    if (!handler) {
        return errors::INVALID_OP_TYPE;
    }
    if (params.sync_multiplier_bps > BPS_DENOMINATOR) {
        return errors::INVALID_SYNC_MULTIPLIER;
    }

    // The spread is judged against the NAV frozen at lock
    I128 source_nav = 0;
    if (message && message->source_nav > 0) {
        if (normalize_nav(message->source_nav, message->source_decimals, pool.decimals(),
                          source_nav) != errors::OK) {
            return errors::INVALID_MESSAGE;
        }
        if (message->nav_tolerance_bps > 0) {
            I128 tolerance;
            if (tolerance_amount(snapshot.stored_unitary_value, message->nav_tolerance_bps,
                                 tolerance) != errors::OK) {
                return errors::ARITHMETIC_OVERFLOW;
            }
            I128 spread = fp::abs(snapshot.stored_unitary_value - source_nav);
            if (spread > tolerance) {
                log::warn("session", "nav spread " + fp::to_string(spread) + " exceeds tolerance " +
                          fp::to_string(tolerance) + " chain=" + std::to_string(message->source_chain_id));
                return errors::NAV_SPREAD_EXCEEDED;
            }
        }
    }

    auto amount_in_base = nav_.value_in_base(pool, token, amount);
    auto balance_value = nav_.value_in_base(pool, token, balance);
    if (!amount_in_base || !balance_value) {
        return errors::NO_PRICE_ROUTE;
    }

    Delivery delivery{
        token,
        amount,
        amount_delta,
        *amount_in_base,
        *balance_value - snapshot.stored_token_value,
        source_nav,
        snapshot,
        params,
        message,
        *handler
    };

    auto checkpoint = pool.checkpoint();
    I128 unwrapped = 0;

    int32_t status = apply_delivery(pool, delivery, unwrapped, event);
    if (status == errors::OK) {
        return errors::OK;
    }

    pool.restore(checkpoint);
    if (unwrapped > 0) {
        int32_t rewrap = wallet_.wrap_native(pool.id(), unwrapped);
        if (rewrap != errors::OK) {
            log::error("session", std::string("re-wrap after failed finalize: ") + errors::name(rewrap) +
                       " pool=" + to_hex(pool.id()) + " amount=" + fp::to_string(unwrapped));
        }
    }
    return status;
}

int32_t ReconciliationSession::apply_delivery(PoolState& pool, const Delivery& delivery,
                                              I128& unwrapped, TokensReceived& event) {
    const DonationSnapshot& snapshot = delivery.snapshot;

    Currency held = delivery.token;
    I128 received_in_base = delivery.delta_in_base;
    I128 uncounted = 0;             // Baseline correction for tokens activated here

    // =========================================================================
    // Unwrap the wrapped-native delivery into the native coin
    // =========================================================================

    if (delivery.params.should_unwrap_native && delivery.token == config_.wrapped_native &&
        !config_.wrapped_native.is_native()) {
        I128 native_before = wallet_.balance_of(NATIVE, pool.id());
        auto before_value = nav_.value_in_base(pool, NATIVE, native_before);
        if (!before_value) {
            return errors::NO_PRICE_ROUTE;
        }

        if (wallet_.unwrap_native(pool.id(), delivery.amount_delta) != errors::OK) {
            return errors::UNWRAP_FAILED;
        }
        unwrapped = delivery.amount_delta;

        auto after_value = nav_.value_in_base(pool, NATIVE, native_before + delivery.amount_delta);
        if (!after_value) {
            return errors::NO_PRICE_ROUTE;
        }

        // The wrapped balance is back at its snapshot; native carries the delivery
        held = NATIVE;
        received_in_base = *after_value - *before_value;
        if (!pool.is_active(NATIVE)) {
            uncounted = *before_value;
        }
        // lock counted the wrapped holding, but it stays inactive
        if (!pool.is_active(delivery.token)) {
            uncounted -= snapshot.stored_token_value;
        }
    }

    ActivationResult activation = registry_.add_if_new(pool, held);
    if (activation.status != errors::OK) {
        return activation.status;
    }

    // =========================================================================
    // Virtual ledger
    // =========================================================================

    ModeContext ctx{
        pool.ledger_,
        pool.base_token(),
        pool.decimals(),
        snapshot.stored_unitary_value,
        snapshot.stored_net_value + uncounted,
        snapshot.stored_effective_supply,
        delivery.amount_in_base,
        received_in_base,
        delivery.params.sync_multiplier_bps
    };

    ModeOutcome outcome = delivery.handler.apply(ctx);
    if (outcome.status != errors::OK) {
        return outcome.status;
    }

    // =========================================================================
    // Integrity
    // =========================================================================

    NavResult nav = nav_.compute_nav(pool);
    if (nav.status != errors::OK) {
        return nav.status;
    }

    // Physical assets may only have grown by what this delivery brought in
    if (nav.total_assets != snapshot.stored_assets + uncounted + received_in_base) {
        return errors::NAV_MANIPULATION_DETECTED;
    }

    int32_t status = delivery.handler.verify(ctx, outcome, nav);
    if (status != errors::OK) {
        return status;
    }

    pool.unitary_value_ = nav.unitary_value;

    const DestinationMessage* message = delivery.message;
    if (message && delivery.source_nav > 0) {
        pool.chain_nav_spreads_[message->source_chain_id] = nav.unitary_value - delivery.source_nav;
    }

    event = TokensReceived{
        pool.id(),
        held,
        delivery.amount,
        delivery.amount_delta,
        delivery.params.op_type,
        outcome.virtual_balance_cleared,
        outcome.virtual_supply_minted,
        nav.unitary_value
    };
    return errors::OK;
}

// =============================================================================
// Source Leg
// =============================================================================

int32_t ReconciliationSession::record_outbound(const PoolId& pool_id, I128 amount_in_base,
                                               OpType op_type, uint32_t sync_multiplier_bps) {
    if (amount_in_base <= 0) {
        return errors::INVALID_AMOUNT;
    }

    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    return credit_outbound(*pool, amount_in_base, op_type, sync_multiplier_bps);
}

int32_t ReconciliationSession::prepare_outbound(const PoolId& pool_id, I128 amount_in_base,
                                                const SourceMessage& intent, std::string& payload) {
    if (amount_in_base <= 0 || intent.source_native_amount < 0) {
        return errors::INVALID_AMOUNT;
    }
    if (intent.nav_tolerance_bps > BPS_DENOMINATOR) {
        return errors::INVALID_MESSAGE;
    }

    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    auto checkpoint = pool->checkpoint();

    int32_t status = credit_outbound(*pool, amount_in_base, intent.op_type, intent.sync_multiplier_bps);
    if (status != errors::OK) {
        return status;
    }

    // The destination compares against the NAV with this departure booked
    NavResult nav = nav_.compute_nav(*pool);
    if (nav.status != errors::OK) {
        pool->restore(checkpoint);
        return nav.status;
    }

    DestinationMessage message;
    message.op_type = intent.op_type;
    message.source_chain_id = config_.chain_id;
    message.source_nav = nav.unitary_value;
    message.source_decimals = pool->decimals();
    message.nav_tolerance_bps = intent.nav_tolerance_bps;
    message.should_unwrap = intent.should_unwrap_on_destination;
    message.source_native_amount = intent.source_native_amount;
    message.sync_multiplier_bps = intent.op_type == OpType::TRANSFER ? 0 : intent.sync_multiplier_bps;

    payload = encode_message(message);
    return errors::OK;
}

int32_t ReconciliationSession::credit_outbound(PoolState& pool, I128 amount_in_base,
                                               OpType op_type, uint32_t sync_multiplier_bps) {
    I128 credited = 0;
    switch (op_type) {
        case OpType::TRANSFER:
            credited = amount_in_base;
            break;
        case OpType::REBALANCE:
        case OpType::SYNC:
            if (sync_multiplier_bps > BPS_DENOMINATOR) {
                return errors::INVALID_SYNC_MULTIPLIER;
            }
            if (!fp::mul_div(amount_in_base, sync_multiplier_bps, BPS_DENOMINATOR, credited)) {
                return errors::ARITHMETIC_OVERFLOW;
            }
            break;
        default:
            return errors::INVALID_OP_TYPE;
    }

    if (credited == 0) {
        return errors::OK;
    }

    int32_t status = pool.ledger_.update_virtual_balance(pool.base_token(), credited);
    if (status == errors::OK) {
        log::debug("session", "outbound " + std::string(op_type_name(op_type)) + " virtual balance +" +
                   fp::to_string(credited) + " pool=" + to_hex(pool.id()));
    }
    return status;
}

// =============================================================================
// Administration
// =============================================================================

bool ReconciliationSession::is_locked(const PoolId& pool_id, const Currency& token) const {
    const PoolState* pool = pools_.find(pool_id);
    if (!pool) return false;

    std::lock_guard pool_lock(pool->mutex());
    return pool->is_locked(token);
}

int32_t ReconciliationSession::force_unlock(const PoolId& pool_id, const Currency& token) {
    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    if (pool->sessions_.erase(token) == 0) {
        return errors::NOT_LOCKED;
    }

    log::warn("session", "force-unlocked " + to_hex(token.addr) + " on pool " + to_hex(pool->id()));
    return errors::OK;
}

NavResult ReconciliationSession::current_nav(const PoolId& pool_id) const {
    const PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return NavResult{errors::TOKEN_NOT_INITIALIZED, 0, 0, 0, 0};
    }
    return nav_.compute_nav(*pool);
}

int32_t ReconciliationSession::update_unitary_value(const PoolId& pool_id) {
    PoolState* pool = pools_.find(pool_id);
    if (!pool) {
        return errors::TOKEN_NOT_INITIALIZED;
    }

    std::lock_guard pool_lock(pool->mutex());
    ReentrancyGuard guard(*pool);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    NavResult nav = nav_.compute_nav(*pool);
    if (nav.status != errors::OK) {
        return nav.status;
    }

    pool->unitary_value_ = nav.unitary_value;
    return errors::OK;
}

} // namespace crossnav
