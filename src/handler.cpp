// =============================================================================
// handler.cpp - AcrossHandler
// =============================================================================

#include "crossnav/handler.hpp"
#include "crossnav/message.hpp"
#include "crossnav/log.hpp"
#include <stdexcept>

namespace crossnav {

AcrossHandler::AcrossHandler(const Address& spoke_pool, const Address& handler_address,
                             ReconciliationSession& session, IWallet& wallet)
    : spoke_pool_(spoke_pool)
    , address_(handler_address)
    , session_(session)
    , wallet_(wallet) {
    if (is_zero(spoke_pool_)) {
        throw std::invalid_argument("INVALID_SPOKE_POOL");
    }
}

int32_t AcrossHandler::handle_message(const Address& caller, const PoolId& pool,
                                      const Currency& token, I128 amount,
                                      const std::string& payload) {
    if (caller != spoke_pool_) {
        unauthorized_calls_++;
        log::warn("across", "rejected caller " + to_hex(caller));
        return errors::UNAUTHORIZED;
    }

    DestinationMessage message;
    int32_t status = decode_message(payload, message);
    if (status == errors::OK) {
        status = deliver(pool, token, amount, message);
    }

    if (status != errors::OK) {
        fills_rejected_++;
        log::warn("across", std::string("fill rejected: ") + errors::name(status) +
                  " chain=" + std::to_string(message.source_chain_id));
        return status;
    }

    fills_handled_++;
    return errors::OK;
}

int32_t AcrossHandler::deliver(const PoolId& pool, const Currency& token, I128 amount,
                               const DestinationMessage& message) {
    int32_t status = session_.lock(pool, token);
    if (status != errors::OK) {
        return status;
    }

    status = wallet_.transfer(token, address_, pool, amount);
    if (status != errors::OK) {
        // The session never saw a delivery; drop the lock we just opened
        int32_t unlock = session_.force_unlock(pool, token);
        if (unlock != errors::OK) {
            log::error("across", std::string("unlock after failed delivery: ") + errors::name(unlock));
        }
        return status;
    }

    // The NAV spread is checked by finalize against the NAV frozen at lock
    status = session_.finalize(pool, token, amount, message);
    if (status != errors::OK) {
        // Hand the fill back so the pool is as before and it can be retried
        int32_t refund = wallet_.transfer(token, pool, address_, amount);
        if (refund != errors::OK) {
            log::error("across", std::string("refund after failed finalize: ") + errors::name(refund) +
                       " pool=" + to_hex(pool) + " amount=" + fp::to_string(amount));
        }
    }
    return status;
}

AcrossHandler::Stats AcrossHandler::get_stats() const {
    return Stats{fills_handled_.load(), fills_rejected_.load(), unauthorized_calls_.load()};
}

} // namespace crossnav
