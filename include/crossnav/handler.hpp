#ifndef CROSSNAV_HANDLER_HPP
#define CROSSNAV_HANDLER_HPP

#include <string>
#include <atomic>

#include "types.hpp"
#include "session.hpp"
#include "wallet.hpp"

namespace crossnav {

// =============================================================================
// AcrossHandler - Destination Side of an Across Bridge Fill
// =============================================================================
//
// The spoke pool delivers the filled tokens to the handler's own address
// and then calls handle_message(). The handler opens a donation session on
// the target pool, moves the tokens in and finalizes with the decoded
// destination message. A rejected finalize returns the tokens to the
// handler.

class AcrossHandler {
public:
    // Throws std::invalid_argument("INVALID_SPOKE_POOL") for a zero spoke pool
    AcrossHandler(const Address& spoke_pool, const Address& handler_address,
                  ReconciliationSession& session, IWallet& wallet);

    // Non-copyable
    AcrossHandler(const AcrossHandler&) = delete;
    AcrossHandler& operator=(const AcrossHandler&) = delete;

    int32_t handle_message(const Address& caller, const PoolId& pool, const Currency& token,
                           I128 amount, const std::string& payload);

    const Address& spoke_pool() const { return spoke_pool_; }
    const Address& address() const { return address_; }

    struct Stats {
        uint64_t fills_handled;
        uint64_t fills_rejected;
        uint64_t unauthorized_calls;
    };
    Stats get_stats() const;

private:
    Address spoke_pool_;
    Address address_;
    ReconciliationSession& session_;
    IWallet& wallet_;

    std::atomic<uint64_t> fills_handled_{0};
    std::atomic<uint64_t> fills_rejected_{0};
    std::atomic<uint64_t> unauthorized_calls_{0};

    int32_t deliver(const PoolId& pool, const Currency& token, I128 amount,
                    const DestinationMessage& message);
};

} // namespace crossnav

#endif // CROSSNAV_HANDLER_HPP
