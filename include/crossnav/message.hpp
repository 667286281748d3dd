#ifndef CROSSNAV_MESSAGE_HPP
#define CROSSNAV_MESSAGE_HPP

#include <string>

#include "types.hpp"

namespace crossnav {

// =============================================================================
// DestinationMessage - Payload Carried by a Bridge Fill
// =============================================================================

struct DestinationMessage {
    OpType op_type = OpType::TRANSFER;
    uint64_t source_chain_id = 0;
    I128 source_nav = 0;                // Source pool unitary value (0 = not sent)
    uint8_t source_decimals = 18;
    uint32_t nav_tolerance_bps = 0;     // Allowed NAV spread (0 = unchecked)
    bool should_unwrap = false;
    I128 source_native_amount = 0;
    uint32_t sync_multiplier_bps = 0;

    DestinationMessageParams params() const {
        return DestinationMessageParams{op_type, should_unwrap, sync_multiplier_bps};
    }
};

// Intent attached to an outbound bridge deposit. The source pool turns it
// into the DestinationMessage the receiving chain finalizes with.
struct SourceMessage {
    OpType op_type = OpType::TRANSFER;
    uint32_t nav_tolerance_bps = 0;
    bool should_unwrap_on_destination = false;
    I128 source_native_amount = 0;
    uint32_t sync_multiplier_bps = 0;   // Sync and Rebalance only
};

// A decoded source NAV must fit at this precision
constexpr uint8_t NAV_REFERENCE_DECIMALS = 18;

// JSON encoding. 128-bit fields travel as decimal strings.
std::string encode_message(const DestinationMessage& message);

// Returns INVALID_MESSAGE, INVALID_OP_TYPE or INVALID_SYNC_MULTIPLIER on
// a malformed payload; `out` is only written on success.
int32_t decode_message(const std::string& payload, DestinationMessage& out);

} // namespace crossnav

#endif // CROSSNAV_MESSAGE_HPP
