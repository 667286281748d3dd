#ifndef CROSSNAV_TYPES_HPP
#define CROSSNAV_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <optional>

namespace crossnav {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

constexpr Address ZERO_ADDRESS = {};

// Parse "0x" + 40 hex digits. Returns nullopt on malformed input.
std::optional<Address> address_from_hex(const std::string& hex);
std::string to_hex(const Address& addr);

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// =============================================================================
// Fixed-Point Arithmetic
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Basis points denominator (100% = 10000)
constexpr I128 BPS_DENOMINATOR = 10000;

// Sentinel amount marking the lock leg of a donation session
constexpr I128 LOCK_SENTINEL = 1;

// Largest supported precision: 10^38 still fits in I128
constexpr uint8_t MAX_DECIMALS = 38;

namespace fp {

constexpr I128 pow10(uint8_t decimals) {
    I128 r = 1;
    for (uint8_t i = 0; i < decimals; ++i) r *= 10;
    return r;
}

constexpr I128 abs(I128 v) { return v < 0 ? -v : v; }

inline bool checked_add(I128 a, I128 b, I128& out) {
    return !__builtin_add_overflow(a, b, &out);
}

inline bool checked_sub(I128 a, I128 b, I128& out) {
    return !__builtin_sub_overflow(a, b, &out);
}

// out = a * b / d with a 256-bit intermediate, truncated toward zero.
// False when d == 0 or the quotient does not fit in I128.
bool mul_div(I128 a, I128 b, I128 d, I128& out);

// Decimal string with optional leading '-'
std::optional<I128> parse(const std::string& text);
std::string to_string(I128 v);

} // namespace fp

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }

    uint64_t hash() const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return h;
    }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const { return static_cast<size_t>(c.hash()); }
};

// Chain native coin (address(0))
inline const Currency NATIVE{};

// Pool identity
using PoolId = Address;

struct PoolIdHash {
    size_t operator()(const PoolId& id) const {
        uint64_t h = 0;
        for (auto b : id) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Bridge Operation Types
// =============================================================================

// Wire values are fixed: Transfer = 0, Rebalance = 1, Sync = 2.
// Rebalance is the legacy name for Sync and is handled identically.
enum class OpType : uint8_t {
    TRANSFER = 0,
    REBALANCE = 1,
    SYNC = 2
};

std::optional<OpType> op_type_from_wire(uint64_t value);
const char* op_type_name(OpType op);

struct DestinationMessageParams {
    OpType op_type = OpType::TRANSFER;
    bool should_unwrap_native = false;
    uint32_t sync_multiplier_bps = 0;   // [0, 10000]
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t TOKEN_NOT_INITIALIZED = -3;
constexpr int32_t INVALID_AMOUNT = -4;
constexpr int32_t NO_PRICE_ROUTE = -5;
constexpr int32_t TOO_MANY_TOKENS = -6;
constexpr int32_t ARITHMETIC_OVERFLOW = -7;
constexpr int32_t DONATION_LOCK = -10;
constexpr int32_t BALANCE_UNDERFLOW = -11;
constexpr int32_t CALLER_TRANSFER_AMOUNT = -12;
constexpr int32_t UNSUPPORTED_CROSS_CHAIN_TOKEN = -13;
constexpr int32_t INVALID_OP_TYPE = -14;
constexpr int32_t INVALID_SYNC_MULTIPLIER = -15;
constexpr int32_t NOT_LOCKED = -16;
constexpr int32_t UNWRAP_FAILED = -17;
constexpr int32_t NAV_MANIPULATION_DETECTED = -20;
constexpr int32_t EFFECTIVE_SUPPLY_ZERO = -21;
constexpr int32_t NEGATIVE_NAV = -22;
constexpr int32_t NAV_SPREAD_EXCEEDED = -23;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t INVALID_MESSAGE = -41;

// Stable identifier for operators and logs, e.g. "BALANCE_UNDERFLOW"
const char* name(int32_t code);
}

} // namespace crossnav

#endif // CROSSNAV_TYPES_HPP
