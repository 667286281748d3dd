// =============================================================================
// types.cpp - Address parsing, I128 formatting, error names
// =============================================================================

#include "crossnav/types.hpp"
#include <algorithm>

namespace crossnav {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Address> address_from_hex(const std::string& hex) {
    if (hex.size() != 42 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        return std::nullopt;
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 + i * 2]);
        int lo = hex_value(hex[3 + i * 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

namespace fp {

namespace {

constexpr U128 MASK64 = (static_cast<U128>(1) << 64) - 1;
constexpr U128 I128_MAX_MAGNITUDE = (static_cast<U128>(1) << 127) - 1;

U128 magnitude(I128 v) {
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

// Full 128x128 -> 256-bit product as (hi, lo)
void mul_wide(U128 a, U128 b, U128& hi, U128& lo) {
    U128 a0 = a & MASK64, a1 = a >> 64;
    U128 b0 = b & MASK64, b1 = b >> 64;

    U128 p00 = a0 * b0;
    U128 p01 = a0 * b1;
    U128 p10 = a1 * b0;
    U128 p11 = a1 * b1;

    U128 mid = (p00 >> 64) + (p01 & MASK64) + (p10 & MASK64);
    lo = (p00 & MASK64) | (mid << 64);
    hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
}

I128 apply_sign(U128 q, bool negative) {
    if (q == 0) return 0;
    if (!negative) return static_cast<I128>(q);
    return -static_cast<I128>(q - 1) - 1;
}

} // namespace

bool mul_div(I128 a, I128 b, I128 d, I128& out) {
    if (d == 0) return false;

    bool negative = ((a < 0) != (b < 0)) != (d < 0);
    U128 ud = magnitude(d);

    U128 hi, lo;
    mul_wide(magnitude(a), magnitude(b), hi, lo);

    // Quotient would need more than 128 bits
    if (hi >= ud) return false;

    // Restoring division of (hi:lo) by ud. rem < ud <= 2^127 keeps rem << 1 in range.
    U128 rem = hi;
    U128 q = 0;
    for (int i = 127; i >= 0; --i) {
        rem = (rem << 1) | ((lo >> i) & 1);
        q <<= 1;
        if (rem >= ud) {
            rem -= ud;
            q |= 1;
        }
    }

    U128 limit = negative ? I128_MAX_MAGNITUDE + 1 : I128_MAX_MAGNITUDE;
    if (q > limit) return false;

    out = apply_sign(q, negative);
    return true;
}

std::optional<I128> parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) return std::nullopt;

    U128 limit = negative ? I128_MAX_MAGNITUDE + 1 : I128_MAX_MAGNITUDE;
    U128 value = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (limit - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return apply_sign(value, negative);
}

std::string to_string(I128 v) {
    if (v == 0) return "0";

    bool negative = v < 0;
    U128 u = magnitude(v);

    std::string out;
    while (u > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(u % 10)));
        u /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace fp

std::optional<OpType> op_type_from_wire(uint64_t value) {
    switch (value) {
        case 0: return OpType::TRANSFER;
        case 1: return OpType::REBALANCE;
        case 2: return OpType::SYNC;
        default: return std::nullopt;
    }
}

const char* op_type_name(OpType op) {
    switch (op) {
        case OpType::TRANSFER: return "Transfer";
        case OpType::REBALANCE: return "Rebalance";
        case OpType::SYNC: return "Sync";
    }
    return "Unknown";
}

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK: return "OK";
        case POOL_ALREADY_INITIALIZED: return "POOL_ALREADY_INITIALIZED";
        case TOKEN_NOT_INITIALIZED: return "TOKEN_NOT_INITIALIZED";
        case INVALID_AMOUNT: return "INVALID_AMOUNT";
        case NO_PRICE_ROUTE: return "NO_PRICE_ROUTE";
        case TOO_MANY_TOKENS: return "TOO_MANY_TOKENS";
        case ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case DONATION_LOCK: return "DONATION_LOCK";
        case BALANCE_UNDERFLOW: return "BALANCE_UNDERFLOW";
        case CALLER_TRANSFER_AMOUNT: return "CALLER_TRANSFER_AMOUNT";
        case UNSUPPORTED_CROSS_CHAIN_TOKEN: return "UNSUPPORTED_CROSS_CHAIN_TOKEN";
        case INVALID_OP_TYPE: return "INVALID_OP_TYPE";
        case INVALID_SYNC_MULTIPLIER: return "INVALID_SYNC_MULTIPLIER";
        case NOT_LOCKED: return "NOT_LOCKED";
        case UNWRAP_FAILED: return "UNWRAP_FAILED";
        case NAV_MANIPULATION_DETECTED: return "NAV_MANIPULATION_DETECTED";
        case EFFECTIVE_SUPPLY_ZERO: return "EFFECTIVE_SUPPLY_ZERO";
        case NEGATIVE_NAV: return "NEGATIVE_NAV";
        case NAV_SPREAD_EXCEEDED: return "NAV_SPREAD_EXCEEDED";
        case REENTRANCY: return "REENTRANCY";
        case UNAUTHORIZED: return "UNAUTHORIZED";
        case INVALID_MESSAGE: return "INVALID_MESSAGE";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace errors

} // namespace crossnav
