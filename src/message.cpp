// =============================================================================
// message.cpp - DestinationMessage JSON codec
// =============================================================================

#include "crossnav/message.hpp"
#include "crossnav/nav.hpp"
#include <nlohmann/json.hpp>

namespace crossnav {

using json = nlohmann::json;

namespace {

// Accepts a decimal string or a JSON integer
bool read_i128(const json& j, const char* key, I128& out) {
    if (!j.contains(key)) return true;

    const json& v = j.at(key);
    if (v.is_string()) {
        auto parsed = fp::parse(v.get<std::string>());
        if (!parsed) return false;
        out = *parsed;
        return true;
    }
    if (v.is_number_unsigned()) {
        out = static_cast<I128>(v.get<uint64_t>());
        return true;
    }
    if (v.is_number_integer()) {
        out = static_cast<I128>(v.get<int64_t>());
        return true;
    }
    return false;
}

bool read_u64(const json& j, const char* key, uint64_t max, uint64_t& out) {
    if (!j.contains(key)) return true;

    const json& v = j.at(key);
    if (!v.is_number_unsigned()) return false;
    uint64_t value = v.get<uint64_t>();
    if (value > max) return false;
    out = value;
    return true;
}

} // namespace

std::string encode_message(const DestinationMessage& message) {
    json j;
    j["opType"] = static_cast<uint8_t>(message.op_type);
    j["sourceChainId"] = message.source_chain_id;
    j["sourceNav"] = fp::to_string(message.source_nav);
    j["sourceDecimals"] = message.source_decimals;
    j["navTolerance"] = message.nav_tolerance_bps;
    j["shouldUnwrap"] = message.should_unwrap;
    j["sourceNativeAmount"] = fp::to_string(message.source_native_amount);
    j["syncMultiplier"] = message.sync_multiplier_bps;
    return j.dump();
}

int32_t decode_message(const std::string& payload, DestinationMessage& out) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("opType")) {
        return errors::INVALID_MESSAGE;
    }

    DestinationMessage message;

    const json& op = j.at("opType");
    if (!op.is_number_integer()) {
        return errors::INVALID_MESSAGE;
    }
    auto op_type = op.is_number_unsigned() ? op_type_from_wire(op.get<uint64_t>()) : std::nullopt;
    if (!op_type) {
        return errors::INVALID_OP_TYPE;
    }
    message.op_type = *op_type;

    uint64_t decimals = message.source_decimals;
    uint64_t tolerance = 0;
    uint64_t multiplier = 0;
    if (!read_u64(j, "sourceChainId", UINT64_MAX, message.source_chain_id) ||
        !read_u64(j, "sourceDecimals", MAX_DECIMALS, decimals) ||
        !read_u64(j, "navTolerance", static_cast<uint64_t>(BPS_DENOMINATOR), tolerance) ||
        !read_i128(j, "sourceNav", message.source_nav) ||
        !read_i128(j, "sourceNativeAmount", message.source_native_amount)) {
        return errors::INVALID_MESSAGE;
    }

    if (!read_u64(j, "syncMultiplier", static_cast<uint64_t>(BPS_DENOMINATOR), multiplier)) {
        return errors::INVALID_SYNC_MULTIPLIER;
    }

    if (j.contains("shouldUnwrap")) {
        if (!j.at("shouldUnwrap").is_boolean()) return errors::INVALID_MESSAGE;
        message.should_unwrap = j.at("shouldUnwrap").get<bool>();
    }

    if (message.source_nav < 0 || message.source_native_amount < 0) {
        return errors::INVALID_MESSAGE;
    }

    message.source_decimals = static_cast<uint8_t>(decimals);

    I128 reference_nav;
    if (normalize_nav(message.source_nav, message.source_decimals, NAV_REFERENCE_DECIMALS,
                      reference_nav) != errors::OK) {
        return errors::INVALID_MESSAGE;
    }

    message.nav_tolerance_bps = static_cast<uint32_t>(tolerance);
    message.sync_multiplier_bps = static_cast<uint32_t>(multiplier);
    out = message;
    return errors::OK;
}

} // namespace crossnav
