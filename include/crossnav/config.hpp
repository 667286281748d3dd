#ifndef CROSSNAV_CONFIG_HPP
#define CROSSNAV_CONFIG_HPP

#include <set>
#include <string>
#include <string_view>
#include <optional>

#include "types.hpp"
#include "registry.hpp"
#include "session.hpp"

namespace crossnav {

// =============================================================================
// Chain Deployment
// =============================================================================

struct ChainConfig {
    uint64_t chain_id = 0;
    Currency wrapped_native;
    Address spoke_pool{};

    // Known wrapped-native and Across spoke-pool deployments
    static std::optional<ChainConfig> preset(uint64_t chain_id);
};

// =============================================================================
// Config - Engine Configuration
// =============================================================================
//
// JSON layout:
//   {
//     "log_level": "info",
//     "chain": { "chain_id": 42161, "wrapped_native": "0x..", "spoke_pool": "0x.." },
//     "cross_chain_tokens": ["0x..", "0x.."],
//     "max_active_tokens": 128
//   }
// A chain with only "chain_id" takes its addresses from the preset.

class Config {
public:
    std::string log_level = "info";
    ChainConfig chain;
    std::set<Currency> cross_chain_tokens;
    size_t max_active_tokens = DEFAULT_MAX_ACTIVE_TOKENS;

    Config() = default;

    // Throw std::runtime_error on unreadable or malformed input
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_chain(const ChainConfig& cfg) {
        chain = cfg;
        return *this;
    }

    Config& with_cross_chain_token(const Currency& token) {
        cross_chain_tokens.insert(token);
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    Config& set_max_active_tokens(size_t max) {
        max_active_tokens = max;
        return *this;
    }

    // Push log_level into the logger. Throws on an unknown level name.
    void apply_logging() const;

    [[nodiscard]] SessionConfig session_config() const;
};

} // namespace crossnav

#endif // CROSSNAV_CONFIG_HPP
