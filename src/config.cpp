// =============================================================================
// config.cpp - Config loading and chain presets
// =============================================================================

#include "crossnav/config.hpp"
#include "crossnav/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace crossnav {

using json = nlohmann::json;

namespace {

struct ChainPreset {
    uint64_t chain_id;
    const char* wrapped_native;
    const char* spoke_pool;
};

constexpr ChainPreset CHAIN_PRESETS[] = {
    {1,        "0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2", "0x5c7BCd6E7De5423a257D81B442095A1a6ced35C5"},  // Ethereum
    {10,       "0x4200000000000000000000000000000000000006", "0x6f26Bf09B1C792e3228e5467807a900A503c0281"},  // Optimism
    {56,       "0xbb4CdB9CBd36B01bD1cBaEBF2De08d9173bc095c", "0x4e8E101924eDE233C13e2D8622DC8aED2872d505"},  // BSC
    {130,      "0x4200000000000000000000000000000000000006", "0x09aea4b2242abC8bb4BB78D537A67a245A7bEC64"},  // Unichain
    {137,      "0x0d500B1d8E8eF31E21C99d1Db9A6444d3ADf1270", "0x9295ee1d8C5b022Be115A2AD3c30C72E34e7F096"},  // Polygon
    {8453,     "0x4200000000000000000000000000000000000006", "0x09aea4b2242abC8bb4BB78D537A67a245A7bEC64"},  // Base
    {42161,    "0x82aF49447D8a07e3bd95BD0d56f35241523fBab1", "0xe35e9842fceaca96570b734083f4a58e8f7c5f2a"},  // Arbitrum
    {11155111, "0xfFf9976782d46CC05630D1f6eBAb18b2324d6B14", "0x5ef6C01E11889d86803e0B23e3cB3F9E9d97B662"},  // Sepolia
};

Address parse_address(const json& value, const char* key) {
    if (!value.is_string()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a hex string");
    }
    auto addr = address_from_hex(value.get<std::string>());
    if (!addr) {
        throw std::runtime_error(std::string("Config: invalid address for ") + key + ": " +
                                 value.get<std::string>());
    }
    return *addr;
}

uint64_t parse_unsigned(const json& value, const char* key) {
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("Config: ") + key + " must be a non-negative integer");
    }
    return value.get<uint64_t>();
}

} // namespace

// =============================================================================
// ChainConfig
// =============================================================================

std::optional<ChainConfig> ChainConfig::preset(uint64_t chain_id) {
    for (const auto& entry : CHAIN_PRESETS) {
        if (entry.chain_id != chain_id) continue;

        ChainConfig cfg;
        cfg.chain_id = chain_id;
        cfg.wrapped_native = Currency(*address_from_hex(entry.wrapped_native));
        cfg.spoke_pool = *address_from_hex(entry.spoke_pool);
        return cfg;
    }
    return std::nullopt;
}

// =============================================================================
// Config
// =============================================================================

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root = json::parse(std::string(content), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw std::runtime_error("Config: malformed JSON");
    }

    Config config;

    if (root.contains("log_level")) {
        const json& level = root.at("log_level");
        if (!level.is_string() || !log::parse_level(level.get<std::string>())) {
            throw std::runtime_error("Config: unknown log_level");
        }
        config.log_level = level.get<std::string>();
    }

    if (root.contains("chain")) {
        const json& chain = root.at("chain");
        if (!chain.is_object() || !chain.contains("chain_id")) {
            throw std::runtime_error("Config: chain requires chain_id");
        }

        uint64_t chain_id = parse_unsigned(chain.at("chain_id"), "chain.chain_id");
        config.chain = ChainConfig::preset(chain_id).value_or(ChainConfig{});
        config.chain.chain_id = chain_id;

        if (chain.contains("wrapped_native")) {
            config.chain.wrapped_native = Currency(parse_address(chain.at("wrapped_native"), "chain.wrapped_native"));
        }
        if (chain.contains("spoke_pool")) {
            config.chain.spoke_pool = parse_address(chain.at("spoke_pool"), "chain.spoke_pool");
        }
    }

    if (root.contains("cross_chain_tokens")) {
        const json& tokens = root.at("cross_chain_tokens");
        if (!tokens.is_array()) {
            throw std::runtime_error("Config: cross_chain_tokens must be an array");
        }
        for (const auto& token : tokens) {
            config.cross_chain_tokens.insert(Currency(parse_address(token, "cross_chain_tokens")));
        }
    }

    if (root.contains("max_active_tokens")) {
        uint64_t max = parse_unsigned(root.at("max_active_tokens"), "max_active_tokens");
        if (max == 0) {
            throw std::runtime_error("Config: max_active_tokens must be positive");
        }
        config.max_active_tokens = static_cast<size_t>(max);
    }

    return config;
}

void Config::apply_logging() const {
    auto level = log::parse_level(log_level);
    if (!level) {
        throw std::runtime_error("Config: unknown log_level " + log_level);
    }
    log::set_level(*level);
    log::info("config", "chain " + std::to_string(chain.chain_id) + ", " +
              std::to_string(cross_chain_tokens.size()) + " cross-chain tokens, log level " + log_level);
}

SessionConfig Config::session_config() const {
    SessionConfig cfg;
    cfg.wrapped_native = chain.wrapped_native;
    cfg.cross_chain_tokens = cross_chain_tokens;
    cfg.chain_id = chain.chain_id;
    return cfg;
}

} // namespace crossnav
