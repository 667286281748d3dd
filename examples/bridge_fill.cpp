// crossnav - Bridge Fill Example
//
// Walks one Across fill through the destination pool: the spoke pool
// delivers WETH to the handler, the handler locks the pool, moves the
// tokens in and finalizes. NAV per share is printed before and after.

#include <crossnav/config.hpp>
#include <crossnav/handler.hpp>
#include <crossnav/log.hpp>
#include <crossnav/message.hpp>
#include <crossnav/nav.hpp>
#include <crossnav/oracle.hpp>
#include <crossnav/pool.hpp>
#include <crossnav/registry.hpp>
#include <crossnav/session.hpp>
#include <crossnav/wallet.hpp>
#include <iostream>
#include <stdexcept>

using namespace crossnav;

namespace {

constexpr I128 ONE_ETH = fp::pow10(18);

void print_nav(const char* label, const NavResult& nav) {
    std::cout << label << ": nav/share=" << fp::to_string(nav.unitary_value)
              << " net=" << fp::to_string(nav.net_total_value)
              << " effective_supply=" << fp::to_string(nav.effective_supply) << "\n";
}

int check(int32_t status, const char* what) {
    if (status != errors::OK) {
        std::cerr << what << " failed: " << errors::name(status) << "\n";
    }
    return status;
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    try {
        if (argc > 1) {
            config = Config::from_file(argv[1]);
        } else {
            config.with_chain(*ChainConfig::preset(42161)).set_log_level("info");
        }
        if (config.cross_chain_tokens.empty()) {
            config.with_cross_chain_token(config.chain.wrapped_native);
        }
        config.apply_logging();
    } catch (const std::exception& e) {
        std::cerr << "config: " << e.what() << "\n";
        return 1;
    }

    const Currency weth = config.chain.wrapped_native;
    const PoolId pool_id = *address_from_hex("0x00000000000000000000000000000000000000aa");
    const Address handler_address = *address_from_hex("0x00000000000000000000000000000000000000bb");

    // Collaborators
    PriceOracle oracle;
    if (check(oracle.register_token({weth, 18, 0}), "register_token") != errors::OK ||
        check(oracle.update_price(weth, 3000 * ONE_ETH), "update_price") != errors::OK) {
        return 1;
    }

    MemoryWallet wallet(weth);
    PoolStore pools;
    NavEngine nav(oracle, wallet);
    TokenRegistry registry(oracle, config.max_active_tokens);
    ReconciliationSession session(pools, nav, wallet, registry, config.session_config());

    session.set_event_callback([](const TokensReceived& event) {
        std::cout << "TokensReceived: " << op_type_name(event.op_type)
                  << " delta=" << fp::to_string(event.amount_delta)
                  << " virtual_supply_minted=" << fp::to_string(event.virtual_supply_minted) << "\n";
    });

    // A pool holding 10 WETH against 10 shares
    if (check(pools.create_pool(pool_id, weth, 18), "create_pool") != errors::OK ||
        check(pools.set_total_supply(pool_id, 10 * ONE_ETH), "set_total_supply") != errors::OK ||
        check(wallet.mint(weth, pool_id, 10 * ONE_ETH), "mint") != errors::OK) {
        return 1;
    }
    print_nav("before", session.current_nav(pool_id));

    AcrossHandler handler(config.chain.spoke_pool, handler_address, session, wallet);

    // The spoke pool fills 2 WETH into the handler
    if (check(wallet.mint(weth, handler_address, 2 * ONE_ETH), "fill") != errors::OK) {
        return 1;
    }

    DestinationMessage message;
    message.op_type = OpType::TRANSFER;
    message.source_chain_id = 1;
    message.source_nav = ONE_ETH;
    message.source_decimals = 18;
    message.nav_tolerance_bps = 100;

    int32_t status = handler.handle_message(config.chain.spoke_pool, pool_id, weth,
                                            2 * ONE_ETH, encode_message(message));
    if (check(status, "handle_message") != errors::OK) {
        return 1;
    }

    print_nav("after", session.current_nav(pool_id));

    const PoolState* pool = pools.find(pool_id);
    if (auto spread = pool->chain_nav_spread(message.source_chain_id)) {
        std::cout << "spread vs chain " << message.source_chain_id << ": " << fp::to_string(*spread) << "\n";
    }
    return 0;
}
