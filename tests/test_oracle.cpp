// crossnav - PriceOracle tests

#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include <crossnav/oracle.hpp>
#include <thread>

using namespace crossnav;
using namespace crossnav::test;

namespace {

struct OracleSetup {
    PriceOracle oracle;
    uint64_t now = 1704067200;

    OracleSetup() {
        oracle.set_clock([this] { return now; });
        REQUIRE(oracle.register_token({USDC, 6, 3600}) == errors::OK);
        REQUIRE(oracle.register_token({WETH, 18, 3600}) == errors::OK);
        REQUIRE(oracle.register_token({DAI, 18, 0}) == errors::OK);
        REQUIRE(oracle.update_price(USDC, E18) == errors::OK);
        REQUIRE(oracle.update_price(WETH, 3000 * E18) == errors::OK);
        REQUIRE(oracle.update_price(DAI, E18) == errors::OK);
    }
};

} // namespace

TEST_CASE("PriceOracle registration", "[oracle]") {
    OracleSetup s;

    REQUIRE(s.oracle.is_registered(WETH));
    REQUIRE_FALSE(s.oracle.is_registered(UNPRICED));
    REQUIRE(s.oracle.register_token({WETH, 18, 0}) == errors::POOL_ALREADY_INITIALIZED);
    REQUIRE(s.oracle.register_token({UNPRICED, 39, 0}) == errors::INVALID_AMOUNT);

    SECTION("Prices need a registered token") {
        REQUIRE(s.oracle.update_price(UNPRICED, E18) == errors::NO_PRICE_ROUTE);
        REQUIRE(s.oracle.update_price(WETH, 0) == errors::INVALID_AMOUNT);
    }

    SECTION("Config lookup") {
        auto cfg = s.oracle.get_config(WETH);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->decimals == 18);
        REQUIRE(cfg->max_staleness == 3600);
    }
}

TEST_CASE("PriceOracle conversion across decimals", "[oracle]") {
    OracleSetup s;

    SECTION("18 to 6 decimals") {
        auto value = s.oracle.convert(WETH, 2 * E18, USDC);
        REQUIRE(value.has_value());
        REQUIRE(*value == 6000 * E6);
    }

    SECTION("6 to 18 decimals") {
        auto value = s.oracle.convert(USDC, 3000 * E6, WETH);
        REQUIRE(value.has_value());
        REQUIRE(*value == E18);
    }

    SECTION("Negative amounts keep their sign") {
        auto value = s.oracle.convert(DAI, -5 * E18, USDC);
        REQUIRE(value.has_value());
        REQUIRE(*value == -5 * E6);
    }

    SECTION("Same token is identity") {
        REQUIRE(s.oracle.convert(UNPRICED, 7, UNPRICED) == I128{7});
    }

    SECTION("Missing token has no route") {
        REQUIRE_FALSE(s.oracle.convert(UNPRICED, E18, USDC).has_value());
        REQUIRE_FALSE(s.oracle.has_price_route(UNPRICED, USDC));
        REQUIRE(s.oracle.has_price_route(WETH, USDC));
    }
}

TEST_CASE("PriceOracle staleness", "[oracle]") {
    OracleSetup s;

    REQUIRE(s.oracle.is_price_fresh(WETH));
    s.now += 3601;

    REQUIRE_FALSE(s.oracle.is_price_fresh(WETH));
    REQUIRE(s.oracle.price_age(WETH) == 3601);
    REQUIRE_FALSE(s.oracle.convert(WETH, E18, USDC).has_value());

    // max_staleness 0 never goes stale
    REQUIRE(s.oracle.is_price_fresh(DAI));

    auto stats = s.oracle.get_stats();
    REQUIRE(stats.total_tokens == 3);
    REQUIRE(stats.total_updates == 3);
    REQUIRE(stats.stale_prices == 2);

    SECTION("Fresh update restores the route") {
        REQUIRE(s.oracle.update_price(WETH, 3100 * E18) == errors::OK);
        REQUIRE(s.oracle.update_price(USDC, E18) == errors::OK);
        REQUIRE(s.oracle.convert(WETH, E18, USDC) == I128{3100 * E6});
    }

    SECTION("Removed price has no route") {
        s.oracle.remove_price(DAI);
        REQUIRE_FALSE(s.oracle.get_price(DAI).has_value());
        REQUIRE_FALSE(s.oracle.convert(DAI, E18, USDC).has_value());
    }
}

TEST_CASE("PriceOracle stamps updates from the installed clock", "[oracle][clock]") {
    OracleSetup s;

    REQUIRE(s.oracle.update_price(WETH, 3000 * E18, 42) == errors::OK);
    REQUIRE(s.oracle.get_price_data(WETH)->timestamp == 42);

    SECTION("Clock swapped while updates run") {
        std::thread swapper([&s] {
            for (int i = 0; i < 1000; ++i) {
                uint64_t t = (i % 2 == 0) ? 100 : 200;
                s.oracle.set_clock([t] { return t; });
            }
        });
        for (int i = 0; i < 1000; ++i) {
            REQUIRE(s.oracle.update_price(WETH, 3000 * E18) == errors::OK);
        }
        swapper.join();

        uint64_t stamped = s.oracle.get_price_data(WETH)->timestamp;
        REQUIRE((stamped == 100 || stamped == 200 || stamped == 1704067200));
    }
}
