// crossnav - NavEngine tests

#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include <crossnav/nav.hpp>

using namespace crossnav;
using namespace crossnav::test;

TEST_CASE("compute_unitary_value", "[nav]") {
    I128 out = 0;

    SECTION("Value over supply at pool precision") {
        REQUIRE(compute_unitary_value(1010 * E6, 1000 * E6, 6, E6, out) == errors::OK);
        REQUIRE(out == 1010000);
    }

    SECTION("Empty pool keeps the fallback") {
        REQUIRE(compute_unitary_value(0, 0, 6, 1234567, out) == errors::OK);
        REQUIRE(out == 1234567);
    }

    SECTION("Value without supply cannot be priced") {
        REQUIRE(compute_unitary_value(5, 0, 6, E6, out) == errors::EFFECTIVE_SUPPLY_ZERO);
        REQUIRE(compute_unitary_value(5, -10, 6, E6, out) == errors::EFFECTIVE_SUPPLY_ZERO);
    }

    SECTION("Negative value is rejected") {
        REQUIRE(compute_unitary_value(-1, 1000, 6, E6, out) == errors::NEGATIVE_NAV);
    }
}

TEST_CASE("NAV normalisation and tolerance", "[nav]") {
    I128 out = 0;

    SECTION("Rescaling") {
        REQUIRE(normalize_nav(1234567, 6, 6, out) == errors::OK);
        REQUIRE(out == 1234567);
        REQUIRE(normalize_nav(1234567, 6, 18, out) == errors::OK);
        REQUIRE(out == 1234567 * fp::pow10(12));
        REQUIRE(normalize_nav(E18 + 999, 18, 6, out) == errors::OK);
        REQUIRE(out == E6);
    }

    SECTION("Tolerance in basis points") {
        REQUIRE(tolerance_amount(E6, 100, out) == errors::OK);
        REQUIRE(out == 10000);
        REQUIRE(tolerance_amount(E6, 0, out) == errors::OK);
        REQUIRE(out == 0);
        REQUIRE(tolerance_amount(E6, 10000, out) == errors::OK);
        REQUIRE(out == E6);
    }

    SECTION("Upscaling past 128 bits overflows") {
        out = 7;
        I128 huge = fp::pow10(37);
        REQUIRE(normalize_nav(huge, 0, 18, out) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(normalize_nav(2 * E18, 18, 38, out) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(out == 7);

        // Downscaling a large value is always safe
        REQUIRE(normalize_nav(huge, 38, 0, out) == errors::OK);
        REQUIRE(out == 0);
    }

    SECTION("Tolerance of a huge NAV stays exact") {
        I128 huge = fp::pow10(38);
        REQUIRE(tolerance_amount(huge, 10000, out) == errors::OK);
        REQUIRE(out == huge);

        // The product needs more than 128 bits but the quotient fits
        REQUIRE(tolerance_amount(huge, 5000, out) == errors::OK);
        REQUIRE(out == huge / 2);
    }
}

TEST_CASE("NavEngine sums wallet, positions and virtual balances", "[nav]") {
    World w;
    w.seed_pool();

    SECTION("Base token only") {
        NavResult nav = w.nav.compute_nav(w.pool());
        REQUIRE(nav.status == errors::OK);
        REQUIRE(nav.total_assets == 1000 * E6);
        REQUIRE(nav.net_total_value == 1000 * E6);
        REQUIRE(nav.effective_supply == 1000 * E6);
        REQUIRE(nav.unitary_value == E6);
    }

    SECTION("Inactive tokens do not count") {
        w.deliver(WETH, E18);
        REQUIRE(w.nav.compute_nav(w.pool()).total_assets == 1000 * E6);

        REQUIRE(w.registry.add_if_new(w.pool(), WETH).status == errors::OK);
        NavResult nav = w.nav.compute_nav(w.pool());
        REQUIRE(nav.total_assets == 4000 * E6);
        REQUIRE(nav.unitary_value == 4 * E6);
    }

    SECTION("Application positions count in base units") {
        FixedPositions apps;
        apps.held.push_back({DAI, 500 * E18});
        apps.held.push_back({USDC, -100 * E6});
        NavEngine engine(w.converter, w.wallet, &apps);

        NavResult nav = engine.compute_nav(w.pool());
        REQUIRE(nav.status == errors::OK);
        REQUIRE(nav.total_assets == 1400 * E6);
    }

    SECTION("Virtual balances add to net value, not assets") {
        REQUIRE(w.session.record_outbound(POOL, 200 * E6, OpType::TRANSFER) == errors::OK);

        NavResult nav = w.nav.compute_nav(w.pool());
        REQUIRE(nav.total_assets == 1000 * E6);
        REQUIRE(nav.net_total_value == 1200 * E6);
    }

    SECTION("A missing price aborts the whole computation") {
        w.deliver(WETH, E18);
        REQUIRE(w.registry.add_if_new(w.pool(), WETH).status == errors::OK);
        w.converter.remove_rate(WETH);

        NavResult nav = w.nav.compute_nav(w.pool());
        REQUIRE(nav.status == errors::NO_PRICE_ROUTE);
    }

    SECTION("Unpriced application position aborts too") {
        FixedPositions apps;
        apps.held.push_back({UNPRICED, 1});
        NavEngine engine(w.converter, w.wallet, &apps);

        REQUIRE(engine.compute_nav(w.pool()).status == errors::NO_PRICE_ROUTE);
    }
}

TEST_CASE("NavEngine value_in_base", "[nav]") {
    World w;
    w.seed_pool();

    REQUIRE(w.nav.value_in_base(w.pool(), USDC, 42) == I128{42});
    REQUIRE(w.nav.value_in_base(w.pool(), WETH, 2 * E18) == I128{6000 * E6});
    REQUIRE(w.nav.value_in_base(w.pool(), WETH, 0) == I128{0});
    REQUIRE_FALSE(w.nav.value_in_base(w.pool(), UNPRICED, 5).has_value());
}
