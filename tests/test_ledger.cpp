// crossnav - SignedLedger tests

#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include <crossnav/ledger.hpp>

using namespace crossnav;
using namespace crossnav::test;

TEST_CASE("SignedLedger virtual balances", "[ledger]") {
    SignedLedger ledger;
    REQUIRE(ledger.empty());

    SECTION("Signed updates accumulate") {
        REQUIRE(ledger.update_virtual_balance(USDC, 100) == errors::OK);
        REQUIRE(ledger.update_virtual_balance(USDC, -250) == errors::OK);
        REQUIRE(ledger.get_virtual_balance(USDC) == -150);
        REQUIRE(ledger.get_virtual_balance(WETH) == 0);
    }

    SECTION("Zero entries disappear") {
        REQUIRE(ledger.update_virtual_balance(USDC, 100) == errors::OK);
        REQUIRE(ledger.update_virtual_balance(USDC, -100) == errors::OK);
        REQUIRE(ledger.virtual_balances().empty());
        REQUIRE(ledger.empty());
    }

    SECTION("Total sums every key") {
        REQUIRE(ledger.update_virtual_balance(USDC, 100) == errors::OK);
        REQUIRE(ledger.update_virtual_balance(WETH, -30) == errors::OK);

        I128 total = 0;
        REQUIRE(ledger.total_virtual_balance(total) == errors::OK);
        REQUIRE(total == 70);
    }

    SECTION("Overflow leaves the entry untouched") {
        I128 max = static_cast<I128>((static_cast<U128>(1) << 127) - 1);
        REQUIRE(ledger.update_virtual_balance(USDC, max) == errors::OK);
        REQUIRE(ledger.update_virtual_balance(USDC, 1) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(ledger.get_virtual_balance(USDC) == max);
    }
}

TEST_CASE("SignedLedger virtual supply", "[ledger]") {
    SignedLedger ledger;

    REQUIRE(ledger.update_virtual_supply(100 * E6) == errors::OK);
    REQUIRE(ledger.update_virtual_supply(-40 * E6) == errors::OK);
    REQUIRE(ledger.get_virtual_supply() == 60 * E6);
    REQUIRE_FALSE(ledger.empty());
}
