// crossnav - Core type and fixed-point tests

#include <catch2/catch.hpp>
#include "fixtures.hpp"
#include <crossnav/types.hpp>
#include <cstring>

using namespace crossnav;
using namespace crossnav::test;

TEST_CASE("Address hex parsing", "[types]") {
    SECTION("Round trip lowercases") {
        auto addr = address_from_hex("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2");
        REQUIRE(addr.has_value());
        REQUIRE((*addr)[0] == 0xC0);
        REQUIRE((*addr)[19] == 0xC2);
        REQUIRE(to_hex(*addr) == "0xc02aaa39b223fe8d0a0e5c4f27ead9083c756cc2");
    }

    SECTION("Malformed input rejected") {
        REQUIRE_FALSE(address_from_hex("").has_value());
        REQUIRE_FALSE(address_from_hex("C02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2").has_value());
        REQUIRE_FALSE(address_from_hex("0xC02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc").has_value());
        REQUIRE_FALSE(address_from_hex("0xZ02aaA39b223FE8D0A0e5C4F27eAD9083C756Cc2").has_value());
    }

    SECTION("Zero address is the native coin") {
        REQUIRE(is_zero(ZERO_ADDRESS));
        REQUIRE(NATIVE.is_native());
        REQUIRE_FALSE(USDC.is_native());
    }
}

TEST_CASE("mul_div uses a wide intermediate", "[types][fp]") {
    I128 out = 0;

    SECTION("Product beyond 128 bits still divides exactly") {
        I128 big = fp::pow10(30);
        REQUIRE(fp::mul_div(big, big, fp::pow10(25), out));
        REQUIRE(out == fp::pow10(35));
    }

    SECTION("Truncates toward zero") {
        REQUIRE(fp::mul_div(10, 1, 3, out));
        REQUIRE(out == 3);
        REQUIRE(fp::mul_div(-10, 1, 3, out));
        REQUIRE(out == -3);
        REQUIRE(fp::mul_div(10, -1, -3, out));
        REQUIRE(out == 3);
    }

    SECTION("Division by zero and overflow fail") {
        REQUIRE_FALSE(fp::mul_div(1, 1, 0, out));
        REQUIRE_FALSE(fp::mul_div(fp::pow10(38), fp::pow10(38), 1, out));
    }
}

TEST_CASE("Checked add and sub", "[types][fp]") {
    I128 max = static_cast<I128>((static_cast<U128>(1) << 127) - 1);
    I128 out = 0;

    REQUIRE(fp::checked_add(1, 2, out));
    REQUIRE(out == 3);
    REQUIRE_FALSE(fp::checked_add(max, 1, out));
    REQUIRE_FALSE(fp::checked_sub(-max - 1, 1, out));
}

TEST_CASE("I128 decimal strings", "[types][fp]") {
    I128 max = static_cast<I128>((static_cast<U128>(1) << 127) - 1);

    REQUIRE(fp::to_string(0) == "0");
    REQUIRE(fp::to_string(-42) == "-42");
    REQUIRE(fp::to_string(max) == "170141183460469231731687303715884105727");
    REQUIRE(fp::to_string(-max - 1) == "-170141183460469231731687303715884105728");

    REQUIRE(fp::parse("170141183460469231731687303715884105727") == max);
    REQUIRE(fp::parse("-170141183460469231731687303715884105728") == -max - 1);
    REQUIRE_FALSE(fp::parse("170141183460469231731687303715884105728").has_value());
    REQUIRE_FALSE(fp::parse("").has_value());
    REQUIRE_FALSE(fp::parse("-").has_value());
    REQUIRE_FALSE(fp::parse("12a").has_value());
}

TEST_CASE("OpType wire values", "[types]") {
    REQUIRE(op_type_from_wire(0) == OpType::TRANSFER);
    REQUIRE(op_type_from_wire(1) == OpType::REBALANCE);
    REQUIRE(op_type_from_wire(2) == OpType::SYNC);
    REQUIRE_FALSE(op_type_from_wire(3).has_value());
    REQUIRE(std::strcmp(op_type_name(OpType::REBALANCE), "Rebalance") == 0);
}

TEST_CASE("Error names identify the violated invariant", "[types]") {
    REQUIRE(std::strcmp(errors::name(errors::BALANCE_UNDERFLOW), "BALANCE_UNDERFLOW") == 0);
    REQUIRE(std::strcmp(errors::name(errors::NAV_MANIPULATION_DETECTED), "NAV_MANIPULATION_DETECTED") == 0);
    REQUIRE(std::strcmp(errors::name(errors::DONATION_LOCK), "DONATION_LOCK") == 0);
    REQUIRE(std::strcmp(errors::name(12345), "UNKNOWN_ERROR") == 0);
}
