#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "decimal.hpp"

// ============================================================================
// parse / to_string
// ============================================================================

TEST_CASE("parse plain literals") {
    CHECK(Decimal::parse("0").to_string()           == "0");
    CHECK(Decimal::parse("42").to_string()          == "42");
    CHECK(Decimal::parse("-7").to_string()          == "-7");
    CHECK(Decimal::parse("3.14").to_string()        == "3.14");
    CHECK(Decimal::parse("0.00000001").to_string()  == "0.00000001");
    CHECK(Decimal::parse("-0.5").to_string()        == "-0.5");
}

TEST_CASE("parse keeps trailing zeros of the literal") {
    CHECK(Decimal::parse("1.50").to_string()       == "1.50");
    CHECK(Decimal::parse("0.00000000").to_string() == "0.00000000");
}

TEST_CASE("parse exponent forms expand to plain notation") {
    CHECK(Decimal::parse("1e3").to_string()    == "1000");
    CHECK(Decimal::parse("1.5E2").to_string()  == "150");
    CHECK(Decimal::parse("2e-1").to_string()   == "0.2");
    CHECK(Decimal::parse("25e-10").to_string() == "0.0000000025");
    CHECK(Decimal::parse("1E+2").to_string()   == "100");
}

TEST_CASE("negative zero normalizes") {
    auto z = Decimal::parse("-0.0");
    CHECK(z.is_zero());
    CHECK(!z.is_negative());
    CHECK(z.to_string() == "0.0");
}

TEST_CASE("parse rejects non-JSON number syntax") {
    CHECK_THROWS_AS(Decimal::parse(""),       std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("-"),      std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("01.5"),   std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse(".5"),     std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("1."),     std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("1e"),     std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("1.5x"),   std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("+1"),     std::invalid_argument);
    CHECK_THROWS_AS(Decimal::parse("1e999999"), std::invalid_argument);
}

TEST_CASE("construction from int64") {
    CHECK(Decimal(0).to_string()   == "0");
    CHECK(Decimal(-15).to_string() == "-15");
    CHECK(Decimal(std::numeric_limits<int64_t>::min()).to_string() == "-9223372036854775808");
    CHECK(Decimal(std::numeric_limits<int64_t>::max()).to_string() == "9223372036854775807");
}

// ============================================================================
// round
// ============================================================================

TEST_CASE("round to 8 places") {
    SECTION("truncates extra digits") {
        CHECK(Decimal::parse("12.345678901").round(8).to_string() == "12.34567890");
    }
    SECTION("pads short fractions") {
        CHECK(Decimal::parse("1.5").round(8).to_string() == "1.50000000");
        CHECK(Decimal::parse("3").round(8).to_string()   == "3.00000000");
        CHECK(Decimal(0).round(8).to_string()            == "0.00000000");
    }
    SECTION("rounds up above half") {
        CHECK(Decimal::parse("0.123456786").round(8).to_string() == "0.12345679");
    }
    SECTION("carries through nines") {
        CHECK(Decimal::parse("9.999999999").round(8).to_string() == "10.00000000");
    }
    SECTION("tiny values round to zero") {
        auto r = Decimal::parse("0.000000001").round(8);
        CHECK(r.is_zero());
        CHECK(r.to_string() == "0.00000000");
    }
    SECTION("negative values keep their sign") {
        CHECK(Decimal::parse("-1.234567891").round(8).to_string() == "-1.23456789");
    }
}

TEST_CASE("round half to even") {
    CHECK(Decimal::parse("0.000000025").round(8).to_string()  == "0.00000002");
    CHECK(Decimal::parse("0.000000035").round(8).to_string()  == "0.00000004");
    CHECK(Decimal::parse("0.0000000251").round(8).to_string() == "0.00000003");
    CHECK(Decimal::parse("2.5").round(0).to_string()          == "2");
    CHECK(Decimal::parse("3.5").round(0).to_string()          == "4");
}

// ============================================================================
// comparison / conversion
// ============================================================================

TEST_CASE("equality is numeric") {
    CHECK(Decimal::parse("1.50") == Decimal::parse("1.5"));
    CHECK(Decimal::parse("100") == Decimal::parse("1e2"));
    CHECK(Decimal::parse("12.34567890") == Decimal::parse("12.3456789"));
    CHECK(Decimal::parse("0") == Decimal::parse("0.000"));
    CHECK(Decimal::parse("0.1") != Decimal::parse("0.10000001"));
}

TEST_CASE("ordering") {
    CHECK(Decimal::parse("0.00000001") > Decimal(0));
    CHECK(Decimal::parse("-0.00000001") < Decimal(0));
    CHECK(Decimal::parse("-2") < Decimal::parse("-1.5"));
    CHECK(Decimal::parse("10") > Decimal::parse("9.99999999"));
    CHECK(Decimal::parse("1.05") > Decimal::parse("1.0499"));
}

TEST_CASE("to_double") {
    CHECK(Decimal::parse("0.1").to_double()     == Catch::Approx(0.1));
    CHECK(Decimal::parse("-2.5e3").to_double()  == Catch::Approx(-2500.0));
    CHECK(Decimal(0).to_double()                == 0.0);
}
