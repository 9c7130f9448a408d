#include "schema/numeric.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <cstdint>

using rowguard::schema::NumericKind;
using rowguard::schema::NumericValue;

TEST_CASE("Integer coercion accepts signed decimal text only", "[schema][numeric]") {
  std::int64_t value = 0;
  REQUIRE(rowguard::schema::ParseInteger("42", value));
  REQUIRE(value == 42);
  REQUIRE(rowguard::schema::ParseInteger(" -7 ", value));
  REQUIRE(value == -7);
  REQUIRE(rowguard::schema::ParseInteger("+3", value));
  REQUIRE(value == 3);

  REQUIRE_FALSE(rowguard::schema::ParseInteger("", value));
  REQUIRE_FALSE(rowguard::schema::ParseInteger("abc", value));
  REQUIRE_FALSE(rowguard::schema::ParseInteger("1.0", value));
  REQUIRE_FALSE(rowguard::schema::ParseInteger("+-1", value));
  REQUIRE_FALSE(rowguard::schema::ParseInteger("12abc", value));
  REQUIRE_FALSE(rowguard::schema::ParseInteger("99999999999999999999", value));
}

TEST_CASE("Float coercion accepts decimal, exponent and special forms", "[schema][numeric]") {
  double value = 0.0;
  REQUIRE(rowguard::schema::ParseFloat("1.5", value));
  REQUIRE(value == 1.5);
  REQUIRE(rowguard::schema::ParseFloat("-2e3", value));
  REQUIRE(value == -2000.0);
  REQUIRE(rowguard::schema::ParseFloat(".5", value));
  REQUIRE(rowguard::schema::ParseFloat("7", value));
  REQUIRE(rowguard::schema::ParseFloat("-inf", value));
  REQUIRE(std::isinf(value));
  REQUIRE(rowguard::schema::ParseFloat("NaN", value));
  REQUIRE(std::isnan(value));

  REQUIRE_FALSE(rowguard::schema::ParseFloat("0x1p3", value));
  REQUIRE_FALSE(rowguard::schema::ParseFloat("1e", value));
  REQUIRE_FALSE(rowguard::schema::ParseFloat("infinite", value));
  REQUIRE_FALSE(rowguard::schema::ParseFloat("1.2.3", value));
  REQUIRE_FALSE(rowguard::schema::ParseFloat("-", value));
}

TEST_CASE("The string kind never coerces", "[schema][numeric]") {
  NumericValue value;
  REQUIRE_FALSE(rowguard::schema::CoerceNumeric("5", NumericKind::kString, value));
}

TEST_CASE("Numeric comparison orders integers exactly and floats by value", "[schema][numeric]") {
  NumericValue small;
  NumericValue large;
  REQUIRE(rowguard::schema::CoerceNumeric("9007199254740992", NumericKind::kInteger, small));
  REQUIRE(rowguard::schema::CoerceNumeric("9007199254740993", NumericKind::kInteger, large));
  REQUIRE(rowguard::schema::CompareNumeric(small, large) < 0);
  REQUIRE(rowguard::schema::CompareNumeric(large, small) > 0);
  REQUIRE(rowguard::schema::CompareNumeric(small, small) == 0);

  NumericValue nan;
  NumericValue one;
  REQUIRE(rowguard::schema::CoerceNumeric("nan", NumericKind::kFloat, nan));
  REQUIRE(rowguard::schema::CoerceNumeric("1", NumericKind::kFloat, one));
  REQUIRE(rowguard::schema::CompareNumeric(nan, one) == 0);
}
