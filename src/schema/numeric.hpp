#pragma once

#include "schema/model.hpp"

#include <cstdint>
#include <string_view>

namespace rowguard::schema {

// Text-to-number coercion shared by schema loading (limits) and record
// checks (field values).
//
// Accepted forms:
// - integer: optional surrounding whitespace, optional sign, decimal digits;
//   values outside int64 are rejected.
// - float: optional surrounding whitespace, optional sign, decimal mantissa
//   with optional exponent, or inf/infinity/nan. Hex floats are rejected.
bool ParseInteger(std::string_view text, std::int64_t& value);
bool ParseFloat(std::string_view text, double& value);

// Coerces `text` to `kind`. `kString` is not a numeric kind and always fails.
bool CoerceNumeric(std::string_view text, NumericKind kind, NumericValue& value);

// Three-way comparison of two values coerced to the same kind.
// Returns <0, 0 or >0; any comparison against NaN reports 0.
int CompareNumeric(const NumericValue& lhs, const NumericValue& rhs);

} // namespace rowguard::schema
