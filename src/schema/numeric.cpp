#include "schema/numeric.hpp"

#include "core/text_utils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

namespace rowguard::schema {

namespace {

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Special float spellings: inf, infinity and nan in any letter case.
bool IsSpecialFloatWord(std::string_view word) {
  const std::string lowered = core::ToLower(std::string(word));
  return lowered == "inf" || lowered == "infinity" || lowered == "nan";
}

bool HasDecimalFloatShape(std::string_view body) {
  bool seen_digit = false;
  bool seen_dot = false;
  bool seen_exponent = false;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (IsDigit(c)) {
      seen_digit = true;
      continue;
    }
    if (c == '.' && !seen_dot && !seen_exponent) {
      seen_dot = true;
      continue;
    }
    if ((c == 'e' || c == 'E') && seen_digit && !seen_exponent) {
      seen_exponent = true;
      if (i + 1 < body.size() && (body[i + 1] == '+' || body[i + 1] == '-')) {
        ++i;
      }
      if (i + 1 >= body.size()) {
        return false;
      }
      continue;
    }
    return false;
  }
  return seen_digit;
}

} // namespace

bool ParseInteger(std::string_view text, std::int64_t& value) {
  std::string_view body = core::TrimView(text);
  if (body.empty()) {
    return false;
  }
  if (body.front() == '+') {
    body.remove_prefix(1);
    if (body.empty() || !IsDigit(body.front())) {
      return false;
    }
  }

  std::int64_t parsed = 0;
  const char* begin = body.data();
  const char* end = body.data() + body.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

bool ParseFloat(std::string_view text, double& value) {
  const std::string_view trimmed = core::TrimView(text);
  if (trimmed.empty()) {
    return false;
  }

  std::string_view body = trimmed;
  if (body.front() == '+' || body.front() == '-') {
    body.remove_prefix(1);
  }
  if (body.empty()) {
    return false;
  }

  const bool special = std::isalpha(static_cast<unsigned char>(body.front())) != 0;
  if (special ? !IsSpecialFloatWord(body) : !HasDecimalFloatShape(body)) {
    return false;
  }

  const std::string owned(trimmed);
  char* parse_end = nullptr;
  const double parsed = std::strtod(owned.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0') {
    return false;
  }
  value = parsed;
  return true;
}

bool CoerceNumeric(std::string_view text, NumericKind kind, NumericValue& value) {
  switch (kind) {
  case NumericKind::kInteger: {
    std::int64_t parsed = 0;
    if (!ParseInteger(text, parsed)) {
      return false;
    }
    value.kind = NumericKind::kInteger;
    value.integer_value = parsed;
    return true;
  }
  case NumericKind::kFloat: {
    double parsed = 0.0;
    if (!ParseFloat(text, parsed)) {
      return false;
    }
    value.kind = NumericKind::kFloat;
    value.float_value = parsed;
    return true;
  }
  case NumericKind::kString:
    break;
  }
  return false;
}

int CompareNumeric(const NumericValue& lhs, const NumericValue& rhs) {
  if (lhs.kind == NumericKind::kInteger && rhs.kind == NumericKind::kInteger) {
    if (lhs.integer_value < rhs.integer_value) {
      return -1;
    }
    return lhs.integer_value > rhs.integer_value ? 1 : 0;
  }

  const double left = lhs.kind == NumericKind::kInteger
                          ? static_cast<double>(lhs.integer_value)
                          : lhs.float_value;
  const double right = rhs.kind == NumericKind::kInteger
                           ? static_cast<double>(rhs.integer_value)
                           : rhs.float_value;
  if (std::isnan(left) || std::isnan(right)) {
    return 0;
  }
  if (left < right) {
    return -1;
  }
  return left > right ? 1 : 0;
}

} // namespace rowguard::schema
