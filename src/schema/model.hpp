#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
class RE2;
} // namespace re2

namespace rowguard::schema {

// Custom numeric classification. Resolved once when the schema is loaded so
// per-record checks branch on the enum instead of re-selecting a parser.
enum class NumericKind {
  kString,
  kInteger,
  kFloat,
};

const char* ToString(NumericKind kind);
bool ParseNumericKind(std::string_view raw, NumericKind& kind);

// Generic (delegated) type names. Record values are always text, so only
// `string` and `any` can ever accept a value.
enum class GenericType {
  kString,
  kAny,
  kInteger,
  kNumber,
  kBoolean,
  kNull,
};

const char* ToString(GenericType type);
bool ParseGenericType(std::string_view raw, GenericType& type);

// A value coerced to a numeric kind. Only the member matching `kind` is
// meaningful.
struct NumericValue {
  NumericKind kind = NumericKind::kInteger;
  std::int64_t integer_value = 0;
  double float_value = 0.0;
};

struct NumericLimit {
  NumericValue value;
  // Limit as written in the schema document, for diagnostics.
  std::string text;
};

// Constraints for one column position.
struct FieldRule {
  std::size_t index = 0;
  std::optional<std::string> title;
  std::optional<std::string> description;

  // Delegated to the generic structural validator.
  std::vector<GenericType> types;
  std::optional<std::size_t> min_length;
  std::optional<std::size_t> max_length;
  std::optional<std::string> pattern_text;
  // Compiled once at load; shared so rules stay copyable.
  std::shared_ptr<const re2::RE2> pattern;
  std::vector<std::string> enum_values;
  bool required = false;
  bool blank = false;

  // Custom numeric extension.
  std::optional<NumericKind> numeric_kind;
  std::optional<NumericLimit> numeric_minimum;
  std::optional<NumericLimit> numeric_maximum;

  // True when `numericKind` asks for integer or float coercion.
  bool IsNumeric() const;

  // "field 3 (amount)" or "field 3" when untitled.
  std::string Label() const;
};

// Compiles `text` with RE2, whose matcher runs in linear time and bounded stack.
bool CompilePattern(const std::string& text, std::shared_ptr<const re2::RE2>& pattern,
                    std::string& error);

// Unanchored search: true when `pattern` matches anywhere in `value`.
bool PatternMatches(const re2::RE2& pattern, std::string_view value);

// Validated, immutable rule set; `items[i]` applies to record field i.
struct Schema {
  std::vector<FieldRule> items;
};

} // namespace rowguard::schema
