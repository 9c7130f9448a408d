#include "schema/validator.hpp"

#include "core/text_utils.hpp"
#include "schema/loader.hpp"
#include "schema/numeric.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rowguard::schema {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kItemsKey = "items";
constexpr std::string_view kNumericKindKey = "numericKind";
constexpr std::string_view kNumericMinimumKey = "numericMinimum";
constexpr std::string_view kNumericMaximumKey = "numericMaximum";

constexpr std::array<std::string_view, 12> kSupportedKeys = {
    "type",      "title",   "description", "required",  "blank",
    "minLength", "maxLength", "pattern",   "enum",      kNumericKindKey,
    kNumericMinimumKey,     kNumericMaximumKey,
};

// Generic-engine keys that look usable but either judge JSON numbers (which a
// text record never holds) or describe structures a flat record does not have.
constexpr std::array<std::string_view, 19> kUnsupportedKeys = {
    "minimum",          "maximum",           "exclusiveMinimum", "exclusiveMaximum",
    "divisibleBy",      "multipleOf",        "format",           "default",
    "dependencies",     "disallow",          "extends",          "properties",
    "patternProperties", "additionalProperties", "items",        "additionalItems",
    "minItems",         "maxItems",          "uniqueItems",
};

bool Contains(const auto& keys, std::string_view key) {
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::string RuleLabel(std::size_t index, const JsonValue& rule) {
  std::string label = "items[" + std::to_string(index) + "]";
  if (const JsonValue* title = core::json::Find(rule, "title");
      title != nullptr && title->type == JsonValue::Type::kString && !title->string_value.empty()) {
    label += " (" + title->string_value + ")";
  }
  return label;
}

std::string DescribeValue(const JsonValue& value) {
  if (value.type == JsonValue::Type::kString) {
    return "string '" + value.string_value + "'";
  }
  if (core::json::IsScalar(value)) {
    return std::string(core::json::TypeName(value.type)) + " " + core::json::ScalarText(value);
  }
  return core::json::TypeName(value.type);
}

bool Reject(const std::string& label, const std::string& message, std::string& error) {
  error = "invalid schema: " + label + ": " + message;
  return false;
}

bool ValidateTopLevel(const JsonValue& root, const JsonValue*& items, std::string& error) {
  if (root.type != JsonValue::Type::kObject) {
    error = "invalid schema: top level must be a mapping with exactly one attribute 'items' "
            "(found " + std::string(core::json::TypeName(root.type)) + ")";
    return false;
  }

  if (root.object_value.size() != 1U) {
    std::vector<std::string> keys;
    keys.reserve(root.object_value.size());
    for (const auto& entry : root.object_value) {
      keys.push_back(entry.first);
    }
    error = "invalid schema: top level must contain exactly one attribute 'items' (found " +
            std::to_string(root.object_value.size()) + " attributes" +
            (keys.empty() ? std::string() : ": " + core::Join(keys, ", ")) + ")";
    return false;
  }

  const auto& [key, value] = *root.object_value.begin();
  if (key != kItemsKey) {
    error = "invalid schema: the single top-level attribute must be 'items' (found '" + key + "')";
    return false;
  }
  if (value.type != JsonValue::Type::kArray) {
    error = "invalid schema: 'items' must be a sequence of field rules (found " +
            std::string(core::json::TypeName(value.type)) + ")";
    return false;
  }

  items = &value;
  return true;
}

// Whitelist/blacklist and per-key value checks, in rule key order. `kind` is
// set when the rule carries a valid numericKind.
bool ValidateRuleKeys(const JsonValue& rule, const std::string& label,
                      std::optional<NumericKind>& kind, std::string& error) {
  for (const auto& [key, value] : rule.object_value) {
    if (!Contains(kSupportedKeys, key)) {
      if (Contains(kUnsupportedKeys, key)) {
        return Reject(label,
                      "unsupported key '" + key +
                          "' (generic numeric and structural keys cannot be applied to text "
                          "fields; use numericKind with numericMinimum/numericMaximum)",
                      error);
      }
      return Reject(label, "unknown key '" + key + "'", error);
    }

    if (key == "required" || key == "blank") {
      if (value.type != JsonValue::Type::kBool) {
        return Reject(label,
                      "invalid value for '" + key + "': must be true or false (found " +
                          DescribeValue(value) + ")",
                      error);
      }
    }

    if (key == kNumericKindKey) {
      NumericKind parsed = NumericKind::kString;
      if (value.type != JsonValue::Type::kString || !ParseNumericKind(value.string_value, parsed)) {
        return Reject(label,
                      "invalid value for 'numericKind': must be one of integer, float, string "
                      "(found " + DescribeValue(value) + ")",
                      error);
      }
      kind = parsed;
    }
  }
  return true;
}

bool BuildLimit(const JsonValue& rule, std::string_view limit_key,
                const std::optional<NumericKind>& numeric_kind, const std::string& label,
                std::optional<NumericLimit>& limit, std::string& error) {
  const JsonValue* raw = core::json::Find(rule, limit_key);
  if (raw == nullptr) {
    return true;
  }

  const std::string key(limit_key);
  if (!numeric_kind.has_value()) {
    return Reject(label, key + " requires numericKind to be set to integer or float", error);
  }

  const NumericKind kind = *numeric_kind;
  if (kind == NumericKind::kString) {
    return Reject(label, key + " requires numericKind integer or float (found numericKind string)",
                  error);
  }

  NumericLimit parsed;
  parsed.text = core::json::IsScalar(*raw) ? core::json::ScalarText(*raw) : std::string();
  const bool coercible = raw->type != JsonValue::Type::kBool &&
                         raw->type != JsonValue::Type::kNull && core::json::IsScalar(*raw) &&
                         CoerceNumeric(parsed.text, kind, parsed.value);
  if (!coercible) {
    return Reject(label,
                  key + " value must be coercible to numericKind " + ToString(kind) + " (found " +
                      DescribeValue(*raw) + ")",
                  error);
  }

  limit = std::move(parsed);
  return true;
}

bool ReadLength(const JsonValue& rule, std::string_view key, const std::string& label,
                std::optional<std::size_t>& length, std::string& error) {
  const JsonValue* raw = core::json::Find(rule, key);
  if (raw == nullptr) {
    return true;
  }
  const bool usable = raw->type == JsonValue::Type::kNumber && std::isfinite(raw->number_value) &&
                      raw->number_value >= 0.0 &&
                      std::floor(raw->number_value) == raw->number_value &&
                      raw->number_value <
                          static_cast<double>(std::numeric_limits<std::uint32_t>::max());
  if (!usable) {
    return Reject(label,
                  "invalid value for '" + std::string(key) +
                      "': must be a non-negative integer (found " + DescribeValue(*raw) + ")",
                  error);
  }
  length = static_cast<std::size_t>(raw->number_value);
  return true;
}

bool ReadText(const JsonValue& rule, std::string_view key, const std::string& label,
              std::optional<std::string>& text, std::string& error) {
  const JsonValue* raw = core::json::Find(rule, key);
  if (raw == nullptr || raw->type == JsonValue::Type::kNull) {
    return true;
  }
  if (!core::json::IsScalar(*raw)) {
    return Reject(label,
                  "invalid value for '" + std::string(key) + "': must be text (found " +
                      DescribeValue(*raw) + ")",
                  error);
  }
  text = core::json::ScalarText(*raw);
  return true;
}

bool ReadTypes(const JsonValue& rule, const std::string& label, std::vector<GenericType>& types,
               std::string& error) {
  const JsonValue* raw = core::json::Find(rule, "type");
  if (raw == nullptr) {
    return true;
  }

  std::vector<const JsonValue*> names;
  if (raw->type == JsonValue::Type::kArray) {
    for (const auto& item : raw->array_value) {
      names.push_back(&item);
    }
  } else {
    names.push_back(raw);
  }
  if (names.empty()) {
    return Reject(label, "invalid value for 'type': list of types must not be empty", error);
  }

  for (const JsonValue* name : names) {
    GenericType parsed = GenericType::kAny;
    if (name->type != JsonValue::Type::kString || !ParseGenericType(name->string_value, parsed)) {
      return Reject(label,
                    "invalid value for 'type': expected string, any, integer, number, boolean "
                    "or null (found " + DescribeValue(*name) + ")",
                    error);
    }
    types.push_back(parsed);
  }
  return true;
}

bool ReadPattern(const JsonValue& rule, const std::string& label, FieldRule& field,
                 std::string& error) {
  const JsonValue* raw = core::json::Find(rule, "pattern");
  if (raw == nullptr) {
    return true;
  }
  if (raw->type != JsonValue::Type::kString) {
    return Reject(label,
                  "invalid value for 'pattern': must be a string (found " + DescribeValue(*raw) +
                      ")",
                  error);
  }

  std::string compile_error;
  if (!CompilePattern(raw->string_value, field.pattern, compile_error)) {
    return Reject(label,
                  "invalid value for 'pattern': '" + raw->string_value +
                      "' is not a valid regular expression (" + compile_error + ")",
                  error);
  }
  field.pattern_text = raw->string_value;
  return true;
}

bool ReadEnum(const JsonValue& rule, const std::string& label, std::vector<std::string>& values,
              std::string& error) {
  const JsonValue* raw = core::json::Find(rule, "enum");
  if (raw == nullptr) {
    return true;
  }
  if (raw->type != JsonValue::Type::kArray || raw->array_value.empty()) {
    return Reject(label, "invalid value for 'enum': must be a non-empty sequence of values", error);
  }
  for (const auto& item : raw->array_value) {
    if (!core::json::IsScalar(item)) {
      return Reject(label,
                    "invalid value for 'enum': entries must be scalars (found " +
                        DescribeValue(item) + ")",
                    error);
    }
    values.push_back(core::json::ScalarText(item));
  }
  return true;
}

bool BuildRule(std::size_t index, const JsonValue& rule, FieldRule& field, std::string& error) {
  const std::string label = RuleLabel(index, rule);
  if (rule.type != JsonValue::Type::kObject) {
    return Reject(label,
                  "field rule must be a mapping (found " +
                      std::string(core::json::TypeName(rule.type)) + ")",
                  error);
  }

  if (!ValidateRuleKeys(rule, label, field.numeric_kind, error)) {
    return false;
  }
  if (!BuildLimit(rule, kNumericMinimumKey, field.numeric_kind, label, field.numeric_minimum,
                  error) ||
      !BuildLimit(rule, kNumericMaximumKey, field.numeric_kind, label, field.numeric_maximum,
                  error)) {
    return false;
  }
  if (field.numeric_minimum.has_value() && field.numeric_maximum.has_value() &&
      CompareNumeric(field.numeric_minimum->value, field.numeric_maximum->value) > 0) {
    return Reject(label,
                  "numericMinimum " + field.numeric_minimum->text +
                      " is greater than numericMaximum " + field.numeric_maximum->text,
                  error);
  }

  field.index = index;
  if (const JsonValue* required = core::json::Find(rule, "required"); required != nullptr) {
    field.required = required->bool_value;
  }
  if (const JsonValue* blank = core::json::Find(rule, "blank"); blank != nullptr) {
    field.blank = blank->bool_value;
  }

  if (!ReadText(rule, "title", label, field.title, error) ||
      !ReadText(rule, "description", label, field.description, error) ||
      !ReadTypes(rule, label, field.types, error) ||
      !ReadLength(rule, "minLength", label, field.min_length, error) ||
      !ReadLength(rule, "maxLength", label, field.max_length, error) ||
      !ReadPattern(rule, label, field, error) || !ReadEnum(rule, label, field.enum_values, error)) {
    return false;
  }

  if (field.min_length.has_value() && field.max_length.has_value() &&
      *field.min_length > *field.max_length) {
    return Reject(label,
                  "minLength " + std::to_string(*field.min_length) +
                      " is greater than maxLength " + std::to_string(*field.max_length),
                  error);
  }
  return true;
}

} // namespace

bool ValidateSchema(const JsonValue& root, Schema& schema, std::string& error) {
  schema = Schema{};

  const JsonValue* items = nullptr;
  if (!ValidateTopLevel(root, items, error)) {
    return false;
  }

  Schema built;
  built.items.reserve(items->array_value.size());
  for (std::size_t i = 0; i < items->array_value.size(); ++i) {
    FieldRule field;
    if (!BuildRule(i, items->array_value[i], field, error)) {
      return false;
    }
    built.items.push_back(std::move(field));
  }

  schema = std::move(built);
  return true;
}

bool ValidateSchema(const JsonValue* root, std::optional<Schema>& schema, std::string& error) {
  schema.reset();
  if (root == nullptr) {
    return true;
  }

  Schema built;
  if (!ValidateSchema(*root, built, error)) {
    return false;
  }
  schema = std::move(built);
  return true;
}

bool LoadSchemaFile(const fs::path& path, Schema& schema, std::string& error) {
  JsonValue root;
  if (!LoadSchemaDocument(path, root, error)) {
    return false;
  }
  return ValidateSchema(root, schema, error);
}

} // namespace rowguard::schema
