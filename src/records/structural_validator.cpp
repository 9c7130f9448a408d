#include "records/structural_validator.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace rowguard::records {

namespace {

// Length in code points so multi-byte UTF-8 text counts the way users see it.
std::size_t CodePointLength(const std::string& text) {
  std::size_t count = 0;
  for (const char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
      ++count;
    }
  }
  return count;
}

bool AcceptsText(const std::vector<schema::GenericType>& types) {
  if (types.empty()) {
    return true;
  }
  return std::any_of(types.begin(), types.end(), [](schema::GenericType type) {
    return type == schema::GenericType::kString || type == schema::GenericType::kAny;
  });
}

std::string DescribeTypes(const std::vector<schema::GenericType>& types) {
  std::string out;
  for (std::size_t i = 0; i < types.size(); ++i) {
    if (i != 0U) {
      out += "|";
    }
    out += schema::ToString(types[i]);
  }
  return out;
}

bool Violation(const schema::FieldRule& rule, const std::string& message,
               std::string& violation) {
  violation = rule.Label() + ": " + message;
  return false;
}

bool ValidateField(const schema::FieldRule& rule, const std::string& value,
                   std::string& violation) {
  const std::string quoted = "'" + value + "'";

  if (value.empty()) {
    if (!rule.blank) {
      return Violation(rule, "value cannot be blank", violation);
    }
    return true;
  }

  if (!AcceptsText(rule.types)) {
    return Violation(rule, "value " + quoted + " is not of type " + DescribeTypes(rule.types),
                     violation);
  }

  if (!rule.enum_values.empty() &&
      std::find(rule.enum_values.begin(), rule.enum_values.end(), value) ==
          rule.enum_values.end()) {
    return Violation(rule, "value " + quoted + " is not in the enumeration", violation);
  }

  if (rule.pattern != nullptr && !schema::PatternMatches(*rule.pattern, value)) {
    return Violation(rule,
                     "value " + quoted + " does not match pattern '" +
                         rule.pattern_text.value_or("") + "'",
                     violation);
  }

  const std::size_t length = CodePointLength(value);
  if (rule.min_length.has_value() && length < *rule.min_length) {
    return Violation(rule,
                     "length of value " + quoted + " is less than minLength " +
                         std::to_string(*rule.min_length),
                     violation);
  }
  if (rule.max_length.has_value() && length > *rule.max_length) {
    return Violation(rule,
                     "length of value " + quoted + " is greater than maxLength " +
                         std::to_string(*rule.max_length),
                     violation);
  }

  return true;
}

} // namespace

bool ValidateStructure(const schema::Schema& schema, const std::vector<std::string>& values,
                       std::string& violation) {
  for (const auto& rule : schema.items) {
    if (rule.index >= values.size()) {
      if (rule.required) {
        return Violation(rule, "required field is missing", violation);
      }
      continue;
    }
    if (!ValidateField(rule, values[rule.index], violation)) {
      return false;
    }
  }

  violation.clear();
  return true;
}

} // namespace rowguard::records
