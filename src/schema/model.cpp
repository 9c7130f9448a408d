#include "schema/model.hpp"

#include <re2/re2.h>

#include <memory>
#include <string>
#include <utility>

namespace rowguard::schema {

const char* ToString(NumericKind kind) {
  switch (kind) {
  case NumericKind::kString:
    return "string";
  case NumericKind::kInteger:
    return "integer";
  case NumericKind::kFloat:
    return "float";
  }
  return "string";
}

bool ParseNumericKind(std::string_view raw, NumericKind& kind) {
  if (raw == "integer") {
    kind = NumericKind::kInteger;
    return true;
  }
  if (raw == "float") {
    kind = NumericKind::kFloat;
    return true;
  }
  if (raw == "string") {
    kind = NumericKind::kString;
    return true;
  }
  return false;
}

const char* ToString(GenericType type) {
  switch (type) {
  case GenericType::kString:
    return "string";
  case GenericType::kAny:
    return "any";
  case GenericType::kInteger:
    return "integer";
  case GenericType::kNumber:
    return "number";
  case GenericType::kBoolean:
    return "boolean";
  case GenericType::kNull:
    return "null";
  }
  return "any";
}

bool ParseGenericType(std::string_view raw, GenericType& type) {
  if (raw == "string") {
    type = GenericType::kString;
  } else if (raw == "any") {
    type = GenericType::kAny;
  } else if (raw == "integer") {
    type = GenericType::kInteger;
  } else if (raw == "number") {
    type = GenericType::kNumber;
  } else if (raw == "boolean") {
    type = GenericType::kBoolean;
  } else if (raw == "null") {
    type = GenericType::kNull;
  } else {
    return false;
  }
  return true;
}

bool FieldRule::IsNumeric() const {
  return numeric_kind.has_value() && *numeric_kind != NumericKind::kString;
}

std::string FieldRule::Label() const {
  std::string label = "field " + std::to_string(index);
  if (title.has_value() && !title->empty()) {
    label += " (" + *title + ")";
  }
  return label;
}

bool CompilePattern(const std::string& text, std::shared_ptr<const re2::RE2>& pattern,
                    std::string& error) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto compiled = std::make_shared<re2::RE2>(text, options);
  if (!compiled->ok()) {
    error = compiled->error();
    return false;
  }
  pattern = std::move(compiled);
  return true;
}

bool PatternMatches(const re2::RE2& pattern, std::string_view value) {
  return re2::RE2::PartialMatch(re2::StringPiece(value.data(), value.size()), pattern);
}

} // namespace rowguard::schema
