#include "schema/loader.hpp"

#include "core/fs_utils.hpp"
#include "core/text_utils.hpp"

#include <re2/re2.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace rowguard::schema {

namespace {

using JsonValue = core::json::Value;

std::string FormatMark(const YAML::Mark& mark) {
  if (mark.is_null()) {
    return "unknown position";
  }
  return "line " + std::to_string(mark.line + 1) + ", col " + std::to_string(mark.column + 1);
}

bool IsYamlNull(const std::string& scalar) {
  return scalar.empty() || scalar == "~" || scalar == "null" || scalar == "Null" ||
         scalar == "NULL";
}

bool ResolveYamlBool(const std::string& scalar, bool& value) {
  static const char* const kTrue[] = {"true", "True", "TRUE", "yes", "Yes",
                                      "YES",  "on",   "On",   "ON"};
  static const char* const kFalse[] = {"false", "False", "FALSE", "no", "No",
                                       "NO",    "off",   "Off",   "OFF"};
  for (const char* word : kTrue) {
    if (scalar == word) {
      value = true;
      return true;
    }
  }
  for (const char* word : kFalse) {
    if (scalar == word) {
      value = false;
      return true;
    }
  }
  return false;
}

bool ResolveYamlNumber(const std::string& scalar, JsonValue& value) {
  static const re2::RE2 kInteger(R"([-+]?[0-9]+)");
  static const re2::RE2 kFloat(R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)");
  static const re2::RE2 kInfinity(R"([-+]?\.(inf|Inf|INF))");
  static const re2::RE2 kNan(R"(\.(nan|NaN|NAN))");

  if (re2::RE2::FullMatch(scalar, kInteger) || re2::RE2::FullMatch(scalar, kFloat)) {
    value.type = JsonValue::Type::kNumber;
    value.number_text = scalar;
    value.number_value = std::strtod(scalar.c_str(), nullptr);
    return true;
  }
  if (re2::RE2::FullMatch(scalar, kInfinity)) {
    const bool negative = scalar.front() == '-';
    value.type = JsonValue::Type::kNumber;
    value.number_text = negative ? "-inf" : "inf";
    value.number_value = negative ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity();
    return true;
  }
  if (re2::RE2::FullMatch(scalar, kNan)) {
    value.type = JsonValue::Type::kNumber;
    value.number_text = "nan";
    value.number_value = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  return false;
}

void ConvertScalar(const YAML::Node& node, JsonValue& value) {
  const std::string& scalar = node.Scalar();

  // Quoted and explicitly tagged scalars are never re-typed.
  if (node.Tag() != "?") {
    value.type = JsonValue::Type::kString;
    value.string_value = scalar;
    return;
  }

  if (IsYamlNull(scalar)) {
    value.type = JsonValue::Type::kNull;
    return;
  }
  bool flag = false;
  if (ResolveYamlBool(scalar, flag)) {
    value.type = JsonValue::Type::kBool;
    value.bool_value = flag;
    return;
  }
  if (ResolveYamlNumber(scalar, value)) {
    return;
  }

  value.type = JsonValue::Type::kString;
  value.string_value = scalar;
}

bool ConvertYamlNode(const YAML::Node& node, JsonValue& value, std::string& error) {
  value = JsonValue{};

  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    value.type = JsonValue::Type::kNull;
    return true;
  case YAML::NodeType::Scalar:
    ConvertScalar(node, value);
    return true;
  case YAML::NodeType::Sequence:
    value.type = JsonValue::Type::kArray;
    for (const auto& item : node) {
      JsonValue converted;
      if (!ConvertYamlNode(item, converted, error)) {
        return false;
      }
      value.array_value.push_back(std::move(converted));
    }
    return true;
  case YAML::NodeType::Map:
    value.type = JsonValue::Type::kObject;
    for (const auto& entry : node) {
      if (!entry.first.IsScalar()) {
        error = "yaml error at " + FormatMark(entry.first.Mark()) +
                ": mapping keys must be scalars";
        return false;
      }
      const std::string key = entry.first.Scalar();
      if (value.object_value.count(key) != 0U) {
        error = "yaml error at " + FormatMark(entry.first.Mark()) + ": duplicate mapping key '" +
                key + "'";
        return false;
      }
      JsonValue converted;
      if (!ConvertYamlNode(entry.second, converted, error)) {
        return false;
      }
      value.object_value.emplace(key, std::move(converted));
    }
    return true;
  }

  value.type = JsonValue::Type::kNull;
  return true;
}

bool ParseYaml(std::string_view text, JsonValue& root, std::string& error) {
  YAML::Node document;
  try {
    document = YAML::Load(std::string(text));
  } catch (const YAML::Exception& ex) {
    error = "yaml parse error at " + FormatMark(ex.mark) + ": " + ex.msg;
    return false;
  }

  try {
    return ConvertYamlNode(document, root, error);
  } catch (const YAML::Exception& ex) {
    error = "yaml error at " + FormatMark(ex.mark) + ": " + ex.msg;
    return false;
  }
}

} // namespace

DocumentFormat DetectDocumentFormat(const fs::path& path, std::string_view text) {
  const std::string extension = core::ToLower(path.extension().string());
  if (extension == ".json") {
    return DocumentFormat::kJson;
  }
  if (extension == ".yml" || extension == ".yaml") {
    return DocumentFormat::kYaml;
  }

  const std::string_view trimmed = core::TrimView(text);
  if (!trimmed.empty() && trimmed.front() == '{') {
    return DocumentFormat::kJson;
  }
  return DocumentFormat::kYaml;
}

bool ParseSchemaDocument(std::string_view text, DocumentFormat format, JsonValue& root,
                         std::string& error) {
  root = JsonValue{};

  if (format == DocumentFormat::kJson) {
    std::string parse_error;
    if (!core::json::Parse(text, root, parse_error)) {
      error = "json " + parse_error;
      return false;
    }
    return true;
  }

  return ParseYaml(text, root, error);
}

bool LoadSchemaDocument(const fs::path& path, JsonValue& root, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    error = "unable to read schema: " + error;
    return false;
  }

  const DocumentFormat format = DetectDocumentFormat(path, text);
  if (!ParseSchemaDocument(text, format, root, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace rowguard::schema
