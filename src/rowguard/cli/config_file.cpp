#include "rowguard/cli/config_file.hpp"

#include "core/json_dom.hpp"
#include "csvio/dialect.hpp"
#include "schema/loader.hpp"

#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rowguard::cli {

namespace {

using JsonValue = core::json::Value;

std::string NormalizeKey(std::string key) {
  for (char& c : key) {
    if (c == '_') {
      c = '-';
    }
  }
  return key;
}

bool WrongType(const std::string& key, const char* expected, const JsonValue& value,
               std::string& error) {
  error = "key '" + key + "' must be " + expected + " (found " +
          core::json::TypeName(value.type) + ")";
  return false;
}

bool ReadString(const std::string& key, const JsonValue& value, std::string& out,
                std::string& error) {
  if (value.type != JsonValue::Type::kString) {
    return WrongType(key, "a string", value, error);
  }
  out = value.string_value;
  return true;
}

bool ReadBool(const std::string& key, const JsonValue& value, bool& out, std::string& error) {
  if (value.type != JsonValue::Type::kBool) {
    return WrongType(key, "true or false", value, error);
  }
  out = value.bool_value;
  return true;
}

bool ReadChar(const std::string& key, const JsonValue& value, char& out, std::string& error) {
  std::string text;
  if (!ReadString(key, value, text, error)) {
    return false;
  }
  if (text.size() != 1U) {
    error = "key '" + key + "' must be a single character (got '" + text + "')";
    return false;
  }
  out = text.front();
  return true;
}

bool ReadInputs(const std::string& key, const JsonValue& value, std::vector<std::string>& out,
                std::string& error) {
  if (value.type == JsonValue::Type::kString) {
    out = {value.string_value};
    return true;
  }
  if (value.type != JsonValue::Type::kArray || value.array_value.empty()) {
    return WrongType(key, "a file name or a non-empty list of file names", value, error);
  }
  std::vector<std::string> names;
  for (const auto& item : value.array_value) {
    if (item.type != JsonValue::Type::kString) {
      return WrongType(key, "a list of file names", item, error);
    }
    names.push_back(item.string_value);
  }
  out = std::move(names);
  return true;
}

bool ReadFieldCount(const std::string& key, const JsonValue& value,
                    std::optional<std::size_t>& out, std::string& error) {
  const bool usable = value.type == JsonValue::Type::kNumber && std::isfinite(value.number_value) &&
                      value.number_value >= 1.0 &&
                      std::floor(value.number_value) == value.number_value;
  if (!usable) {
    return WrongType(key, "a positive integer", value, error);
  }
  out = static_cast<std::size_t>(value.number_value);
  return true;
}

using Setter = std::function<bool(const std::string&, const JsonValue&, ValidateOptions&,
                                  std::string&)>;

const std::map<std::string, Setter>& Setters() {
  static const std::map<std::string, Setter> kSetters = {
      {"infiles",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadInputs(key, value, options.input_files, error); }},
      {"schema",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadString(key, value, options.schema_path, error); }},
      {"field-count",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadFieldCount(key, value, options.field_count, error); }},
      {"out",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadString(key, value, options.valid_output, error); }},
      {"err-out",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadString(key, value, options.invalid_output, error); }},
      {"errmsg",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadBool(key, value, options.append_errmsg, error); }},
      {"delimiter",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) {
         std::string text;
         if (!ReadString(key, value, text, error) ||
             !csvio::ParseDelimiter(text, options.dialect.delimiter, error)) {
           return false;
         }
         options.dialect.sniff_delimiter = false;
         return true;
       }},
      {"quoting",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) {
         std::string text;
         return ReadString(key, value, text, error) &&
                csvio::ParseQuoting(text, options.dialect.quoting, error);
       }},
      {"quotechar",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadChar(key, value, options.dialect.quotechar, error); }},
      {"escapechar",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) {
         char escapechar = '\0';
         if (!ReadChar(key, value, escapechar, error)) {
           return false;
         }
         options.dialect.escapechar = escapechar;
         return true;
       }},
      {"has-header",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) {
         bool has_header = false;
         if (!ReadBool(key, value, has_header, error)) {
           return false;
         }
         options.dialect.has_header = has_header;
         return true;
       }},
      {"stats",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadBool(key, value, options.print_stats, error); }},
      {"summary",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadString(key, value, options.summary_path, error); }},
      {"dry-run",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadBool(key, value, options.dry_run, error); }},
      {"log-level",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) {
         std::string text;
         return ReadString(key, value, text, error) &&
                core::logging::ParseLogLevel(text, options.log_level, error);
       }},
      {"console-log",
       [](const std::string& key, const JsonValue& value, ValidateOptions& options,
          std::string& error) { return ReadBool(key, value, options.console_log, error); }},
  };
  return kSetters;
}

} // namespace

bool ResolveConfigName(std::string_view name, fs::path& path, std::string& error) {
  if (name.empty()) {
    error = "--config-name cannot be empty";
    return false;
  }

  fs::path base;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0') {
    base = fs::path(xdg);
  } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    base = fs::path(home) / ".config";
  } else {
    error = "cannot resolve --config-name: neither XDG_CONFIG_HOME nor HOME is set";
    return false;
  }

  path = base / "rowguard" / fs::path(name);
  if (!path.has_extension()) {
    path += ".yml";
  }
  return true;
}

bool ApplyConfigFile(const fs::path& path, ValidateOptions& options, std::string& error) {
  JsonValue root;
  if (!schema::LoadSchemaDocument(path, root, error)) {
    error = "invalid config '" + path.string() + "': " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "invalid config '" + path.string() + "': top level must be a mapping (found " +
            core::json::TypeName(root.type) + ")";
    return false;
  }

  ValidateOptions updated = options;
  for (const auto& [raw_key, value] : root.object_value) {
    std::string key = NormalizeKey(raw_key);
    if (key == "verbosity") {
      key = "log-level";
    }

    const auto& setters = Setters();
    const auto setter = setters.find(key);
    if (setter == setters.end()) {
      error = "invalid config '" + path.string() + "': unknown key '" + raw_key + "'";
      return false;
    }

    if (value.type == JsonValue::Type::kNull) {
      if (key == "has-header") {
        updated.dialect.has_header.reset();
      } else if (key == "escapechar") {
        updated.dialect.escapechar.reset();
      }
      continue;
    }

    if (!setter->second(raw_key, value, updated, error)) {
      error = "invalid config '" + path.string() + "': " + error;
      return false;
    }
  }

  options = std::move(updated);
  return true;
}

} // namespace rowguard::cli
