#pragma once

#include "core/json_dom.hpp"
#include "schema/model.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace rowguard::schema {

// Checks a raw schema mapping for internal consistency and builds the typed
// Schema the record checks run against.
//
// Contract:
// - The top level must be a mapping holding exactly one attribute, `items`,
//   whose value is a sequence of mappings (one rule per column).
// - Per rule, keys are checked against a whitelist; look-alike generic keys
//   (minimum, maximum, format, ...) fail as "unsupported key", anything else
//   as "unknown key".
// - `required`/`blank` must be booleans, `numericKind` one of
//   integer|float|string, and numericMinimum/numericMaximum need a numeric
//   numericKind plus a limit coercible to it.
// - Returns false with one configuration error naming the rule and the
//   offending key or value. The first violation wins.
// - Stateless. A failure here is fatal: no record may be validated.
bool ValidateSchema(const core::json::Value& root, Schema& schema, std::string& error);

// Absent mapping means "no schema configured": succeeds and leaves `schema`
// empty.
bool ValidateSchema(const core::json::Value* root, std::optional<Schema>& schema,
                    std::string& error);

// Reads, parses and validates a schema document in one step.
bool LoadSchemaFile(const std::filesystem::path& path, Schema& schema, std::string& error);

} // namespace rowguard::schema
