#pragma once

#include "schema/model.hpp"

#include <string>
#include <vector>

namespace rowguard::records {

// Generic JSON-schema-style checks over a record's raw text values: type,
// blank, enum, pattern, minLength/maxLength and required.
//
// Each field is judged only as text. Numeric meaning (numericKind and its
// limits) is outside this engine's reach and is checked before it runs.
//
// Contract:
// - Fields are checked in column order; within a field the order is blank,
//   type, enum, pattern, minLength, maxLength.
// - A field the record does not have fails only when its rule is `required`.
// - Extra record fields beyond the schema are not checked.
// - Returns false with the first violation in `violation`.
bool ValidateStructure(const schema::Schema& schema, const std::vector<std::string>& values,
                       std::string& violation);

} // namespace rowguard::records
