#pragma once

#include "schema/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rowguard::records {

// Outcome of one check: pass, or fail with a single diagnostic.
struct CheckResult {
  bool passed = true;
  std::string message;

  static CheckResult Pass() {
    return CheckResult{};
  }

  static CheckResult Fail(std::string message) {
    return CheckResult{.passed = false, .message = std::move(message)};
  }

  explicit operator bool() const {
    return passed;
  }
};

// Classifies records against a field-count contract and an optional schema.
//
// Check order for one record (first failure wins, later checks do not run):
//   field count -> [header: accepted] -> numeric type -> numeric range
//   -> generic structural checks
//
// The expected field count is either configured up front or adopted from the
// first CheckFieldCount call, and never changes afterwards. Not thread-safe;
// use one instance per record stream.
class RecordValidator {
public:
  explicit RecordValidator(std::optional<schema::Schema> schema = std::nullopt,
                           std::optional<std::size_t> expected_field_count = std::nullopt);

  // Compares `actual` to the field-count contract, adopting it first when no
  // count is fixed yet.
  CheckResult CheckFieldCount(std::size_t actual);

  // Numeric-type, numeric-range then generic checks. Always passes when no
  // schema is configured.
  CheckResult CheckSchema(const std::vector<std::string>& fields);

  // Full per-record sequence. Header rows run the field-count check (so they
  // can establish the contract) and are then accepted as-is.
  CheckResult Evaluate(const std::vector<std::string>& fields, bool is_header);

  // Diagnostic of the most recent failing check; empty after a passing one.
  const std::string& LastError() const {
    return last_error_;
  }

  std::optional<std::size_t> ExpectedFieldCount() const {
    return expected_field_count_;
  }

  bool HasSchema() const {
    return schema_.has_value();
  }

private:
  CheckResult CheckNumericTypes(const std::vector<std::string>& fields) const;
  CheckResult CheckNumericRanges(const std::vector<std::string>& fields) const;
  CheckResult Remember(CheckResult result);

  std::optional<schema::Schema> schema_;
  std::optional<std::size_t> expected_field_count_;
  std::string last_error_;
};

} // namespace rowguard::records
