#include "records/record_validator.hpp"

#include "records/structural_validator.hpp"
#include "schema/numeric.hpp"

#include <string>
#include <utility>

namespace rowguard::records {

namespace {

std::string Quote(const std::string& value) {
  return "'" + value + "'";
}

} // namespace

RecordValidator::RecordValidator(std::optional<schema::Schema> schema,
                                 std::optional<std::size_t> expected_field_count)
    : schema_(std::move(schema)), expected_field_count_(expected_field_count) {}

CheckResult RecordValidator::CheckFieldCount(std::size_t actual) {
  if (!expected_field_count_.has_value()) {
    expected_field_count_ = actual;
  }

  if (actual != *expected_field_count_) {
    return Remember(CheckResult::Fail("bad field count - should be " +
                                      std::to_string(*expected_field_count_) +
                                      " but is: " + std::to_string(actual)));
  }
  return Remember(CheckResult::Pass());
}

CheckResult RecordValidator::CheckSchema(const std::vector<std::string>& fields) {
  if (!schema_.has_value()) {
    return Remember(CheckResult::Pass());
  }

  if (CheckResult result = CheckNumericTypes(fields); !result) {
    return Remember(std::move(result));
  }
  if (CheckResult result = CheckNumericRanges(fields); !result) {
    return Remember(std::move(result));
  }

  std::string violation;
  if (!ValidateStructure(*schema_, fields, violation)) {
    return Remember(CheckResult::Fail(std::move(violation)));
  }
  return Remember(CheckResult::Pass());
}

CheckResult RecordValidator::Evaluate(const std::vector<std::string>& fields, bool is_header) {
  CheckResult count_result = CheckFieldCount(fields.size());
  if (is_header) {
    return Remember(CheckResult::Pass());
  }
  if (!count_result) {
    return count_result;
  }
  return CheckSchema(fields);
}

CheckResult RecordValidator::CheckNumericTypes(const std::vector<std::string>& fields) const {
  for (const auto& rule : schema_->items) {
    if (!rule.IsNumeric()) {
      continue;
    }

    const std::string check = std::string("numericKind:") + schema::ToString(*rule.numeric_kind);
    if (rule.index >= fields.size()) {
      return CheckResult::Fail(rule.Label() + " is missing - the record has only " +
                               std::to_string(fields.size()) +
                               " fields, probably a delimiter or parsing error rather than a " +
                               check + " failure");
    }

    schema::NumericValue parsed;
    const std::string& value = fields[rule.index];
    if (!schema::CoerceNumeric(value, *rule.numeric_kind, parsed)) {
      return CheckResult::Fail(rule.Label() + " failed " + check + " check - value " +
                               Quote(value) + " is not a valid " +
                               schema::ToString(*rule.numeric_kind));
    }
  }
  return CheckResult::Pass();
}

CheckResult RecordValidator::CheckNumericRanges(const std::vector<std::string>& fields) const {
  for (const auto& rule : schema_->items) {
    if (!rule.numeric_minimum.has_value() && !rule.numeric_maximum.has_value()) {
      continue;
    }
    if (!rule.IsNumeric() || rule.index >= fields.size()) {
      continue;
    }

    const std::string& value = fields[rule.index];
    schema::NumericValue parsed;
    if (!schema::CoerceNumeric(value, *rule.numeric_kind, parsed)) {
      continue;
    }

    if (rule.numeric_minimum.has_value() &&
        schema::CompareNumeric(parsed, rule.numeric_minimum->value) < 0) {
      return CheckResult::Fail(rule.Label() + " failed numericMinimum check - value " +
                               Quote(value) + " is less than numericMinimum " +
                               rule.numeric_minimum->text);
    }
    if (rule.numeric_maximum.has_value() &&
        schema::CompareNumeric(parsed, rule.numeric_maximum->value) > 0) {
      return CheckResult::Fail(rule.Label() + " failed numericMaximum check - value " +
                               Quote(value) + " is greater than numericMaximum " +
                               rule.numeric_maximum->text);
    }
  }
  return CheckResult::Pass();
}

CheckResult RecordValidator::Remember(CheckResult result) {
  if (result.passed) {
    last_error_.clear();
  } else {
    last_error_ = result.message;
  }
  return result;
}

} // namespace rowguard::records
