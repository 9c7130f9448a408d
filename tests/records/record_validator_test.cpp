#include "records/record_validator.hpp"
#include "schema/loader.hpp"
#include "schema/validator.hpp"

#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <vector>

namespace {

using rowguard::records::CheckResult;
using rowguard::records::RecordValidator;
using rowguard::schema::Schema;

Schema SchemaFromYaml(const std::string& text) {
  rowguard::core::json::Value root;
  std::string error;
  REQUIRE(rowguard::schema::ParseSchemaDocument(text, rowguard::schema::DocumentFormat::kYaml,
                                                root, error));
  Schema schema;
  REQUIRE(rowguard::schema::ValidateSchema(root, schema, error));
  return schema;
}

void RequireContains(const std::string& text, const std::string& needle) {
  INFO("text: " << text);
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("Field count is adopted from the first record", "[records][field_count]") {
  RecordValidator validator;
  REQUIRE_FALSE(validator.ExpectedFieldCount().has_value());

  REQUIRE(validator.CheckFieldCount(4U));
  REQUIRE(validator.ExpectedFieldCount() == std::optional<std::size_t>(4U));

  const CheckResult short_record = validator.CheckFieldCount(3U);
  REQUIRE_FALSE(short_record);
  REQUIRE(short_record.message == "bad field count - should be 4 but is: 3");
  REQUIRE(validator.LastError() == short_record.message);

  // The contract never moves once fixed.
  REQUIRE_FALSE(validator.CheckFieldCount(5U));
  REQUIRE(validator.ExpectedFieldCount() == std::optional<std::size_t>(4U));
}

TEST_CASE("A passing check clears the last diagnostic", "[records][field_count]") {
  RecordValidator validator(std::nullopt, 2U);
  REQUIRE_FALSE(validator.CheckFieldCount(1U));
  REQUIRE_FALSE(validator.LastError().empty());
  REQUIRE(validator.CheckFieldCount(2U));
  REQUIRE(validator.LastError().empty());
}

TEST_CASE("Configured field count mismatch skips the schema check", "[records][evaluate]") {
  RecordValidator validator(SchemaFromYaml("items:\n  - {numericKind: integer}\n"), 3U);

  const CheckResult result = validator.Evaluate({"abc", "x"}, false);
  REQUIRE_FALSE(result);
  REQUIRE(result.message == "bad field count - should be 3 but is: 2");
  REQUIRE(result.message.find("numericKind") == std::string::npos);
}

TEST_CASE("Without a schema only the field count is judged", "[records][evaluate]") {
  RecordValidator validator;
  REQUIRE_FALSE(validator.HasSchema());
  REQUIRE(validator.CheckSchema({"", "anything"}));
  REQUIRE(validator.Evaluate({"a", "b"}, false));
  REQUIRE(validator.Evaluate({"", ""}, false));
  REQUIRE_FALSE(validator.Evaluate({"a"}, false));
}

TEST_CASE("Numeric type failures name the check and the value", "[records][numeric]") {
  RecordValidator validator(SchemaFromYaml("items:\n  - {numericKind: integer}\n"));

  const CheckResult result = validator.CheckSchema({"abc"});
  REQUIRE_FALSE(result);
  RequireContains(result.message, "numericKind:integer");
  RequireContains(result.message, "abc");
  RequireContains(result.message, "field 0");
  REQUIRE(validator.LastError() == result.message);
}

TEST_CASE("Float fields accept decimal text and reject words", "[records][numeric]") {
  RecordValidator validator(SchemaFromYaml("items:\n  - {title: ratio, numericKind: float}\n"));
  REQUIRE(validator.CheckSchema({"0.25"}));
  REQUIRE(validator.CheckSchema({"-1e-3"}));

  const CheckResult result = validator.CheckSchema({"high"});
  REQUIRE_FALSE(result);
  RequireContains(result.message, "field 0 (ratio) failed numericKind:float check");
}

TEST_CASE("Numeric range failures name the limit and the value", "[records][numeric]") {
  RecordValidator validator(
      SchemaFromYaml("items:\n  - {numericKind: integer, numericMinimum: 0, numericMaximum: 10}\n"));

  const CheckResult below = validator.CheckSchema({"-5"});
  REQUIRE_FALSE(below);
  RequireContains(below.message, "numericMinimum");
  RequireContains(below.message, "-5");

  const CheckResult above = validator.CheckSchema({"11"});
  REQUIRE_FALSE(above);
  RequireContains(above.message, "numericMaximum 10");
  RequireContains(above.message, "'11'");

  REQUIRE(validator.CheckSchema({"0"}));
  REQUIRE(validator.CheckSchema({"10"}));
}

TEST_CASE("Numeric type failures win over range and generic failures", "[records][order]") {
  RecordValidator validator(SchemaFromYaml(R"(
items:
  - {title: name, maxLength: 2}
  - {title: score, numericKind: float, numericMaximum: 1.0}
  - {title: count, numericKind: integer}
)"));

  // name breaks maxLength, score breaks the range, count breaks the type.
  const CheckResult result = validator.CheckSchema({"toolong", "5.0", "x"});
  REQUIRE_FALSE(result);
  RequireContains(result.message, "field 2 (count) failed numericKind:integer");

  const CheckResult range_first = validator.CheckSchema({"toolong", "5.0", "3"});
  REQUIRE_FALSE(range_first);
  RequireContains(range_first.message, "field 1 (score) failed numericMaximum");

  const CheckResult generic = validator.CheckSchema({"toolong", "0.5", "3"});
  REQUIRE_FALSE(generic);
  RequireContains(generic.message, "field 0 (name)");
  RequireContains(generic.message, "maxLength 2");
}

TEST_CASE("Short records are reported as parsing problems, not type errors", "[records][numeric]") {
  RecordValidator validator(
      SchemaFromYaml("items:\n  - {title: a}\n  - {title: b, numericKind: integer}\n"));

  const CheckResult result = validator.CheckSchema({"only"});
  REQUIRE_FALSE(result);
  RequireContains(result.message, "field 1 (b) is missing");
  RequireContains(result.message, "delimiter or parsing error");
}

TEST_CASE("Record validation is idempotent", "[records][evaluate]") {
  RecordValidator validator(
      SchemaFromYaml("items:\n  - {numericKind: integer, numericMinimum: 0}\n  - {}\n"));

  const std::vector<std::string> bad = {"-1", "x"};
  const std::vector<std::string> good = {"1", "x"};

  const CheckResult first = validator.Evaluate(bad, false);
  const CheckResult second = validator.Evaluate(bad, false);
  REQUIRE(first.passed == second.passed);
  REQUIRE(first.message == second.message);

  REQUIRE(validator.Evaluate(good, false));
  REQUIRE(validator.Evaluate(good, false));
  REQUIRE(validator.LastError().empty());
}

TEST_CASE("Header rows establish the field count and skip schema checks", "[records][header]") {
  RecordValidator validator(SchemaFromYaml("items:\n  - {numericKind: integer}\n  - {}\n"));

  REQUIRE(validator.Evaluate({"count", "label"}, true));
  REQUIRE(validator.ExpectedFieldCount() == std::optional<std::size_t>(2U));
  REQUIRE(validator.LastError().empty());

  REQUIRE(validator.Evaluate({"3", "ok"}, false));
  REQUIRE_FALSE(validator.Evaluate({"3"}, false));
}

TEST_CASE("Generic failures surface verbatim after numeric checks pass", "[records][generic]") {
  RecordValidator validator(SchemaFromYaml(R"(
items:
  - {title: id, numericKind: integer}
  - {title: status, enum: [open, closed]}
)"));

  const CheckResult result = validator.CheckSchema({"7", "pending"});
  REQUIRE_FALSE(result);
  REQUIRE(result.message == "field 1 (status): value 'pending' is not in the enumeration");
}
