#include "records/structural_validator.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {

using rowguard::schema::FieldRule;
using rowguard::schema::GenericType;
using rowguard::schema::Schema;

FieldRule Rule(std::size_t index) {
  FieldRule rule;
  rule.index = index;
  return rule;
}

void SetPattern(FieldRule& rule, const std::string& text) {
  std::string error;
  REQUIRE(rowguard::schema::CompilePattern(text, rule.pattern, error));
  rule.pattern_text = text;
}

bool Check(const Schema& schema, const std::vector<std::string>& values, std::string& violation) {
  return rowguard::records::ValidateStructure(schema, values, violation);
}

} // namespace

TEST_CASE("Blank values fail unless the rule allows them", "[records][structural]") {
  Schema schema;
  schema.items.push_back(Rule(0));
  FieldRule optional_note = Rule(1);
  optional_note.blank = true;
  optional_note.min_length = 3;
  schema.items.push_back(optional_note);

  std::string violation;
  REQUIRE_FALSE(Check(schema, {"", "abc"}, violation));
  REQUIRE(violation == "field 0: value cannot be blank");

  // An allowed blank skips the remaining checks for that field.
  REQUIRE(Check(schema, {"x", ""}, violation));
  REQUIRE(violation.empty());
}

TEST_CASE("Only string and any types accept record text", "[records][structural]") {
  Schema schema;
  FieldRule rule = Rule(0);
  rule.title = "flag";
  rule.types = {GenericType::kBoolean, GenericType::kNull};
  schema.items.push_back(rule);

  std::string violation;
  REQUIRE_FALSE(Check(schema, {"true"}, violation));
  REQUIRE(violation == "field 0 (flag): value 'true' is not of type boolean|null");

  schema.items.front().types.push_back(GenericType::kAny);
  REQUIRE(Check(schema, {"true"}, violation));
}

TEST_CASE("Enum, pattern and length checks run in that order", "[records][structural]") {
  Schema schema;
  FieldRule rule = Rule(0);
  rule.enum_values = {"AB", "ABCDE", "abc"};
  SetPattern(rule, "^[A-Z]+$");
  rule.max_length = 3;
  schema.items.push_back(rule);

  std::string violation;
  REQUIRE_FALSE(Check(schema, {"XYZ"}, violation));
  REQUIRE(violation.find("not in the enumeration") != std::string::npos);

  REQUIRE_FALSE(Check(schema, {"abc"}, violation));
  REQUIRE(violation.find("does not match pattern '^[A-Z]+$'") != std::string::npos);

  REQUIRE_FALSE(Check(schema, {"ABCDE"}, violation));
  REQUIRE(violation.find("greater than maxLength 3") != std::string::npos);

  REQUIRE(Check(schema, {"AB"}, violation));
}

TEST_CASE("Patterns match anywhere unless anchored", "[records][structural]") {
  Schema schema;
  FieldRule rule = Rule(0);
  SetPattern(rule, "[0-9]");
  schema.items.push_back(rule);

  std::string violation;
  REQUIRE(Check(schema, {"abc1"}, violation));
  REQUIRE_FALSE(Check(schema, {"abc"}, violation));
}

TEST_CASE("Very long fields are matched without exhausting the stack", "[records][structural]") {
  Schema schema;
  FieldRule rule = Rule(0);
  SetPattern(rule, "^[a-z]+$");
  schema.items.push_back(rule);
  FieldRule alternation = Rule(1);
  SetPattern(alternation, "^(a|b)*$");
  schema.items.push_back(alternation);

  const std::string long_field(1000000U, 'a');
  std::string violation;
  REQUIRE(Check(schema, {long_field, long_field}, violation));

  std::string bad_tail = long_field;
  bad_tail.back() = '1';
  REQUIRE_FALSE(Check(schema, {bad_tail, long_field}, violation));
  REQUIRE(violation.find("field 0: value '") == 0U);
  REQUIRE(violation.find("does not match pattern '^[a-z]+$'") != std::string::npos);
}

TEST_CASE("Invalid pattern text is reported, not thrown", "[records][structural]") {
  FieldRule rule = Rule(0);
  std::string error;
  REQUIRE_FALSE(rowguard::schema::CompilePattern("[a-", rule.pattern, error));
  REQUIRE_FALSE(error.empty());
  REQUIRE(rule.pattern == nullptr);
}

TEST_CASE("Lengths count code points rather than bytes", "[records][structural]") {
  Schema schema;
  FieldRule rule = Rule(0);
  rule.max_length = 4;
  schema.items.push_back(rule);

  std::string violation;
  REQUIRE(Check(schema, {"caf\xC3\xA9"}, violation));
}

TEST_CASE("Missing fields fail only when required", "[records][structural]") {
  Schema schema;
  schema.items.push_back(Rule(0));
  schema.items.push_back(Rule(1));

  std::string violation;
  REQUIRE(Check(schema, {"a"}, violation));

  schema.items.back().required = true;
  schema.items.back().title = "zip";
  REQUIRE_FALSE(Check(schema, {"a"}, violation));
  REQUIRE(violation == "field 1 (zip): required field is missing");
}

TEST_CASE("Fields beyond the schema are not judged", "[records][structural]") {
  Schema schema;
  schema.items.push_back(Rule(0));

  std::string violation;
  REQUIRE(Check(schema, {"a", "", ""}, violation));
}
