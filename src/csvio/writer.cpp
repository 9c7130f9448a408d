#include "csvio/writer.hpp"

#include "schema/numeric.hpp"

#include <string>

namespace rowguard::csvio {

RecordWriter::RecordWriter(std::ostream& output, Dialect dialect)
    : output_(&output), dialect_(dialect) {}

bool RecordWriter::NeedsQuotes(const std::string& field) const {
  switch (dialect_.quoting) {
  case Quoting::kQuoteAll:
    return true;
  case Quoting::kQuoteNonNumeric: {
    double ignored = 0.0;
    return !schema::ParseFloat(field, ignored);
  }
  case Quoting::kQuoteNone:
    return false;
  case Quoting::kQuoteMinimal:
    break;
  }

  for (const char c : field) {
    if (c == dialect_.delimiter || c == dialect_.quotechar || c == '\n' || c == '\r') {
      return true;
    }
  }
  return false;
}

bool RecordWriter::AppendUnquoted(std::size_t index, const std::string& field,
                                  std::string& line, std::string& error) const {
  for (const char c : field) {
    const bool special = c == dialect_.delimiter || c == '\n' ||
                         (dialect_.escapechar.has_value() &&
                          (c == '\r' || c == *dialect_.escapechar));
    if (!special) {
      line.push_back(c);
      continue;
    }
    if (!dialect_.escapechar.has_value()) {
      error = "field " + std::to_string(index) +
              " holds the delimiter or a line break but quoting is quote_none and no "
              "escapechar is set";
      return false;
    }
    line.push_back(*dialect_.escapechar);
    line.push_back(c);
  }
  return true;
}

bool RecordWriter::Write(const std::vector<std::string>& fields, std::string& error) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i != 0U) {
      line.push_back(dialect_.delimiter);
    }

    const std::string& field = fields[i];
    if (dialect_.quoting == Quoting::kQuoteNone) {
      if (!AppendUnquoted(i, field, line, error)) {
        return false;
      }
      continue;
    }
    if (!NeedsQuotes(field)) {
      line += field;
      continue;
    }

    line.push_back(dialect_.quotechar);
    for (const char c : field) {
      if (c == dialect_.quotechar) {
        line.push_back(dialect_.quotechar);
      }
      line.push_back(c);
    }
    line.push_back(dialect_.quotechar);
  }
  line.push_back('\n');

  (*output_) << line;
  if (!(*output_)) {
    error = "failed while writing record " + std::to_string(records_written_ + 1U);
    return false;
  }
  ++records_written_;
  return true;
}

} // namespace rowguard::csvio
