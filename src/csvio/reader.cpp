#include "csvio/reader.hpp"

#include <string>
#include <utility>
#include <vector>

namespace rowguard::csvio {

RecordReader::RecordReader(std::istream& input, Dialect dialect)
    : input_(&input), dialect_(dialect) {}

bool RecordReader::Next(Record& record, std::string& error) {
  error.clear();
  if (!dialect_.has_header.has_value()) {
    SampleHeader();
  }

  std::vector<std::string> fields;
  if (!pending_.empty()) {
    fields = std::move(pending_.front());
    pending_.pop_front();
  } else if (!pending_error_.empty()) {
    error = std::move(pending_error_);
    pending_error_.clear();
    return false;
  } else if (!ReadFields(fields, error)) {
    return false;
  }

  ++records_read_;
  record = Record{};
  record.fields = std::move(fields);
  record.number = records_read_;
  record.is_header = dialect_.has_header.value_or(false) && records_read_ == 1U;
  return true;
}

void RecordReader::SampleHeader() {
  std::vector<std::string> fields;
  while (pending_.size() < kHeaderSampleRecords && ReadFields(fields, pending_error_)) {
    pending_.push_back(std::move(fields));
    fields.clear();
  }
  dialect_.has_header =
      SniffHeader(std::vector<std::vector<std::string>>(pending_.begin(), pending_.end()));
}

bool RecordReader::ReadFields(std::vector<std::string>& fields, std::string& error) {
  std::string line;
  do {
    if (!ReadLine(line)) {
      if (input_->bad()) {
        error = "read failure after line " + std::to_string(line_number_);
      }
      return false;
    }
  } while (line.empty());

  if (dialect_.sniff_delimiter) {
    dialect_.delimiter = SniffDelimiter(line, dialect_.quotechar, dialect_.delimiter);
    dialect_.sniff_delimiter = false;
  }

  if (dialect_.quoting == Quoting::kQuoteNone) {
    return SplitPlain(std::move(line), fields, error);
  }
  return SplitQuoted(std::move(line), fields, error);
}

bool RecordReader::ReadLine(std::string& line) {
  if (!std::getline(*input_, line)) {
    return false;
  }
  ++line_number_;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

bool RecordReader::SplitPlain(std::string line, std::vector<std::string>& fields,
                              std::string& error) {
  fields.clear();
  const std::uint64_t first_line = line_number_;
  std::string field;
  std::size_t i = 0;

  while (true) {
    bool continued = false;
    for (; i < line.size(); ++i) {
      const char c = line[i];
      if (dialect_.escapechar.has_value() && c == *dialect_.escapechar) {
        if (i + 1 < line.size()) {
          field.push_back(line[++i]);
          continue;
        }
        continued = true;
        break;
      }
      if (c == dialect_.delimiter) {
        fields.push_back(std::move(field));
        field.clear();
        continue;
      }
      field.push_back(c);
    }

    if (!continued) {
      break;
    }

    // Escaped line break: the field continues on the next physical line.
    std::string next;
    if (!ReadLine(next)) {
      error = "escape character at end of input in record starting at line " +
              std::to_string(first_line);
      return false;
    }
    field.push_back('\n');
    line = std::move(next);
    i = 0;
  }

  fields.push_back(std::move(field));
  return true;
}

bool RecordReader::SplitQuoted(std::string line, std::vector<std::string>& fields,
                               std::string& error) {
  fields.clear();
  const std::uint64_t first_line = line_number_;
  const char quote = dialect_.quotechar;

  std::string field;
  bool in_quotes = false;
  bool at_field_start = true;
  std::size_t i = 0;

  while (true) {
    for (; i < line.size(); ++i) {
      const char c = line[i];
      if (in_quotes) {
        if (c != quote) {
          field.push_back(c);
        } else if (i + 1 < line.size() && line[i + 1] == quote) {
          field.push_back(quote);
          ++i;
        } else {
          in_quotes = false;
        }
        continue;
      }

      if (c == dialect_.delimiter) {
        fields.push_back(std::move(field));
        field.clear();
        at_field_start = true;
        continue;
      }
      if (c == quote && at_field_start) {
        in_quotes = true;
        at_field_start = false;
        continue;
      }
      field.push_back(c);
      at_field_start = false;
    }

    if (!in_quotes) {
      break;
    }

    // Quoted field continues on the next physical line.
    std::string next;
    if (!ReadLine(next)) {
      error = "unterminated quoted field in record starting at line " +
              std::to_string(first_line);
      return false;
    }
    field.push_back('\n');
    line = std::move(next);
    i = 0;
  }

  fields.push_back(std::move(field));
  return true;
}

} // namespace rowguard::csvio
