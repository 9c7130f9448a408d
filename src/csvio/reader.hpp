#pragma once

#include "csvio/dialect.hpp"

#include <cstdint>
#include <deque>
#include <istream>
#include <string>
#include <vector>

namespace rowguard::csvio {

// One input row.
struct Record {
  std::vector<std::string> fields;
  // 1-based position among the records of this input, header included.
  std::uint64_t number = 0;
  // First record of an input read with `Dialect::has_header`.
  bool is_header = false;
};

// Streams records from a text source one at a time.
//
// Contract:
// - Quoted fields may hold delimiters, doubled quote characters and line
//   breaks, unless quoting is `quote_none` (quotes are then ordinary text and
//   an escape character, when set, makes the next character literal; one at
//   the end of a line continues the field on the next line).
// - Blank lines are skipped; a trailing '\r' on each line is dropped.
// - With `Dialect::has_header` unset, the first records are buffered and
//   handed to SniffHeader before the first one is returned.
// - `Next` returns false at end of input with `error` empty, or on malformed
//   input with `error` set.
class RecordReader {
public:
  RecordReader(std::istream& input, Dialect dialect);

  bool Next(Record& record, std::string& error);

  // Dialect in effect, including a sniffed delimiter and header decision once
  // the first record has been returned.
  const Dialect& CurrentDialect() const {
    return dialect_;
  }

  std::uint64_t RecordsRead() const {
    return records_read_;
  }

private:
  bool ReadFields(std::vector<std::string>& fields, std::string& error);
  void SampleHeader();
  bool ReadLine(std::string& line);
  bool SplitQuoted(std::string line, std::vector<std::string>& fields, std::string& error);
  bool SplitPlain(std::string line, std::vector<std::string>& fields, std::string& error);

  std::istream* input_;
  Dialect dialect_;
  // Records read ahead for header sniffing, and an error met while doing so.
  std::deque<std::vector<std::string>> pending_;
  std::string pending_error_;
  std::uint64_t records_read_ = 0;
  std::uint64_t line_number_ = 0;
};

} // namespace rowguard::csvio
