#pragma once

#include "csvio/dialect.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rowguard::csvio {

// Writes records in a dialect, one per line ('\n' terminated).
//
// Contract:
// - quote_all quotes every field; quote_minimal only fields holding the
//   delimiter, the quote character or a line break; quote_nonnumeric every
//   field that does not read as a number.
// - quote_none never quotes and writes the quote character as plain text. With
//   an escape character, delimiters, line breaks and the escape character
//   itself are prefixed by it; without one, a field holding the delimiter or
//   a newline cannot be written and is an error.
// - Returns false with `error` set on stream failure.
class RecordWriter {
public:
  RecordWriter(std::ostream& output, Dialect dialect);

  // Used once the reader has sniffed the input's delimiter.
  void SetDialect(const Dialect& dialect) {
    dialect_ = dialect;
  }

  bool Write(const std::vector<std::string>& fields, std::string& error);

  std::uint64_t RecordsWritten() const {
    return records_written_;
  }

private:
  bool NeedsQuotes(const std::string& field) const;
  bool AppendUnquoted(std::size_t index, const std::string& field, std::string& line,
                      std::string& error) const;

  std::ostream* output_;
  Dialect dialect_;
  std::uint64_t records_written_ = 0;
};

} // namespace rowguard::csvio
