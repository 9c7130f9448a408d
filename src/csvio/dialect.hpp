#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowguard::csvio {

enum class Quoting {
  kQuoteAll,
  kQuoteMinimal,
  kQuoteNonNumeric,
  kQuoteNone,
};

const char* ToString(Quoting quoting);
bool ParseQuoting(std::string_view raw, Quoting& quoting, std::string& error);

struct Dialect {
  char delimiter = ',';
  char quotechar = '"';
  // Only used under quote_none: the reader takes the next character
  // literally, the writer prefixes delimiters, line breaks and itself.
  std::optional<char> escapechar;
  Quoting quoting = Quoting::kQuoteMinimal;
  // Unset means the reader guesses from a sample of the input.
  std::optional<bool> has_header = false;
  // When set, the reader replaces `delimiter` with one guessed from the first
  // line it reads.
  bool sniff_delimiter = false;
};

// Accepts a single character or the aliases `tab` and `\t` (as typed on a
// shell command line).
bool ParseDelimiter(std::string_view raw, char& delimiter, std::string& error);

// Guesses the delimiter from one line, counting only characters outside
// quotes. `,` `|` and tab win on a single occurrence (most frequent first,
// ties to the earlier one). `;` and `:` also show up inside values such as
// times, so they need at least two occurrences. No hit keeps `fallback`.
char SniffDelimiter(std::string_view line, char quotechar, char fallback);

// Records the header sniffer inspects: the candidate header plus this many
// following records.
inline constexpr std::size_t kHeaderSampleRecords = 21;

// Guesses whether the first record of `sample` is a header by comparing it
// column by column with the records after it. A column votes when the
// following records agree on a shape (all numeric, or all the same length):
// a first value that breaks the shape votes header, one that fits votes data.
// Columns with no agreeing records and records of another width do not vote.
bool SniffHeader(const std::vector<std::vector<std::string>>& sample);

} // namespace rowguard::csvio
