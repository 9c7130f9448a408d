#include "csvio/dialect.hpp"

#include "core/text_utils.hpp"
#include "schema/numeric.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rowguard::csvio {

const char* ToString(Quoting quoting) {
  switch (quoting) {
  case Quoting::kQuoteAll:
    return "quote_all";
  case Quoting::kQuoteMinimal:
    return "quote_minimal";
  case Quoting::kQuoteNonNumeric:
    return "quote_nonnumeric";
  case Quoting::kQuoteNone:
    return "quote_none";
  }
  return "quote_minimal";
}

bool ParseQuoting(std::string_view raw, Quoting& quoting, std::string& error) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "quote_all") {
    quoting = Quoting::kQuoteAll;
    return true;
  }
  if (normalized == "quote_minimal") {
    quoting = Quoting::kQuoteMinimal;
    return true;
  }
  if (normalized == "quote_nonnumeric") {
    quoting = Quoting::kQuoteNonNumeric;
    return true;
  }
  if (normalized == "quote_none") {
    quoting = Quoting::kQuoteNone;
    return true;
  }

  error = "invalid --quoting '" + std::string(raw) +
          "' (expected quote_all|quote_minimal|quote_nonnumeric|quote_none)";
  return false;
}

bool ParseDelimiter(std::string_view raw, char& delimiter, std::string& error) {
  if (raw == "tab" || raw == "\\t" || raw == "\t") {
    delimiter = '\t';
    return true;
  }
  if (raw.size() != 1U) {
    error = "delimiter must be a single character, 'tab' or '\\t' (got '" + std::string(raw) +
            "')";
    return false;
  }
  if (raw.front() == '\n' || raw.front() == '\r') {
    error = "delimiter cannot be a line terminator";
    return false;
  }
  delimiter = raw.front();
  return true;
}

char SniffDelimiter(std::string_view line, char quotechar, char fallback) {
  constexpr std::array<char, 5> kCandidates = {',', '|', '\t', ';', ':'};
  constexpr std::size_t kFirstWeakCandidate = 3;
  std::array<std::size_t, kCandidates.size()> counts{};

  bool in_quotes = false;
  for (const char c : line) {
    if (c == quotechar) {
      in_quotes = !in_quotes;
      continue;
    }
    if (in_quotes) {
      continue;
    }
    for (std::size_t i = 0; i < kCandidates.size(); ++i) {
      if (c == kCandidates[i]) {
        ++counts[i];
      }
    }
  }

  const auto pick = [&](std::size_t first, std::size_t last, std::size_t min_count) {
    std::size_t best = kCandidates.size();
    for (std::size_t i = first; i < last; ++i) {
      if (counts[i] < min_count) {
        continue;
      }
      if (best == kCandidates.size() || counts[i] > counts[best]) {
        best = i;
      }
    }
    return best;
  };

  std::size_t best = pick(0, kFirstWeakCandidate, 1U);
  if (best == kCandidates.size()) {
    best = pick(kFirstWeakCandidate, kCandidates.size(), 2U);
  }
  return best == kCandidates.size() ? fallback : kCandidates[best];
}

bool SniffHeader(const std::vector<std::vector<std::string>>& sample) {
  if (sample.size() < 2U) {
    return false;
  }

  // Per column: unset until a record agrees, then numeric (-1) or a length.
  // A column whose records disagree drops out of the vote.
  constexpr long long kNumericShape = -1;
  const std::vector<std::string>& header = sample.front();
  std::vector<std::optional<long long>> shapes(header.size());
  std::vector<bool> dropped(header.size(), false);

  const auto is_number = [](const std::string& value) {
    double ignored = 0.0;
    return schema::ParseFloat(value, ignored);
  };
  const auto shape_of = [&](const std::string& value) {
    return is_number(value) ? kNumericShape : static_cast<long long>(value.size());
  };

  for (std::size_t row = 1; row < sample.size(); ++row) {
    const std::vector<std::string>& record = sample[row];
    if (record.size() != header.size()) {
      continue;
    }
    for (std::size_t col = 0; col < header.size(); ++col) {
      if (dropped[col]) {
        continue;
      }
      const long long shape = shape_of(record[col]);
      if (!shapes[col].has_value()) {
        shapes[col] = shape;
      } else if (*shapes[col] != shape) {
        dropped[col] = true;
      }
    }
  }

  int votes = 0;
  for (std::size_t col = 0; col < header.size(); ++col) {
    if (dropped[col] || !shapes[col].has_value()) {
      continue;
    }
    const bool fits = *shapes[col] == kNumericShape
                          ? is_number(header[col])
                          : static_cast<long long>(header[col].size()) == *shapes[col];
    votes += fits ? -1 : 1;
  }
  return votes > 0;
}

} // namespace rowguard::csvio
