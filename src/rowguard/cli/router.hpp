#pragma once

#include "core/logging/logger.hpp"
#include "csvio/dialect.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rowguard::cli {

// Options for `rowguard validate`, shared by the CLI and in-process callers.
struct ValidateOptions {
  // Processed in order as one record stream; "-" is stdin.
  std::vector<std::string> input_files = {"-"};
  std::string schema_path;
  std::optional<std::size_t> field_count;
  // "-" is stdout for valid records and stderr for invalid ones.
  std::string valid_output = "-";
  std::string invalid_output = "-";
  bool append_errmsg = false;
  // Delimiter and header are sniffed per input unless set.
  csvio::Dialect dialect{.has_header = std::nullopt, .sniff_delimiter = true};
  bool print_stats = true;
  std::string summary_path;
  bool dry_run = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
  // When false, no log lines are written; stats and error lines still are.
  bool console_log = true;
};

// Record tallies across all inputs of one validation run.
struct ValidationTally {
  std::uint64_t records_read = 0;
  std::uint64_t valid_records = 0;
  std::uint64_t invalid_records = 0;
  std::uint64_t header_records = 0;
  std::optional<std::size_t> field_count;
};

// Runs the full validate pipeline: schema load, record streaming, routing,
// stats and summary. Returns the process exit code.
int ExecuteValidation(const ValidateOptions& options, ValidationTally* tally);

// Routes `rowguard` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success (all records valid)
//   1  => command failed after valid invocation (I/O, malformed quoting)
//   2  => usage error (unknown command / invalid args)
//   10 => schema or config file rejected
//   61 => input held no records
//   74 => at least one invalid record
int Dispatch(int argc, char** argv);

} // namespace rowguard::cli
