#include "rowguard/cli/router.hpp"

#include "artifacts/summary_writer.hpp"
#include "rowguard/cli/config_file.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "csvio/reader.hpp"
#include "csvio/writer.hpp"
#include "records/record_validator.hpp"
#include "schema/validator.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rowguard::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitNoData = core::errors::ToInt(core::errors::ExitCode::kNoData);
constexpr int kExitInvalidData = core::errors::ToInt(core::errors::ExitCode::kInvalidData);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  rowguard validate [<file>...] [--schema <schema.yml|schema.json>] "
         "[--field-count <n>]\n"
      << "                    [--out <path>] [--err-out <path>] [--errmsg] "
         "[-d|--delimiter <c|tab>]\n"
      << "                    [--quoting <quote_all|quote_minimal|quote_nonnumeric|quote_none>] "
         "[--quotechar <c>]\n"
      << "                    [--escapechar <c>] [--has-header|--no-header] "
         "[--stats|--no-stats]\n"
      << "                    [--summary <path>] [--dry-run] "
         "[--config-fn <path>|--config-name <name>]\n"
      << "                    [--log-level <debug|info|warn|error>] "
         "[--console-log|--no-console-log]\n"
      << "  rowguard check-schema <schema.yml|schema.json>\n"
      << "  rowguard version\n"
      << "  rowguard help\n";
}

bool ParseFieldCount(std::string_view raw, std::size_t& field_count, std::string& error) {
  std::size_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto result = std::from_chars(begin, end, parsed);
  if (raw.empty() || result.ec != std::errc() || result.ptr != end || parsed == 0U) {
    error = "invalid --field-count '" + std::string(raw) + "' (expected a positive integer)";
    return false;
  }
  field_count = parsed;
  return true;
}

// Parse `validate` args. Anything starting with '-' other than a bare "-" is
// treated as an option; unknown options are usage errors.
bool ParseValidateOptions(const std::vector<std::string_view>& args, ValidateOptions& options,
                          std::string& error) {
  std::vector<std::string> inputs;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    const auto take_value = [&](std::string_view& value) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      value = args[++i];
      return true;
    };

    std::string_view value;
    if (token == "--errmsg") {
      options.append_errmsg = true;
      continue;
    }
    if (token == "--has-header") {
      options.dialect.has_header = true;
      continue;
    }
    if (token == "--no-header") {
      options.dialect.has_header = false;
      continue;
    }
    if (token == "--console-log") {
      options.console_log = true;
      continue;
    }
    if (token == "--no-console-log") {
      options.console_log = false;
      continue;
    }
    if (token == "--config-fn" || token == "--config-name") {
      // Applied before the other options by FindConfigPath.
      if (!take_value(value)) {
        return false;
      }
      continue;
    }
    if (token == "--stats") {
      options.print_stats = true;
      continue;
    }
    if (token == "--no-stats") {
      options.print_stats = false;
      continue;
    }
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--schema") {
      if (!take_value(value)) {
        return false;
      }
      options.schema_path = std::string(value);
      continue;
    }
    if (token == "--field-count") {
      if (!take_value(value)) {
        return false;
      }
      std::size_t parsed = 0;
      if (!ParseFieldCount(value, parsed, error)) {
        return false;
      }
      options.field_count = parsed;
      continue;
    }
    if (token == "--out") {
      if (!take_value(value)) {
        return false;
      }
      options.valid_output = std::string(value);
      continue;
    }
    if (token == "--err-out") {
      if (!take_value(value)) {
        return false;
      }
      options.invalid_output = std::string(value);
      continue;
    }
    if (token == "-d" || token == "--delimiter") {
      if (!take_value(value)) {
        return false;
      }
      if (!csvio::ParseDelimiter(value, options.dialect.delimiter, error)) {
        return false;
      }
      options.dialect.sniff_delimiter = false;
      continue;
    }
    if (token == "--quoting") {
      if (!take_value(value)) {
        return false;
      }
      if (!csvio::ParseQuoting(value, options.dialect.quoting, error)) {
        return false;
      }
      continue;
    }
    if (token == "--quotechar") {
      if (!take_value(value)) {
        return false;
      }
      if (value.size() != 1U) {
        error = "--quotechar must be a single character (got '" + std::string(value) + "')";
        return false;
      }
      options.dialect.quotechar = value.front();
      continue;
    }
    if (token == "--escapechar") {
      if (!take_value(value)) {
        return false;
      }
      if (value.size() != 1U) {
        error = "--escapechar must be a single character (got '" + std::string(value) + "')";
        return false;
      }
      options.dialect.escapechar = value.front();
      continue;
    }
    if (token == "--summary") {
      if (!take_value(value)) {
        return false;
      }
      options.summary_path = std::string(value);
      continue;
    }
    if (token == "--log-level") {
      if (!take_value(value)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (token.size() > 1U && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    inputs.emplace_back(token);
  }

  if (!inputs.empty()) {
    options.input_files = std::move(inputs);
  }

  std::size_t stdin_inputs = 0;
  for (const auto& input : options.input_files) {
    if (core::IsStdioPath(input)) {
      ++stdin_inputs;
    }
  }
  if (stdin_inputs > 1U) {
    error = "stdin ('-') may be named only once";
    return false;
  }
  if (options.dialect.delimiter == options.dialect.quotechar) {
    error = "delimiter and quotechar must differ";
    return false;
  }
  if (options.dialect.escapechar.has_value() &&
      (*options.dialect.escapechar == options.dialect.delimiter ||
       *options.dialect.escapechar == '\n' || *options.dialect.escapechar == '\r')) {
    error = "escapechar must differ from the delimiter and line breaks";
    return false;
  }
  return true;
}

// Finds `--config-fn` or `--config-name` so the file can be applied before the
// command-line options that override it.
bool FindConfigPath(const std::vector<std::string_view>& args, std::optional<fs::path>& path,
                    std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token != "--config-fn" && token != "--config-name") {
      continue;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    if (path.has_value()) {
      error = "--config-fn and --config-name may be given only once";
      return false;
    }
    const std::string_view value = args[++i];
    if (token == "--config-fn") {
      path = fs::path(value);
      continue;
    }
    fs::path resolved;
    if (!ResolveConfigName(value, resolved, error)) {
      return false;
    }
    path = std::move(resolved);
  }
  return true;
}

// Output stream that is either a process stdio stream or a file owned here.
class OutputTarget {
public:
  bool Open(const std::string& path, std::ostream& stdio_stream, std::string& error) {
    if (core::IsStdioPath(path)) {
      stream_ = &stdio_stream;
      return true;
    }
    if (!core::EnsureParentDirectory(path, error)) {
      return false;
    }
    file_ = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!(*file_)) {
      error = "unable to open output file: " + path;
      return false;
    }
    stream_ = file_.get();
    return true;
  }

  std::ostream& Stream() {
    return *stream_;
  }

  bool Finish(std::string& error) {
    stream_->flush();
    if (!(*stream_)) {
      error = "failed while flushing output";
      return false;
    }
    return true;
  }

private:
  std::unique_ptr<std::ofstream> file_;
  std::ostream* stream_ = nullptr;
};

struct RecordSinks {
  std::optional<csvio::RecordWriter> valid;
  std::optional<csvio::RecordWriter> invalid;
  bool header_written = false;
};

// Diagnostics are free text. Under quote_none without an escape character
// their delimiters and line breaks cannot be written, so they become spaces.
std::string WritableMessage(std::string message, const csvio::Dialect& dialect) {
  if (dialect.quoting != csvio::Quoting::kQuoteNone || dialect.escapechar.has_value()) {
    return message;
  }
  for (char& c : message) {
    if (c == dialect.delimiter || c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return message;
}

// Streams one input through the validator. Returns false on a fatal input
// failure (unreadable file, malformed quoting, write error).
bool ProcessInput(const std::string& input_name, const ValidateOptions& options,
                  records::RecordValidator& validator, RecordSinks& sinks,
                  ValidationTally& tally, core::logging::Logger& logger, std::string& error) {
  std::ifstream file;
  std::istream* input = &std::cin;
  if (!core::IsStdioPath(input_name)) {
    std::error_code ec;
    if (!fs::exists(input_name, ec) || ec) {
      error = "input file not found: " + input_name;
      return false;
    }
    file.open(input_name, std::ios::binary);
    if (!file) {
      error = "unable to open input file: " + input_name;
      return false;
    }
    input = &file;
  }

  csvio::RecordReader reader(*input, options.dialect);
  csvio::Record record;
  while (reader.Next(record, error)) {
    ++tally.records_read;
    const csvio::Dialect& dialect = reader.CurrentDialect();
    if (record.number == 1U) {
      logger.Debug("dialect resolved",
                   {{"delimiter", std::string(1, dialect.delimiter)},
                    {"quoting", csvio::ToString(dialect.quoting)},
                    {"has_header", dialect.has_header.value_or(false) ? "true" : "false"}});
      if (sinks.valid.has_value()) {
        sinks.valid->SetDialect(dialect);
      }
      if (sinks.invalid.has_value()) {
        sinks.invalid->SetDialect(dialect);
      }
    }

    const records::CheckResult result = validator.Evaluate(record.fields, record.is_header);
    if (record.is_header) {
      ++tally.header_records;
      if (sinks.valid.has_value() && !sinks.header_written) {
        if (!sinks.valid->Write(record.fields, error)) {
          return false;
        }
        sinks.header_written = true;
      }
      continue;
    }

    if (result) {
      if (sinks.valid.has_value() && !sinks.valid->Write(record.fields, error)) {
        return false;
      }
      ++tally.valid_records;
      continue;
    }

    logger.Debug("record rejected", {{"record", std::to_string(record.number)},
                                     {"reason", result.message}});
    if (sinks.invalid.has_value()) {
      std::vector<std::string> annotated = record.fields;
      if (options.append_errmsg) {
        annotated.push_back(WritableMessage(result.message, dialect));
      }
      if (!sinks.invalid->Write(annotated, error)) {
        return false;
      }
    }
    ++tally.invalid_records;
  }

  if (!error.empty()) {
    error = input_name + ": " + error;
    return false;
  }
  if (file.is_open() && file.bad()) {
    error = "failed while reading input file: " + input_name;
    return false;
  }
  return true;
}

void PrintStats(std::ostream& out, const ValidationTally& tally) {
  out << "input_cnt:   " << tally.records_read << '\n'
      << "header_cnt:  " << tally.header_records << '\n'
      << "invalid_cnt: " << tally.invalid_records << '\n'
      << "valid_cnt:   " << tally.valid_records << '\n';
}

int ExecuteValidationInternal(const ValidateOptions& options, ValidationTally& tally,
                              const core::Stopwatch& stopwatch, core::logging::Logger& logger) {
  logger.Info("validation requested",
              {{"inputs", std::to_string(options.input_files.size())},
               {"schema", options.schema_path.empty() ? "none" : options.schema_path},
               {"dry_run", options.dry_run ? "true" : "false"}});

  std::string error;
  std::optional<schema::Schema> loaded_schema;
  if (!options.schema_path.empty()) {
    schema::Schema parsed;
    if (!schema::LoadSchemaFile(options.schema_path, parsed, error)) {
      logger.Error("schema rejected", {{"schema", options.schema_path}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitConfigInvalid;
    }
    logger.Debug("schema loaded", {{"schema", options.schema_path},
                                   {"rules", std::to_string(parsed.items.size())}});
    loaded_schema = std::move(parsed);
  }

  records::RecordValidator validator(std::move(loaded_schema), options.field_count);

  OutputTarget valid_target;
  OutputTarget invalid_target;
  RecordSinks sinks;
  if (!options.dry_run) {
    if (!valid_target.Open(options.valid_output, std::cout, error) ||
        !invalid_target.Open(options.invalid_output, std::cerr, error)) {
      logger.Error("failed to open output", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    sinks.valid.emplace(valid_target.Stream(), options.dialect);
    sinks.invalid.emplace(invalid_target.Stream(), options.dialect);
  }

  for (const auto& input_name : options.input_files) {
    core::logging::ScopedInput scoped_input(logger, input_name);
    const bool processed =
        ProcessInput(input_name, options, validator, sinks, tally, logger, error);
    tally.field_count = validator.ExpectedFieldCount();
    if (!processed) {
      logger.Error("input processing failed", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }

  if (!options.dry_run &&
      (!valid_target.Finish(error) || !invalid_target.Finish(error))) {
    logger.Error("failed to flush output", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("validation complete", {{"records_read", std::to_string(tally.records_read)},
                                      {"valid", std::to_string(tally.valid_records)},
                                      {"invalid", std::to_string(tally.invalid_records)},
                                      {"elapsed_ms", std::to_string(stopwatch.ElapsedMillis())}});

  if (tally.records_read == 0U) {
    return kExitNoData;
  }
  if (tally.invalid_records > 0U) {
    return kExitInvalidData;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "rowguard 0.1.0\n";
  return kExitSuccess;
}

int CommandCheckSchema(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: check-schema requires exactly 1 argument: <schema>\n";
    return kExitUsage;
  }

  const std::string schema_path(args.front());
  schema::Schema parsed;
  std::string error;
  if (!schema::LoadSchemaFile(schema_path, parsed, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << schema_path << " (" << parsed.items.size() << " field rules)\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  ValidateOptions options;
  std::string error;
  std::optional<fs::path> config_path;
  if (!FindConfigPath(args, config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (config_path.has_value() && !ApplyConfigFile(*config_path, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (!ParseValidateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  ValidationTally tally;
  return ExecuteValidation(options, &tally);
}

} // namespace

int ExecuteValidation(const ValidateOptions& options, ValidationTally* tally) {
  core::logging::Logger logger(options.log_level);
  logger.SetEnabled(options.console_log);
  const core::Stopwatch stopwatch;
  ValidationTally local_tally;
  const int exit_code = ExecuteValidationInternal(options, local_tally, stopwatch, logger);

  // A rejected schema stops the run before any record is read.
  const bool reached_records = exit_code != kExitConfigInvalid;
  int final_exit_code = exit_code;
  if (reached_records && options.print_stats) {
    PrintStats(std::cerr, local_tally);
  }

  if (reached_records && !options.summary_path.empty()) {
    artifacts::ValidationSummary summary{
        .input_files = options.input_files,
        .records_read = local_tally.records_read,
        .valid_records = local_tally.valid_records,
        .invalid_records = local_tally.invalid_records,
        .header_records = local_tally.header_records,
        .field_count = local_tally.field_count,
        .schema = options.schema_path,
        .started_at = stopwatch.StartedAt(),
        .duration_ms = stopwatch.ElapsedMillis(),
        .exit_code = exit_code,
    };
    std::string error;
    if (!artifacts::WriteValidationSummaryJson(summary, options.summary_path, error)) {
      logger.Error("failed to write summary", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      final_exit_code = kExitFailure;
    } else {
      logger.Info("summary written", {{"path", options.summary_path}});
    }
  }

  if (tally != nullptr) {
    *tally = local_tally;
  }
  return final_exit_code;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "check-schema") {
    return CommandCheckSchema(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace rowguard::cli
