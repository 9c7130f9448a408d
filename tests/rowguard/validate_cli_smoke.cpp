#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using rowguard::tests::common::AssertContains;
using rowguard::tests::common::AssertExitCode;
using rowguard::tests::common::AssertNotContains;
using rowguard::tests::common::DispatchCaptured;
using rowguard::tests::common::Fail;
using rowguard::tests::common::ReadFileToString;
using rowguard::tests::common::WriteStringToFile;

int main() {
  const fs::path temp_root = rowguard::tests::common::CreateUniqueTempDir("rowguard-validate-smoke");
  const fs::path schema_path = temp_root / "people.yml";
  const fs::path bad_schema_path = temp_root / "bad.yml";
  const fs::path good_csv = temp_root / "good.csv";
  const fs::path mixed_csv = temp_root / "mixed.csv";
  const fs::path second_csv = temp_root / "second.csv";
  const fs::path empty_csv = temp_root / "empty.csv";

  WriteStringToFile(schema_path, R"(items:
  - title: id
    numericKind: integer
    numericMinimum: 1
  - title: name
    minLength: 1
  - title: age
    numericKind: integer
    numericMinimum: 0
    numericMaximum: 150
)");
  WriteStringToFile(bad_schema_path, "items:\n  - {title: age, minimum: 0}\n");
  WriteStringToFile(good_csv, "id,name,age\n1,Ann,34\n2,Bob,51\n");
  WriteStringToFile(mixed_csv, "id,name,age\n1,Ann,34\n2,Bob,-5\n3,Cy\n4,Dee,abc\n");
  WriteStringToFile(second_csv, "id,name,age\n5,Eve,20\n");
  WriteStringToFile(empty_csv, "");

  // All records valid.
  {
    const fs::path out_path = temp_root / "good.valid.csv";
    const fs::path err_path = temp_root / "good.invalid.csv";
    const auto run = DispatchCaptured({"rowguard", "validate", good_csv.string(), "--schema",
                                       schema_path.string(), "--has-header", "--out",
                                       out_path.string(), "--err-out", err_path.string()});
    AssertExitCode(run.exit_code, 0, "all-valid input");
    if (ReadFileToString(out_path) != "id,name,age\n1,Ann,34\n2,Bob,51\n") {
      Fail("valid output should hold the header and both records");
    }
    if (!ReadFileToString(err_path).empty()) {
      Fail("invalid output should be empty");
    }
    AssertContains(run.stderr_text, "valid_cnt:   2");
    AssertContains(run.stderr_text, "invalid_cnt: 0");
    AssertContains(run.stderr_text, "header_cnt:  1");
  }

  // Mixed input with annotated rejects and a summary artifact.
  {
    const fs::path out_path = temp_root / "mixed.valid.csv";
    const fs::path err_path = temp_root / "mixed.invalid.csv";
    const fs::path summary_path = temp_root / "reports" / "summary.json";
    const auto run = DispatchCaptured(
        {"rowguard", "validate", mixed_csv.string(), "--schema", schema_path.string(),
         "--has-header", "--errmsg", "--out", out_path.string(), "--err-out", err_path.string(),
         "--summary", summary_path.string()});
    AssertExitCode(run.exit_code, 74, "mixed input");

    const std::string valid = ReadFileToString(out_path);
    AssertContains(valid, "1,Ann,34\n");
    AssertNotContains(valid, "Bob");

    const std::string invalid = ReadFileToString(err_path);
    AssertContains(invalid, "2,Bob,-5,");
    AssertContains(invalid, "numericMinimum");
    AssertContains(invalid, "3,Cy,bad field count - should be 3 but is: 2\n");
    AssertContains(invalid, "4,Dee,abc,");
    AssertContains(invalid, "numericKind:integer");

    const std::string summary = ReadFileToString(summary_path);
    AssertContains(summary, "\"records_read\":5");
    AssertContains(summary, "\"valid_records\":1");
    AssertContains(summary, "\"invalid_records\":3");
    AssertContains(summary, "\"field_count\":3");
    AssertContains(summary, "\"exit_code\":74");
  }

  // Several inputs form one stream; the header is written once.
  {
    const fs::path out_path = temp_root / "multi.valid.csv";
    const auto run = DispatchCaptured({"rowguard", "validate", good_csv.string(),
                                       second_csv.string(), "--has-header", "--no-stats",
                                       "--out", out_path.string()});
    AssertExitCode(run.exit_code, 0, "multi-file input");
    if (ReadFileToString(out_path) != "id,name,age\n1,Ann,34\n2,Bob,51\n5,Eve,20\n") {
      Fail("multi-file output should hold one header and every record");
    }
    AssertNotContains(run.stderr_text, "valid_cnt");
  }

  // No records at all.
  {
    const auto run = DispatchCaptured({"rowguard", "validate", empty_csv.string(), "--out",
                                       (temp_root / "empty.out").string()});
    AssertExitCode(run.exit_code, 61, "empty input");
    AssertContains(run.stderr_text, "input_cnt:   0");
  }

  // A rejected schema stops the run before any output exists.
  {
    const fs::path out_path = temp_root / "never.csv";
    const auto run = DispatchCaptured({"rowguard", "validate", good_csv.string(), "--schema",
                                       bad_schema_path.string(), "--out", out_path.string()});
    AssertExitCode(run.exit_code, 10, "invalid schema");
    AssertContains(run.stderr_text, "unsupported key 'minimum'");
    AssertNotContains(run.stderr_text, "input_cnt");
    if (fs::exists(out_path)) {
      Fail("no output should be written when the schema is rejected");
    }
  }

  // Dry runs validate but write nothing.
  {
    const fs::path out_path = temp_root / "dry.csv";
    const auto run = DispatchCaptured({"rowguard", "validate", mixed_csv.string(), "--schema",
                                       schema_path.string(), "--has-header", "--dry-run", "--out",
                                       out_path.string()});
    AssertExitCode(run.exit_code, 74, "dry run");
    AssertContains(run.stderr_text, "invalid_cnt: 3");
    if (fs::exists(out_path)) {
      Fail("dry run should not create outputs");
    }
  }

  // Explicit field count and delimiter.
  {
    const fs::path pipe_csv = temp_root / "pipe.txt";
    WriteStringToFile(pipe_csv, "a|b\nc|d|e\n");
    const auto run = DispatchCaptured({"rowguard", "validate", pipe_csv.string(), "-d", "|",
                                       "--field-count", "3", "--errmsg", "--out",
                                       (temp_root / "pipe.out").string()});
    AssertExitCode(run.exit_code, 74, "explicit field count");
    AssertContains(run.stderr_text, "a|b|bad field count - should be 3 but is: 2\n");
  }

  // Debug logging tags lines with the input being read.
  {
    const auto run = DispatchCaptured({"rowguard", "validate", mixed_csv.string(), "--schema",
                                       schema_path.string(), "--has-header", "--log-level",
                                       "debug", "--out", (temp_root / "log.out").string(),
                                       "--err-out", (temp_root / "log.err").string()});
    AssertExitCode(run.exit_code, 74, "debug logging");
    AssertContains(run.stderr_text, "level=DEBUG");
    AssertContains(run.stderr_text, "input=\"" + mixed_csv.string() + "\"");
    AssertContains(run.stderr_text, "msg=\"record rejected\"");
    AssertContains(run.stderr_text, "msg=\"schema loaded\"");
  }

  // Without a header flag the header is sniffed.
  {
    const fs::path out_path = temp_root / "sniffed.valid.csv";
    const auto run = DispatchCaptured({"rowguard", "validate", good_csv.string(), "--schema",
                                       schema_path.string(), "--out", out_path.string()});
    AssertExitCode(run.exit_code, 0, "sniffed header");
    if (ReadFileToString(out_path) != "id,name,age\n1,Ann,34\n2,Bob,51\n") {
      Fail("sniffed header should be written once and skip schema checks");
    }
    AssertContains(run.stderr_text, "header_cnt:  1");
  }

  // quote_none keeps quote characters as text and never stops the stream.
  {
    const fs::path quoted_csv = temp_root / "quote_none.csv";
    const fs::path out_path = temp_root / "quote_none.valid.csv";
    WriteStringToFile(quoted_csv, "a,1\nsay \"hi\",2\nb,3\n");
    const auto run = DispatchCaptured({"rowguard", "validate", quoted_csv.string(), "--quoting",
                                       "quote_none", "-d", ",", "--no-header", "--out",
                                       out_path.string()});
    AssertExitCode(run.exit_code, 0, "quote_none input with quote characters");
    if (ReadFileToString(out_path) != "a,1\nsay \"hi\",2\nb,3\n") {
      Fail("quote_none output should reproduce every record");
    }
    AssertContains(run.stderr_text, "valid_cnt:   3");
    AssertNotContains(run.stderr_text, "error:");
  }

  // Appended diagnostics stay one field when they cannot be escaped.
  {
    const fs::path colon_txt = temp_root / "colon.txt";
    const fs::path err_path = temp_root / "colon.invalid.txt";
    WriteStringToFile(colon_txt, "a:1\nb:2:3\nc:4\n");
    const auto run = DispatchCaptured({"rowguard", "validate", colon_txt.string(), "--quoting",
                                       "quote_none", "-d", ":", "--field-count", "2", "--errmsg",
                                       "--out", (temp_root / "colon.valid.txt").string(),
                                       "--err-out", err_path.string()});
    AssertExitCode(run.exit_code, 74, "quote_none errmsg");
    if (ReadFileToString(err_path) != "b:2:3:bad field count - should be 2 but is  3\n") {
      Fail("diagnostic should be appended with the delimiter blanked out");
    }
    AssertContains(run.stderr_text, "valid_cnt:   2");
    AssertContains(run.stderr_text, "invalid_cnt: 1");
  }

  // An escape character lets quote_none records carry the delimiter.
  {
    const fs::path escaped_csv = temp_root / "escaped.csv";
    const fs::path out_path = temp_root / "escaped.valid.csv";
    WriteStringToFile(escaped_csv, "a\\,b,1\nc,2\n");
    const auto run = DispatchCaptured({"rowguard", "validate", escaped_csv.string(), "--quoting",
                                       "quote_none", "--escapechar", "\\", "-d", ",",
                                       "--no-header", "--no-stats", "--out", out_path.string()});
    AssertExitCode(run.exit_code, 0, "escaped delimiter");
    if (ReadFileToString(out_path) != "a\\,b,1\nc,2\n") {
      Fail("escaped delimiter should survive the round trip");
    }
  }

  // Config files supply options; the command line overrides them.
  {
    const fs::path config_path = temp_root / "run.yml";
    const fs::path out_path = temp_root / "config.valid.csv";
    WriteStringToFile(config_path, "schema: " + schema_path.string() +
                                       "\nhas_header: true\nstats: false\nquoting: quote_all\n"
                                       "out: " + out_path.string() + "\n");
    const auto run = DispatchCaptured({"rowguard", "validate", good_csv.string(), "--config-fn",
                                       config_path.string(), "--stats", "--quoting",
                                       "quote_minimal"});
    AssertExitCode(run.exit_code, 0, "config file run");
    if (ReadFileToString(out_path) != "id,name,age\n1,Ann,34\n2,Bob,51\n") {
      Fail("config file should select the output and the command line the quoting");
    }
    AssertContains(run.stderr_text, "valid_cnt:   2");

    const fs::path bad_config = temp_root / "bad_run.yml";
    WriteStringToFile(bad_config, "colour: red\n");
    const auto rejected = DispatchCaptured({"rowguard", "validate", good_csv.string(),
                                            "--config-fn", bad_config.string()});
    AssertExitCode(rejected.exit_code, 10, "invalid config file");
    AssertContains(rejected.stderr_text, "unknown key 'colour'");
    AssertExitCode(DispatchCaptured({"rowguard", "validate", "--config-fn"}).exit_code, 2,
                   "missing config path");
  }

  // Console logging can be switched off without hiding stats.
  {
    const auto run = DispatchCaptured({"rowguard", "validate", mixed_csv.string(), "--schema",
                                       schema_path.string(), "--has-header", "--log-level",
                                       "debug", "--no-console-log", "--out",
                                       (temp_root / "quiet.out").string(), "--err-out",
                                       (temp_root / "quiet.err").string()});
    AssertExitCode(run.exit_code, 74, "console log off");
    AssertNotContains(run.stderr_text, "level=");
    AssertContains(run.stderr_text, "invalid_cnt: 3");
  }

  // Usage errors.
  {
    AssertExitCode(DispatchCaptured({"rowguard", "validate", "--bogus"}).exit_code, 2,
                   "unknown option");
    AssertExitCode(DispatchCaptured({"rowguard", "validate", "--field-count", "zero"}).exit_code,
                   2, "bad field count");
    AssertExitCode(DispatchCaptured({"rowguard", "validate", "--quoting", "never"}).exit_code, 2,
                   "bad quoting");
    AssertExitCode(DispatchCaptured({"rowguard", "validate", "--log-level"}).exit_code, 2,
                   "missing log level");
  }

  // Unreadable input is a runtime failure.
  {
    const auto run = DispatchCaptured({"rowguard", "validate",
                                       (temp_root / "missing.csv").string(), "--out",
                                       (temp_root / "missing.out").string()});
    AssertExitCode(run.exit_code, 1, "missing input");
    AssertContains(run.stderr_text, "input file not found");
  }

  rowguard::tests::common::RemovePathBestEffort(temp_root);
  std::cout << "validate_cli_smoke: ok\n";
  return 0;
}
