#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rowguard::artifacts {

// Machine-readable outcome of one `rowguard validate` invocation.
struct ValidationSummary {
  std::vector<std::string> input_files;
  std::uint64_t records_read = 0;
  std::uint64_t valid_records = 0;
  std::uint64_t invalid_records = 0;
  std::uint64_t header_records = 0;
  // Unset when no record was read and no count was configured.
  std::optional<std::uint64_t> field_count;
  // Schema path as given on the command line; empty when none.
  std::string schema;
  std::chrono::system_clock::time_point started_at;
  std::int64_t duration_ms = 0;
  int exit_code = 0;
};

std::string ToJson(const ValidationSummary& summary);

// Emits the summary as a single JSON object.
//
// Contract:
// - Creates parent directories of `output_path` when missing.
// - Publishes the file atomically (temp file + rename).
// - Returns false and sets `error` on failure.
bool WriteValidationSummaryJson(const ValidationSummary& summary,
                                const std::filesystem::path& output_path, std::string& error);

} // namespace rowguard::artifacts
