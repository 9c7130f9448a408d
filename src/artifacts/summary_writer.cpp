#include "artifacts/summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace rowguard::artifacts {

std::string ToJson(const ValidationSummary& summary) {
  std::ostringstream out;
  out << "{\n"
      << "  \"started_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(summary.started_at))
      << ",\n"
      << "  \"duration_ms\":" << summary.duration_ms << ",\n"
      << "  \"input_files\":" << core::ToJsonStringArray(summary.input_files) << ",\n"
      << "  \"records_read\":" << summary.records_read << ",\n"
      << "  \"valid_records\":" << summary.valid_records << ",\n"
      << "  \"invalid_records\":" << summary.invalid_records << ",\n"
      << "  \"header_records\":" << summary.header_records << ",\n"
      << "  \"field_count\":";
  if (summary.field_count.has_value()) {
    out << summary.field_count.value();
  } else {
    out << "null";
  }
  out << ",\n"
      << "  \"schema\":";
  if (summary.schema.empty()) {
    out << "null";
  } else {
    out << core::QuoteJson(summary.schema);
  }
  out << ",\n"
      << "  \"exit_code\":" << summary.exit_code << "\n"
      << "}\n";
  return out.str();
}

bool WriteValidationSummaryJson(const ValidationSummary& summary,
                                const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "summary path cannot be empty";
    return false;
  }
  if (!core::WriteTextFileAtomic(output_path, ToJson(summary), error)) {
    error = "unable to write summary: " + error;
    return false;
  }
  return true;
}

} // namespace rowguard::artifacts
