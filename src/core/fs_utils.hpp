#ifndef ROWGUARD_CORE_FS_UTILS_HPP_
#define ROWGUARD_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace rowguard::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// "-" names stdin for inputs and stdout/stderr for outputs.
inline bool IsStdioPath(std::string_view path) {
  return path.empty() || path == "-";
}

// Reads a whole file as bytes. Missing, unreadable and non-regular paths are
// reported separately so users can tell a typo from a permissions problem.
inline bool ReadTextFile(const std::filesystem::path& input_path, std::string& text,
                         std::string& error) {
  std::error_code ec;
  if (!std::filesystem::exists(input_path, ec) || ec) {
    error = "file not found: " + input_path.string();
    return false;
  }
  if (!std::filesystem::is_regular_file(input_path, ec) || ec) {
    error = "path must point to a regular file: " + input_path.string();
    return false;
  }

  std::ifstream input(input_path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + input_path.string();
    return false;
  }

  text.assign((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// A remove+rename fallback covers filesystems that refuse rename-overwrite.
// Partially written content is never published under `output_path`.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace rowguard::core

#endif // ROWGUARD_CORE_FS_UTILS_HPP_
