#pragma once

namespace rowguard::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure (I/O, unreadable input)
// - 2 usage/argument failure
//
// The data outcomes reuse the errno numbers older tooling in this space
// reported (ENODATA, EBADMSG) so wrappers written against them keep working.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kNoData = 61,
  kInvalidData = 74,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace rowguard::core::errors
