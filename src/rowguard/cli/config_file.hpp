#pragma once

#include "rowguard/cli/router.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace rowguard::cli {

// Resolves `--config-name` to `$XDG_CONFIG_HOME/rowguard/<name>`, falling back
// to `$HOME/.config/rowguard/<name>`. A name without an extension gets ".yml".
bool ResolveConfigName(std::string_view name, std::filesystem::path& path, std::string& error);

// Applies a YAML or JSON config mapping onto `options`.
//
// Contract:
// - Keys mirror the long `validate` options; '-' and '_' are interchangeable
//   (`err-out` and `err_out` are the same key). `infiles` names the inputs
//   and `verbosity` is an alias of `log-level`.
// - A null value leaves the current setting alone, except `has_header: null`
//   and `escapechar: null`, which select header sniffing and no escaping.
// - Unknown keys and values of the wrong type are errors naming the key.
bool ApplyConfigFile(const std::filesystem::path& path, ValidateOptions& options,
                     std::string& error);

} // namespace rowguard::cli
