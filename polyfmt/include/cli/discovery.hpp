//! # File Discovery
//!
//! Expands a command-line pattern into the files to format.
//!
//! | Pattern | Result |
//! |---------|--------|
//! | Existing file | That file |
//! | Existing directory | Every recognized file below it |
//! | Anything else | Glob over the working directory (`*`, `?`, `[...]`, `**`) |
//!
//! Walks never enter `.git`, `.hg`, `.svn` or `node_modules`, keep only files
//! whose type `detect_file_type` recognizes, and return paths sorted. They
//! honor `.gitignore` and `.ignore` files (see `cli/ignore.hpp`) unless told
//! otherwise. Entries that cannot be read, such as directories without
//! permission, are skipped with a debug log line.

#ifndef POLYFMT_CLI_DISCOVERY_HPP
#define POLYFMT_CLI_DISCOVERY_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace polyfmt::cli {

inline constexpr const char* DEFAULT_PATTERN = "**/*";

/// Matches a `/`-separated relative path against a glob.
///
/// `*` and `?` never cross a `/`; a `**` segment matches any number of
/// segments, none included. Returns an error for an unterminated `[`.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view path)
    -> Result<bool, std::string>;

/// True for directory names a walk never descends into.
[[nodiscard]] auto is_skipped_dir(std::string_view name) -> bool;

/// Expands `pattern`, resolving globs relative to `root`. A file named
/// literally is returned even when an ignore file covers it.
[[nodiscard]] auto discover_files(std::string_view pattern, const fs::path& root = ".",
                                  bool use_ignore_files = true)
    -> Result<std::vector<fs::path>, std::string>;

} // namespace polyfmt::cli

#endif // POLYFMT_CLI_DISCOVERY_HPP
