//! # Git File Sources
//!
//! `--staged` and `--changed` replace pattern discovery with the files git
//! reports as added, copied or modified:
//!
//! | Set | Command |
//! |-----|---------|
//! | `Staged` | `git diff --cached --name-only --diff-filter=ACM` |
//! | `Changed` | `git diff --name-only --diff-filter=ACM` |
//!
//! Only regular files whose type is recognized are kept. Paths are absolute,
//! sorted, and resolved against the work tree root.

#ifndef POLYFMT_CLI_GIT_FILES_HPP
#define POLYFMT_CLI_GIT_FILES_HPP

#include "cli/discovery.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::cli {

enum class GitFileSet : uint8_t { Staged, Changed };

[[nodiscard]] auto git_file_set_flag(GitFileSet set) -> std::string_view;

/// Lists the files in `set` for the work tree containing `dir`.
///
/// Fails when git cannot be run or `dir` is not inside a work tree.
[[nodiscard]] auto git_files(GitFileSet set, const fs::path& dir = ".")
    -> Result<std::vector<fs::path>, std::string>;

} // namespace polyfmt::cli

#endif // POLYFMT_CLI_GIT_FILES_HPP
