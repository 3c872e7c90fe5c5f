//! # Format Command
//!
//! ```bash
//! polyfmt                      # format every recognized file below .
//! polyfmt src/                 # format a directory
//! polyfmt "**/*.ts" --check    # report files that would change
//! polyfmt --jobs=4 --debug     # bounded workers, per-file outcomes on stderr
//! polyfmt --staged             # only files staged in git
//! ```
//!
//! Logging flags (`--log-level`, `-v`, ...) are consumed by
//! `log::parse_log_options` and skipped here.

#ifndef POLYFMT_CLI_CMD_FORMAT_HPP
#define POLYFMT_CLI_CMD_FORMAT_HPP

#include "cli/git_files.hpp"
#include "common.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace polyfmt::cli {

/// Exit status for errors reported before any file is processed.
inline constexpr int EXIT_USAGE = 2;

struct FormatCommandOptions {
    std::vector<std::string> patterns;
    bool check = false;
    bool quiet = false;
    bool debug = false;
    bool help = false;
    bool version = false;
    /// Discovery disregards `.gitignore` and `.ignore` files when set.
    bool no_ignore = false;
    /// Replaces pattern discovery with a git file set.
    std::optional<GitFileSet> git_files;
    size_t jobs = 0;
    std::string config_path;
    std::vector<std::filesystem::path> backend_dirs;
};

[[nodiscard]] auto parse_format_args(int argc, char* argv[])
    -> Result<FormatCommandOptions, std::string>;

void print_usage(std::ostream& out);

/// Runs one formatting pass. Summary goes to `out`, errors and `--debug`
/// lines to `err`.
auto run_format(const FormatCommandOptions& options, std::ostream& out, std::ostream& err) -> int;

} // namespace polyfmt::cli

#endif // POLYFMT_CLI_CMD_FORMAT_HPP
