//! # Format Command Implementation
//!
//! ## Process
//!
//! 1. Resolve `polyfmt.json` (or `--config`)
//! 2. Expand every pattern, dropping duplicates, or ask git for the
//!    `--staged` / `--changed` file set
//! 3. Build the dispatcher over the in-process, foreign and sandboxed backends
//! 4. Run the batch executor and print failures and the summary

#include "cli/cmd_format.hpp"

#include "batch/batch_executor.hpp"
#include "cli/discovery.hpp"
#include "cli/git_files.hpp"
#include "config/format_config.hpp"
#include "dispatch/dispatcher.hpp"
#include "ffi/foreign_bridge.hpp"
#include "log/log.hpp"
#include "sandbox/sandbox_host.hpp"

#include <charconv>
#include <iostream>
#include <set>

namespace polyfmt::cli {

namespace {

constexpr const char* SANDBOX_MODULE = "clang-format";

auto is_log_flag(const std::string& arg) -> bool {
    if (arg.starts_with("--log-") || arg == "--verbose") {
        return true;
    }
    return arg.size() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           arg.find_first_not_of('v', 1) == std::string::npos;
}

auto parse_jobs(std::string_view text) -> Result<size_t, std::string> {
    size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value == 0) {
        return "invalid --jobs value '" + std::string(text) + "'";
    }
    return value;
}

} // namespace

auto parse_format_args(int argc, char* argv[]) -> Result<FormatCommandOptions, std::string> {
    FormatCommandOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--check" || arg == "-c") {
            options.check = true;
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.version = true;
        } else if (arg == "--no-ignore") {
            options.no_ignore = true;
        } else if (arg == "--staged" || arg == "--changed") {
            GitFileSet set = arg == "--staged" ? GitFileSet::Staged : GitFileSet::Changed;
            if (options.git_files && *options.git_files != set) {
                return std::string("--staged and --changed cannot be combined");
            }
            options.git_files = set;
        } else if (arg.starts_with("--jobs=")) {
            auto jobs = parse_jobs(std::string_view(arg).substr(7));
            if (is_err(jobs)) {
                return unwrap_err(jobs);
            }
            options.jobs = unwrap(jobs);
        } else if (arg.starts_with("--config=")) {
            options.config_path = arg.substr(9);
        } else if (arg.starts_with("--backend-dir=")) {
            options.backend_dirs.emplace_back(arg.substr(14));
        } else if (is_log_flag(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            return "unknown option '" + arg + "'";
        } else {
            options.patterns.push_back(arg);
        }
    }

    if (options.git_files && !options.patterns.empty()) {
        return std::string(git_file_set_flag(*options.git_files)) +
               " cannot be combined with file patterns";
    }
    if (options.patterns.empty() && !options.git_files) {
        options.patterns.emplace_back(DEFAULT_PATTERN);
    }
    return options;
}

void print_usage(std::ostream& out) {
    out << "Usage: polyfmt [pattern...] [options]\n"
        << "\n"
        << "Patterns: a glob (default **/*), a directory or a single file.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --check           Report files that would change, write nothing\n"
        << "  -q, --quiet           Only print errors\n"
        << "  -d, --debug           Print every file with its outcome to stderr\n"
        << "  --staged              Format the files staged in git\n"
        << "  --changed             Format the files changed in the git work tree\n"
        << "  --no-ignore           Do not skip files matched by .gitignore or .ignore\n"
        << "  --jobs=N              Number of workers (default: hardware threads)\n"
        << "  --config=FILE         Configuration file (default: ./polyfmt.json)\n"
        << "  --backend-dir=DIR     Extra directory for backend libraries and modules\n"
        << "  --log-level=LEVEL     trace, debug, info, warn, error, off\n"
        << "  --log-filter=SPEC     Per-module levels, e.g. ffi=debug,*=warn\n"
        << "  --log-file=FILE       Also write logs to FILE\n"
        << "  --log-format=FORMAT   text or json\n"
        << "  -v, -vv, -vvv         Raise log verbosity\n"
        << "  -V, --version         Print the version\n"
        << "  -h, --help            Show this help\n";
}

auto run_format(const FormatCommandOptions& options, std::ostream& out, std::ostream& err) -> int {
    auto config = config::resolve_format_config(options.config_path);
    if (is_err(config)) {
        err << "Error: " << unwrap_err(config) << "\n";
        return EXIT_USAGE;
    }

    std::vector<fs::path> files;
    if (options.git_files) {
        auto listed = git_files(*options.git_files);
        if (is_err(listed)) {
            err << "Error: " << unwrap_err(listed) << "\n";
            return EXIT_USAGE;
        }
        files = std::move(unwrap(listed));
        if (files.empty()) {
            if (!options.quiet) {
                out << "No files to format\n";
            }
            return 0;
        }
    }

    std::set<fs::path> seen;
    for (const auto& pattern : options.patterns) {
        auto found = discover_files(pattern, ".", !options.no_ignore);
        if (is_err(found)) {
            err << "Error: failed to discover files: " << unwrap_err(found) << "\n";
            return EXIT_USAGE;
        }
        if (unwrap(found).empty() && !options.quiet) {
            err << "Warning: pattern '" << pattern << "' matched 0 files\n";
        }
        for (auto& path : unwrap(found)) {
            if (seen.insert(path).second) {
                files.push_back(std::move(path));
            }
        }
    }
    POLYFMT_LOG_INFO("cli", files.size() << " files discovered");

    const size_t jobs = batch::effective_jobs(options.jobs);
    ffi::ForeignBridge bridge(options.backend_dirs);
    sandbox::SandboxHost host(SANDBOX_MODULE, jobs, options.backend_dirs);
    dispatch::Dispatcher dispatcher;
    dispatcher.register_default_backends(bridge, host);

    batch::BatchOptions batch_options;
    batch_options.jobs = jobs;
    batch_options.check = options.check;
    if (options.debug) {
        batch_options.observer = [&err](const fs::path& path, const dispatch::FormatOutcome& outcome) {
            err << path.string() << ": " << dispatch::outcome_kind_name(outcome.kind) << "\n";
        };
    }

    batch::BatchExecutor executor(dispatcher, std::move(batch_options));
    auto stats = executor.run(files, unwrap(config));

    for (const auto& failure : stats.failures) {
        err << "Error: " << failure.path.string() << ": " << failure.error.to_string() << "\n";
    }

    if (!options.quiet) {
        if (options.check) {
            out << stats.formatted << " files need formatting, " << stats.unchanged
                << " unchanged, " << stats.failed << " errors\n";
        } else {
            out << "Formatted " << stats.formatted << " files, " << stats.unchanged
                << " unchanged, " << stats.failed << " errors\n";
        }
    }

    if (stats.failed > 0 || (options.check && stats.formatted > 0)) {
        return 1;
    }
    return 0;
}

} // namespace polyfmt::cli
