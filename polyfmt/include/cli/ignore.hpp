//! # Ignore Files
//!
//! The subset of gitignore semantics discovery honors while walking.
//!
//! | Source | Applies |
//! |--------|---------|
//! | `.ignore` in a walked directory | Always |
//! | `.gitignore` in a walked directory | Inside a git work tree |
//! | `.git/info/exclude` | Inside a git work tree, lowest priority |
//!
//! Ignore files in the directories between the work tree root and the walk
//! root are loaded too. Deeper files take precedence over shallower ones, and
//! inside one file the last matching line decides.
//!
//! ## Pattern Syntax
//!
//! | Line | Meaning |
//! |------|---------|
//! | `# text`, blank | Skipped |
//! | `!pattern` | Re-includes what an earlier pattern ignored |
//! | `pattern/` | Matches directories only |
//! | `/pattern`, `a/b` | Anchored to the ignore file's directory |
//! | `name` | Matches an entry with that name at any depth |
//!
//! Patterns use the discovery glob syntax (`*`, `?`, `[...]`, `**`).
//! A directory that is ignored is never entered, so nothing below it can be
//! re-included.

#ifndef POLYFMT_CLI_IGNORE_HPP
#define POLYFMT_CLI_IGNORE_HPP

#include "cli/discovery.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::cli {

enum class IgnoreMatch : uint8_t { None, Ignored, Included };

struct IgnoreRule {
    std::string pattern;
    bool negated = false;
    bool dir_only = false;
    bool anchored = false;
};

/// The rules of one ignore file, matched relative to its directory.
class IgnoreFile {
public:
    IgnoreFile(fs::path base, std::vector<IgnoreRule> rules)
        : base_(std::move(base)), rules_(std::move(rules)) {}

    /// Parses ignore file text. A line whose glob is malformed never matches.
    [[nodiscard]] static auto parse(const fs::path& base, std::string_view text) -> IgnoreFile;

    /// Reads `file`, matching relative to `base`; `std::nullopt` when the
    /// file does not exist or cannot be read.
    [[nodiscard]] static auto load(const fs::path& file, const fs::path& base)
        -> std::optional<IgnoreFile>;

    /// `relative` is `/`-separated and relative to `base()`.
    [[nodiscard]] auto match(std::string_view relative, bool is_dir) const -> IgnoreMatch;

    [[nodiscard]] auto base() const -> const fs::path& { return base_; }
    [[nodiscard]] auto rules() const -> const std::vector<IgnoreRule>& { return rules_; }

private:
    fs::path base_;
    std::vector<IgnoreRule> rules_;
};

/// Ignore files in effect at one point of a walk, shallowest first.
class IgnoreStack {
public:
    /// Rules for a walk starting at `root`: the work tree's exclude file and
    /// every ignore file from the work tree root down to `root`'s parent.
    [[nodiscard]] static auto for_walk_root(const fs::path& root) -> IgnoreStack;

    /// Loads the ignore files of `dir`; returns how many were pushed.
    auto push_dir(const fs::path& dir) -> size_t;
    void pop(size_t count);

    /// True when `path` (absolute) is ignored.
    [[nodiscard]] auto is_ignored(const fs::path& path, bool is_dir) const -> bool;

    [[nodiscard]] auto in_git_repo() const -> bool { return in_git_repo_; }
    [[nodiscard]] auto depth() const -> size_t { return files_.size(); }

private:
    bool in_git_repo_ = false;
    std::vector<IgnoreFile> files_;
};

/// `path` made absolute and lexically normal, without a trailing separator.
[[nodiscard]] auto normalized_absolute(const fs::path& path) -> fs::path;

/// The directory holding `.git` at or above `dir` (absolute).
[[nodiscard]] auto find_work_tree_root(const fs::path& dir) -> std::optional<fs::path>;

} // namespace polyfmt::cli

#endif // POLYFMT_CLI_IGNORE_HPP
