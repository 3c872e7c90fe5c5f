#include "cli/discovery.hpp"

#include "cli/ignore.hpp"
#include "log/log.hpp"
#include "registry/file_type.hpp"

#include <algorithm>
#include <array>
#include <functional>
#include <optional>

namespace polyfmt::cli {

namespace {

constexpr std::array<std::string_view, 4> SKIPPED_DIRS = {".git", ".hg", ".svn", "node_modules"};

auto split_segments(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        auto segment = path.substr(start, slash - start);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = slash + 1;
    }
    return segments;
}

/// Matches `[...]` at the start of `pattern`; returns the class length or 0
/// when the class is unterminated.
auto match_class(std::string_view pattern, char c, bool& matched) -> size_t {
    size_t i = 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }
    bool found = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            if (c >= pattern[i] && c <= pattern[i + 2]) {
                found = true;
            }
            i += 3;
        } else {
            if (c == pattern[i]) {
                found = true;
            }
            ++i;
        }
    }
    if (i >= pattern.size()) {
        return 0;
    }
    matched = found != negate;
    return i + 1;
}

auto match_segment(std::string_view pattern, std::string_view name) -> Result<bool, std::string> {
    size_t p = 0;
    size_t n = 0;
    size_t star_p = std::string_view::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_n = n;
            continue;
        }
        bool advanced = false;
        if (p < pattern.size()) {
            if (pattern[p] == '?') {
                advanced = true;
                ++p;
            } else if (pattern[p] == '[') {
                bool matched = false;
                size_t len = match_class(pattern.substr(p), name[n], matched);
                if (len == 0) {
                    return std::string("unterminated '[' in glob");
                }
                if (matched) {
                    advanced = true;
                    p += len;
                }
            } else if (pattern[p] == name[n]) {
                advanced = true;
                ++p;
            }
        }
        if (advanced) {
            ++n;
            continue;
        }
        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p + 1;
        n = ++star_n;
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

auto match_segments(const std::vector<std::string_view>& pattern, size_t i,
                    const std::vector<std::string_view>& path, size_t j)
    -> Result<bool, std::string> {
    if (i == pattern.size()) {
        return j == path.size();
    }
    if (pattern[i] == "**") {
        for (size_t k = j; k <= path.size(); ++k) {
            auto rest = match_segments(pattern, i + 1, path, k);
            if (is_err(rest) || unwrap(rest)) {
                return rest;
            }
        }
        return false;
    }
    if (j == path.size()) {
        return false;
    }
    auto head = match_segment(pattern[i], path[j]);
    if (is_err(head) || !unwrap(head)) {
        return head;
    }
    return match_segments(pattern, i + 1, path, j + 1);
}

auto is_recognized(const fs::path& path) -> bool {
    return registry::detect_file_type(path.generic_string()) != registry::FileType::Unknown;
}

using PathFilter = std::function<Result<bool, std::string>(const std::string&)>;

/// Depth-first walk collecting recognized files. Entries that cannot be
/// read are skipped; only a malformed glob stops the walk.
class Walker {
public:
    Walker(const fs::path& root, PathFilter keep, bool use_ignore_files)
        : root_(root), abs_root_(normalized_absolute(root)), keep_(std::move(keep)),
          use_ignore_files_(use_ignore_files) {
        if (use_ignore_files_) {
            ignores_ = IgnoreStack::for_walk_root(abs_root_);
        }
    }

    auto run() -> Result<std::vector<fs::path>, std::string> {
        if (auto failed = visit_dir(abs_root_)) {
            return *failed;
        }
        std::sort(files_.begin(), files_.end());
        return std::move(files_);
    }

private:
    auto visit_dir(const fs::path& dir) -> std::optional<std::string> {
        const size_t pushed = use_ignore_files_ ? ignores_.push_dir(dir) : 0;

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            POLYFMT_LOG_DEBUG("cli", "skipping " << dir.string() << ": " << ec.message());
            ignores_.pop(pushed);
            return std::nullopt;
        }

        std::vector<fs::path> subdirs;
        std::optional<std::string> failed;
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            failed = visit_entry(*it, subdirs);
            if (failed) {
                break;
            }
        }
        if (ec) {
            POLYFMT_LOG_DEBUG("cli", "stopped reading " << dir.string() << ": " << ec.message());
        }

        std::sort(subdirs.begin(), subdirs.end());
        for (size_t i = 0; !failed && i < subdirs.size(); ++i) {
            failed = visit_dir(subdirs[i]);
        }
        ignores_.pop(pushed);
        return failed;
    }

    auto visit_entry(const fs::directory_entry& entry, std::vector<fs::path>& subdirs)
        -> std::optional<std::string> {
        const fs::path& path = entry.path();
        std::error_code ec;
        if (entry.is_directory(ec)) {
            const bool linked = entry.is_symlink(ec);
            if (!linked && !is_skipped_dir(path.filename().string()) && !ignored(path, true)) {
                subdirs.push_back(path);
            }
            return std::nullopt;
        }
        if (!entry.is_regular_file(ec) || !is_recognized(path) || ignored(path, false)) {
            return std::nullopt;
        }

        const fs::path relative = path.lexically_relative(abs_root_);
        auto kept = keep_(relative.generic_string());
        if (is_err(kept)) {
            return unwrap_err(kept);
        }
        if (unwrap(kept)) {
            files_.push_back((root_ / relative).lexically_normal());
        }
        return std::nullopt;
    }

    [[nodiscard]] auto ignored(const fs::path& path, bool is_dir) const -> bool {
        if (!use_ignore_files_ || !ignores_.is_ignored(path, is_dir)) {
            return false;
        }
        POLYFMT_LOG_TRACE("cli", "ignored " << path.string());
        return true;
    }

    fs::path root_;
    fs::path abs_root_;
    PathFilter keep_;
    bool use_ignore_files_;
    IgnoreStack ignores_;
    std::vector<fs::path> files_;
};

} // namespace

auto is_skipped_dir(std::string_view name) -> bool {
    return std::find(SKIPPED_DIRS.begin(), SKIPPED_DIRS.end(), name) != SKIPPED_DIRS.end();
}

auto glob_match(std::string_view pattern, std::string_view path) -> Result<bool, std::string> {
    return match_segments(split_segments(pattern), 0, split_segments(path), 0);
}

auto discover_files(std::string_view pattern, const fs::path& root, bool use_ignore_files)
    -> Result<std::vector<fs::path>, std::string> {
    const bool has_glob = pattern.find_first_of("*?[") != std::string_view::npos;

    if (!has_glob) {
        fs::path literal = root / fs::path(pattern);
        std::error_code ec;
        if (fs::is_regular_file(literal, ec)) {
            return std::vector<fs::path>{literal.lexically_normal()};
        }
        if (fs::is_directory(literal, ec)) {
            POLYFMT_LOG_DEBUG("cli", "walking directory " << literal.string());
            return Walker(literal, [](const std::string&) -> Result<bool, std::string> {
                return true;
            }, use_ignore_files).run();
        }
    }

    std::string glob(pattern);
    if (glob.starts_with("./")) {
        glob.erase(0, 2);
    }
    POLYFMT_LOG_DEBUG("cli", "expanding glob " << glob);
    return Walker(root, [&glob](const std::string& relative) {
        return glob_match(glob, relative);
    }, use_ignore_files).run();
}

} // namespace polyfmt::cli
