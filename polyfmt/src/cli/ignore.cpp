#include "cli/ignore.hpp"

#include "cli/discovery.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <sstream>

namespace polyfmt::cli {

namespace {

auto parse_line(std::string_view line) -> std::optional<IgnoreRule> {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    // Trailing blanks are dropped unless escaped with a backslash.
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) {
        if (line.size() >= 2 && line[line.size() - 2] == '\\') {
            break;
        }
        line.remove_suffix(1);
    }
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    IgnoreRule rule;
    std::string pattern(line);
    if (pattern.front() == '!') {
        rule.negated = true;
        pattern.erase(0, 1);
    } else if (pattern.starts_with("\\#") || pattern.starts_with("\\!")) {
        pattern.erase(0, 1);
    }
    if (pattern.ends_with("\\ ")) {
        pattern.erase(pattern.size() - 2, 1);
    }
    if (!pattern.empty() && pattern.back() == '/') {
        rule.dir_only = true;
        pattern.pop_back();
    }
    if (!pattern.empty() && pattern.front() == '/') {
        rule.anchored = true;
        pattern.erase(0, 1);
    } else if (pattern.find('/') != std::string::npos) {
        rule.anchored = true;
    }
    if (pattern.empty()) {
        return std::nullopt;
    }
    rule.pattern = std::move(pattern);
    return rule;
}

} // namespace

// ============================================================================
// Ignore File
// ============================================================================

auto IgnoreFile::parse(const fs::path& base, std::string_view text) -> IgnoreFile {
    std::vector<IgnoreRule> rules;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (auto rule = parse_line(text.substr(start, end - start))) {
            rules.push_back(std::move(*rule));
        }
        start = end + 1;
    }
    return IgnoreFile(base, std::move(rules));
}

auto IgnoreFile::load(const fs::path& file, const fs::path& base) -> std::optional<IgnoreFile> {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        POLYFMT_LOG_DEBUG("cli", "cannot read " << file.string());
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    IgnoreFile parsed = parse(base, buffer.str());
    POLYFMT_LOG_TRACE("cli", file.string() << ": " << parsed.rules().size() << " ignore rules");
    return parsed;
}

auto IgnoreFile::match(std::string_view relative, bool is_dir) const -> IgnoreMatch {
    size_t slash = relative.rfind('/');
    std::string_view name = slash == std::string_view::npos ? relative : relative.substr(slash + 1);

    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (it->dir_only && !is_dir) {
            continue;
        }
        auto matched = glob_match(it->pattern, it->anchored ? relative : name);
        if (is_ok(matched) && unwrap(matched)) {
            return it->negated ? IgnoreMatch::Included : IgnoreMatch::Ignored;
        }
    }
    return IgnoreMatch::None;
}

// ============================================================================
// Ignore Stack
// ============================================================================

auto normalized_absolute(const fs::path& path) -> fs::path {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        abs = path;
    }
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

auto find_work_tree_root(const fs::path& dir) -> std::optional<fs::path> {
    std::error_code ec;
    for (fs::path current = dir;; current = current.parent_path()) {
        if (fs::exists(current / ".git", ec)) {
            return current;
        }
        if (current.empty() || current == current.parent_path()) {
            return std::nullopt;
        }
    }
}

auto IgnoreStack::for_walk_root(const fs::path& root) -> IgnoreStack {
    IgnoreStack stack;
    const fs::path abs = normalized_absolute(root);
    auto top = find_work_tree_root(abs);
    stack.in_git_repo_ = top.has_value();
    if (!top) {
        return stack;
    }

    if (auto exclude = IgnoreFile::load(*top / ".git" / "info" / "exclude", *top)) {
        stack.files_.push_back(std::move(*exclude));
    }
    if (abs != *top) {
        fs::path dir = *top;
        stack.push_dir(dir);
        const fs::path relative = abs.lexically_relative(*top);
        std::vector<fs::path> parts(relative.begin(), relative.end());
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            dir /= parts[i];
            stack.push_dir(dir);
        }
    }
    return stack;
}

auto IgnoreStack::push_dir(const fs::path& dir) -> size_t {
    size_t pushed = 0;
    // `.ignore` is pushed last so it wins over `.gitignore` in the same directory.
    if (in_git_repo_) {
        if (auto gitignore = IgnoreFile::load(dir / ".gitignore", dir)) {
            files_.push_back(std::move(*gitignore));
            pushed++;
        }
    }
    if (auto ignore = IgnoreFile::load(dir / ".ignore", dir)) {
        files_.push_back(std::move(*ignore));
        pushed++;
    }
    return pushed;
}

void IgnoreStack::pop(size_t count) {
    files_.erase(files_.end() - static_cast<std::ptrdiff_t>(std::min(count, files_.size())),
                 files_.end());
}

auto IgnoreStack::is_ignored(const fs::path& path, bool is_dir) const -> bool {
    for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
        fs::path relative = path.lexically_relative(it->base());
        if (relative.empty() || *relative.begin() == "..") {
            continue;
        }
        IgnoreMatch verdict = it->match(relative.generic_string(), is_dir);
        if (verdict != IgnoreMatch::None) {
            return verdict == IgnoreMatch::Ignored;
        }
    }
    return false;
}

} // namespace polyfmt::cli
