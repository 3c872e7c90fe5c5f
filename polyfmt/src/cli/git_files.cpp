#include "cli/git_files.hpp"

#include "log/log.hpp"
#include "registry/file_type.hpp"

#include <algorithm>
#include <cstdio>
#include <sys/wait.h>

namespace polyfmt::cli {

namespace {

struct GitOutput {
    std::string text;
};

/// Runs `git -C <dir> <args>` with stderr merged into the output.
auto run_git(const fs::path& dir, const std::string& args) -> Result<GitOutput, std::string> {
    std::string cmd = "git -C \"" + dir.string() + "\" " + args + " 2>&1";
    POLYFMT_LOG_DEBUG("cli", "running " << cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        return std::string("failed to run git");
    }
    std::string output;
    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }
    int status = pclose(pipe);

    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
            output.pop_back();
        }
        if (output.empty()) {
            output = "exit status " + std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        }
        return "git " + args + " failed: " + output;
    }
    return GitOutput{std::move(output)};
}

auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }
    return lines;
}

} // namespace

auto git_file_set_flag(GitFileSet set) -> std::string_view {
    switch (set) {
    case GitFileSet::Staged:
        return "--staged";
    case GitFileSet::Changed:
        return "--changed";
    }
    return "unknown";
}

auto git_files(GitFileSet set, const fs::path& dir) -> Result<std::vector<fs::path>, std::string> {
    auto toplevel = run_git(dir, "rev-parse --show-toplevel");
    if (is_err(toplevel)) {
        return std::string("not a git repository: ") + unwrap_err(toplevel);
    }
    auto top_lines = split_lines(unwrap(toplevel).text);
    if (top_lines.empty()) {
        return std::string("git rev-parse printed no work tree");
    }
    const fs::path top = fs::path(top_lines.front()).lexically_normal();

    std::string args = "-c core.quotepath=off diff --name-only --diff-filter=ACM";
    if (set == GitFileSet::Staged) {
        args += " --cached";
    }
    auto listed = run_git(top, args);
    if (is_err(listed)) {
        return unwrap_err(listed);
    }

    std::vector<fs::path> files;
    for (const auto& line : split_lines(unwrap(listed).text)) {
        fs::path path = (top / line).lexically_normal();
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            continue;
        }
        if (registry::detect_file_type(path.generic_string()) == registry::FileType::Unknown) {
            continue;
        }
        files.push_back(std::move(path));
    }
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    POLYFMT_LOG_INFO("cli", files.size() << " files from " << git_file_set_flag(set));
    return files;
}

} // namespace polyfmt::cli
