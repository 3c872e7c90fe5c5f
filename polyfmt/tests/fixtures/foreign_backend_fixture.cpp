//! # Foreign Backend Fixture
//!
//! A shared library implementing the foreign ABI for tests, standing in for
//! the Go formatters. It strips trailing whitespace and, for shell input with
//! a space indent, expands leading tabs. Every buffer it hands out is counted
//! so tests can check that the host released all of them.
//!
//! | Input | Result |
//! |-------|--------|
//! | Unbalanced quotes, `if` without `fi` (shell only) | Copy of the input |
//! | Starts with `#!null-result` | Null |
//! | Anything else | Formatted text |

#include "ffi/foreign_abi.h"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

namespace {

std::atomic<long> live_buffers{0};

constexpr std::string_view NULL_MARKER = "#!null-result";

auto copy_out(std::string_view text) -> char* {
    auto* out = static_cast<char*>(std::malloc(text.size() + 1));
    if (!out) {
        return nullptr;
    }
    std::memcpy(out, text.data(), text.size());
    out[text.size()] = '\0';
    live_buffers++;
    return out;
}

auto is_word_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

auto count_word(std::string_view text, std::string_view word) -> size_t {
    size_t count = 0;
    for (size_t pos = text.find(word); pos != std::string_view::npos;
         pos = text.find(word, pos + 1)) {
        bool starts = pos == 0 || !is_word_char(text[pos - 1]);
        bool ends = pos + word.size() == text.size() || !is_word_char(text[pos + word.size()]);
        if (starts && ends) {
            count++;
        }
    }
    return count;
}

auto shell_is_valid(std::string_view text) -> bool {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote == 0) {
            if (c == '\\') {
                ++i;
            } else if (c == '\'' || c == '"') {
                quote = c;
            }
        } else if (c == quote) {
            quote = 0;
        } else if (c == '\\' && quote == '"') {
            ++i;
        }
    }
    return quote == 0 && count_word(text, "if") == count_word(text, "fi");
}

auto reformat(std::string_view text, unsigned indent) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool line_start = true;
    for (char c : text) {
        if (c == '\n') {
            while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
                out.pop_back();
            }
            out.push_back('\n');
            line_start = true;
            continue;
        }
        if (line_start && c == '\t' && indent > 0) {
            out.append(indent, ' ');
            continue;
        }
        line_start = line_start && (c == ' ' || c == '\t');
        out.push_back(c);
    }
    while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) {
        out.pop_back();
    }
    return out;
}

auto format_one(std::string_view text, unsigned indent, bool shell) -> char* {
    if (text.starts_with(NULL_MARKER)) {
        return nullptr;
    }
    if (shell && !shell_is_valid(text)) {
        return copy_out(text);
    }
    return copy_out(reformat(text, indent));
}

auto format_many(const char* const* srcs, const size_t* lens, size_t count, unsigned indent,
                 bool shell) -> char** {
    auto** out = static_cast<char**>(std::malloc(sizeof(char*) * (count == 0 ? 1 : count)));
    if (!out) {
        return nullptr;
    }
    live_buffers++;
    for (size_t i = 0; i < count; ++i) {
        out[i] = format_one(std::string_view(srcs[i], lens[i]), indent, shell);
    }
    return out;
}

} // namespace

extern "C" {

POLYFMT_API char* FormatShell(const char* src, size_t len, unsigned indent) {
    return format_one(std::string_view(src, len), indent, true);
}

POLYFMT_API char** FormatShellBatch(const char* const* srcs, const size_t* lens, size_t count,
                                    unsigned indent) {
    return format_many(srcs, lens, count, indent, true);
}

// gofmt and the protobuf printer ignore the indent argument.
POLYFMT_API char* FormatGo(const char* src, size_t len, unsigned /*indent*/) {
    return format_one(std::string_view(src, len), 0, false);
}

POLYFMT_API char** FormatGoBatch(const char* const* srcs, const size_t* lens, size_t count,
                                 unsigned /*indent*/) {
    return format_many(srcs, lens, count, 0, false);
}

POLYFMT_API char* FormatProto(const char* src, size_t len, unsigned /*indent*/) {
    return format_one(std::string_view(src, len), 0, false);
}

POLYFMT_API char** FormatProtoBatch(const char* const* srcs, const size_t* lens, size_t count,
                                    unsigned /*indent*/) {
    return format_many(srcs, lens, count, 0, false);
}

POLYFMT_API void FreeString(char* s) {
    if (s) {
        std::free(s);
        live_buffers--;
    }
}

POLYFMT_API void FreeStringArray(char** arr, size_t count) {
    if (!arr) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        FreeString(arr[i]);
    }
    std::free(arr);
    live_buffers--;
}

POLYFMT_API int polyfmt_backend_reentrant(void) {
    return 1;
}

/// Buffers handed out and not yet released, arrays included.
POLYFMT_API long FixtureLiveBuffers(void) {
    return live_buffers.load();
}

} // extern "C"
