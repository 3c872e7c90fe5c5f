#include "registry/capability.hpp"

#include <array>

namespace polyfmt::registry {

using config::FormatOption;
using config::OptionSet;

namespace {

constexpr OptionSet SCRIPT_OPTIONS = {
    FormatOption::IndentStyle,    FormatOption::IndentWidth,   FormatOption::LineEnding,
    FormatOption::QuoteStyle,     FormatOption::TrailingComma, FormatOption::Semicolons,
    FormatOption::BracketSpacing,
};

constexpr OptionSet JSON_OPTIONS = {
    FormatOption::IndentStyle,
    FormatOption::IndentWidth,
    FormatOption::LineEnding,
};

constexpr OptionSet SHELL_OPTIONS = {FormatOption::IndentStyle, FormatOption::IndentWidth};

// gofmt and the protobuf printer have a fixed house style.
constexpr OptionSet FIXED_STYLE = {};

constexpr OptionSet CLANG_OPTIONS = {
    FormatOption::IndentStyle, FormatOption::IndentWidth,    FormatOption::LineWidth,
    FormatOption::LineEnding,  FormatOption::BracketSpacing, FormatOption::BraceStyle,
};

constexpr CapabilityEntry script(FileType type) {
    return {type, BackendId::Script, BackendKind::InProcess, SCRIPT_OPTIONS, "script", "", ""};
}

constexpr CapabilityEntry clang(FileType type) {
    return {type, BackendId::ClangFormat, BackendKind::Sandbox, CLANG_OPTIONS, "clang-format", "",
            ""};
}

constexpr std::array<CapabilityEntry, 14> DEFAULT_TABLE = {{
    script(FileType::JavaScript),
    script(FileType::TypeScript),
    script(FileType::Jsx),
    script(FileType::Tsx),
    {FileType::Json, BackendId::Json, BackendKind::InProcess, JSON_OPTIONS, "json", "", ""},
    {FileType::Jsonc, BackendId::Json, BackendKind::InProcess, JSON_OPTIONS, "json", "", ""},
    {FileType::Shell, BackendId::Goffi, BackendKind::Foreign, SHELL_OPTIONS, "goffi",
     "FormatShell", "FormatShellBatch"},
    {FileType::Go, BackendId::Goffi, BackendKind::Foreign, FIXED_STYLE, "goffi", "FormatGo",
     "FormatGoBatch"},
    {FileType::Proto, BackendId::Goffi, BackendKind::Foreign, FIXED_STYLE, "goffi", "FormatProto",
     "FormatProtoBatch"},
    clang(FileType::C),
    clang(FileType::Cpp),
    clang(FileType::CSharp),
    clang(FileType::ObjectiveC),
    clang(FileType::Java),
}};

/// Compile-time proof that no file type is routed twice.
constexpr bool table_is_collision_free() {
    for (size_t i = 0; i < DEFAULT_TABLE.size(); ++i) {
        for (size_t j = i + 1; j < DEFAULT_TABLE.size(); ++j) {
            if (DEFAULT_TABLE[i].file_type == DEFAULT_TABLE[j].file_type) {
                return false;
            }
        }
    }
    return true;
}

static_assert(table_is_collision_free(), "a file type is routed to more than one backend");

} // namespace

CapabilityRegistry::CapabilityRegistry() : entries_(DEFAULT_TABLE) {}

auto CapabilityRegistry::global() -> const CapabilityRegistry& {
    static const CapabilityRegistry registry;
    return registry;
}

auto CapabilityRegistry::lookup(FileType type) const -> std::optional<CapabilityEntry> {
    for (const CapabilityEntry& entry : entries_) {
        if (entry.file_type == type) {
            return entry;
        }
    }
    return std::nullopt;
}

auto CapabilityRegistry::entries() const -> std::span<const CapabilityEntry> {
    return entries_;
}

auto CapabilityRegistry::backend_name(BackendId id) -> std::string_view {
    switch (id) {
    case BackendId::Script:
        return "script";
    case BackendId::Json:
        return "json";
    case BackendId::Goffi:
        return "goffi";
    case BackendId::ClangFormat:
        return "clang-format";
    }
    return "unknown";
}

auto CapabilityRegistry::kind_name(BackendKind kind) -> std::string_view {
    switch (kind) {
    case BackendKind::InProcess:
        return "in-process";
    case BackendKind::Foreign:
        return "foreign";
    case BackendKind::Sandbox:
        return "sandbox";
    }
    return "unknown";
}

} // namespace polyfmt::registry
