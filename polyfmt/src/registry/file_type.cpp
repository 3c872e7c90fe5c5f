#include "registry/file_type.hpp"

#include <array>
#include <utility>

namespace polyfmt::registry {

namespace {

constexpr std::array<std::pair<std::string_view, FileType>, 63> EXTENSIONS = {{
    {"js", FileType::JavaScript},  {"cjs", FileType::JavaScript}, {"mjs", FileType::JavaScript},
    {"ts", FileType::TypeScript},  {"mts", FileType::TypeScript}, {"cts", FileType::TypeScript},
    {"jsx", FileType::Jsx},        {"mjsx", FileType::Jsx},       {"tsx", FileType::Tsx},
    {"json", FileType::Json},      {"jsonc", FileType::Jsonc},    {"css", FileType::Css},
    {"scss", FileType::Scss},      {"less", FileType::Less},      {"sass", FileType::Sass},
    {"html", FileType::Html},      {"htm", FileType::Html},       {"vue", FileType::Vue},
    {"svelte", FileType::Svelte},  {"astro", FileType::Astro},    {"graphql", FileType::GraphQL},
    {"gql", FileType::GraphQL},    {"yaml", FileType::Yaml},      {"yml", FileType::Yaml},
    {"md", FileType::Markdown},    {"markdown", FileType::Markdown}, {"toml", FileType::Toml},
    {"rs", FileType::Rust},        {"py", FileType::Python},      {"pyi", FileType::Python},
    {"lua", FileType::Lua},        {"rb", FileType::Ruby},        {"rake", FileType::Ruby},
    {"gemspec", FileType::Ruby},   {"ru", FileType::Ruby},        {"sh", FileType::Shell},
    {"bash", FileType::Shell},     {"zsh", FileType::Shell},      {"go", FileType::Go},
    {"proto", FileType::Proto},    {"zig", FileType::Zig},        {"xml", FileType::Xml},
    {"sql", FileType::Sql},        {"php", FileType::Php},        {"kt", FileType::Kotlin},
    {"kts", FileType::Kotlin},     {"dart", FileType::Dart},      {"c", FileType::C},
    {"h", FileType::C},            {"cc", FileType::Cpp},         {"cpp", FileType::Cpp},
    {"cxx", FileType::Cpp},        {"c++", FileType::Cpp},        {"hpp", FileType::Cpp},
    {"hh", FileType::Cpp},         {"hxx", FileType::Cpp},        {"ipp", FileType::Cpp},
    {"cs", FileType::CSharp},      {"m", FileType::ObjectiveC},   {"mm", FileType::ObjectiveC},
    {"java", FileType::Java},      {"dockerfile", FileType::Dockerfile},
    {"containerfile", FileType::Dockerfile},
}};

constexpr std::array<std::pair<std::string_view, FileType>, 4> FILE_NAMES = {{
    {"Dockerfile", FileType::Dockerfile},
    {"Containerfile", FileType::Dockerfile},
    {"Rakefile", FileType::Ruby},
    {"Gemfile", FileType::Ruby},
}};

} // namespace

auto detect_file_type(std::string_view path) -> FileType {
    size_t slash = path.find_last_of('/');
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);

    for (const auto& [file_name, type] : FILE_NAMES) {
        if (name == file_name) {
            return type;
        }
    }

    // Dotfiles such as ".bashrc" have no extension, only a name.
    size_t dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return FileType::Unknown;
    }
    std::string_view ext = name.substr(dot + 1);

    for (const auto& [extension, type] : EXTENSIONS) {
        if (ext == extension) {
            return type;
        }
    }
    return FileType::Unknown;
}

auto file_type_name(FileType type) -> std::string_view {
    switch (type) {
    case FileType::JavaScript:
        return "JavaScript";
    case FileType::TypeScript:
        return "TypeScript";
    case FileType::Jsx:
        return "JSX";
    case FileType::Tsx:
        return "TSX";
    case FileType::Json:
        return "JSON";
    case FileType::Jsonc:
        return "JSONC";
    case FileType::Css:
        return "CSS";
    case FileType::Scss:
        return "SCSS";
    case FileType::Less:
        return "Less";
    case FileType::Sass:
        return "Sass";
    case FileType::Html:
        return "HTML";
    case FileType::Vue:
        return "Vue";
    case FileType::Svelte:
        return "Svelte";
    case FileType::Astro:
        return "Astro";
    case FileType::GraphQL:
        return "GraphQL";
    case FileType::Yaml:
        return "YAML";
    case FileType::Markdown:
        return "Markdown";
    case FileType::Toml:
        return "TOML";
    case FileType::Rust:
        return "Rust";
    case FileType::Python:
        return "Python";
    case FileType::Lua:
        return "Lua";
    case FileType::Ruby:
        return "Ruby";
    case FileType::Shell:
        return "Shell";
    case FileType::Go:
        return "Go";
    case FileType::Proto:
        return "Protobuf";
    case FileType::Zig:
        return "Zig";
    case FileType::Dockerfile:
        return "Dockerfile";
    case FileType::Xml:
        return "XML";
    case FileType::Sql:
        return "SQL";
    case FileType::Php:
        return "PHP";
    case FileType::Kotlin:
        return "Kotlin";
    case FileType::Dart:
        return "Dart";
    case FileType::C:
        return "C";
    case FileType::Cpp:
        return "C++";
    case FileType::CSharp:
        return "C#";
    case FileType::ObjectiveC:
        return "Objective-C";
    case FileType::Java:
        return "Java";
    case FileType::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

} // namespace polyfmt::registry
