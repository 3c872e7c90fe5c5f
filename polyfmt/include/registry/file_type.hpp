//! # File Type Detection
//!
//! Maps a path to the closed `FileType` tag used for backend routing. The tag
//! is computed once per path from its extension, or from the file name for
//! extension-less files such as `Dockerfile`.
//!
//! | Extensions | FileType |
//! |------------|----------|
//! | `.js` `.cjs` `.mjs` | JavaScript |
//! | `.ts` `.mts` `.cts` | TypeScript |
//! | `.jsx` `.mjsx` / `.tsx` | Jsx / Tsx |
//! | `.json` / `.jsonc` | Json / Jsonc |
//! | `.sh` `.bash` `.zsh` | Shell |
//! | `.go` / `.proto` | Go / Proto |
//! | `.c` `.h` / `.cc` `.cpp` `.cxx` `.hpp` `.hh` `.hxx` | C / Cpp |
//! | `.cs` / `.m` `.mm` / `.java` | CSharp / ObjectiveC / Java |

#ifndef POLYFMT_REGISTRY_FILE_TYPE_HPP
#define POLYFMT_REGISTRY_FILE_TYPE_HPP

#include <cstdint>
#include <string_view>

namespace polyfmt::registry {

enum class FileType : uint8_t {
    JavaScript,
    TypeScript,
    Jsx,
    Tsx,
    Json,
    Jsonc,
    Css,
    Scss,
    Less,
    Sass,
    Html,
    Vue,
    Svelte,
    Astro,
    GraphQL,
    Yaml,
    Markdown,
    Toml,
    Rust,
    Python,
    Lua,
    Ruby,
    Shell,
    Go,
    Proto,
    Zig,
    Dockerfile,
    Xml,
    Sql,
    Php,
    Kotlin,
    Dart,
    C,
    Cpp,
    CSharp,
    ObjectiveC,
    Java,
    Unknown
};

/// Number of `FileType` tags, `Unknown` included.
inline constexpr size_t FILE_TYPE_COUNT = static_cast<size_t>(FileType::Unknown) + 1;

/// Detects the file type of `path`. Never fails; unrecognized paths are
/// `FileType::Unknown`.
[[nodiscard]] auto detect_file_type(std::string_view path) -> FileType;

/// Display name of a file type ("TypeScript", "C++", ...).
[[nodiscard]] auto file_type_name(FileType type) -> std::string_view;

} // namespace polyfmt::registry

#endif // POLYFMT_REGISTRY_FILE_TYPE_HPP
