//! # Capability Registry
//!
//! Static routing table from `FileType` to the one backend that formats it,
//! together with the unified options that backend understands and the entry
//! names used to reach it.
//!
//! ## Default Routing
//!
//! | File types | Backend | Kind |
//! |------------|---------|------|
//! | JavaScript, TypeScript, Jsx, Tsx | `script` | in-process |
//! | Json, Jsonc | `json` | in-process |
//! | Shell, Go, Proto | `goffi` | foreign library |
//! | C, Cpp, CSharp, ObjectiveC, Java | `clang-format` | sandboxed module |
//!
//! Every other file type has no entry and is passed through untouched.
//! Adding a backend is a change to the table in `capability.cpp`, never to
//! the dispatcher.

#ifndef POLYFMT_REGISTRY_CAPABILITY_HPP
#define POLYFMT_REGISTRY_CAPABILITY_HPP

#include "config/format_config.hpp"
#include "registry/file_type.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace polyfmt::registry {

/// Where a backend runs.
enum class BackendKind : uint8_t {
    InProcess, ///< Linked into the host process
    Foreign,   ///< Shared library behind the C ABI, loaded with dlopen
    Sandbox    ///< WASM module run by the embedded runtime
};

enum class BackendId : uint8_t {
    Script,
    Json,
    Goffi,
    ClangFormat,
};

/// One row of the routing table.
///
/// For foreign backends `artifact` is the library name (`goffi` resolves to
/// `libgoffi.so`) and the symbols name its entry points. For the sandbox
/// backend `artifact` is the module name (`clang-format` resolves to
/// `clang-format.wasm`).
struct CapabilityEntry {
    FileType file_type;
    BackendId backend;
    BackendKind kind;
    config::OptionSet supported;
    std::string_view artifact;
    std::string_view format_symbol;
    std::string_view batch_symbol;
};

/// Read-only view over the routing table.
///
/// Total and collision-free: every `FileType` maps to at most one entry.
/// Construction does no I/O and cannot fail.
class CapabilityRegistry {
public:
    CapabilityRegistry();

    /// The process-wide registry built from the default table.
    static auto global() -> const CapabilityRegistry&;

    /// Returns the entry for `type`, or none when the type is unsupported.
    [[nodiscard]] auto lookup(FileType type) const -> std::optional<CapabilityEntry>;

    [[nodiscard]] auto entries() const -> std::span<const CapabilityEntry>;

    [[nodiscard]] static auto backend_name(BackendId id) -> std::string_view;

    [[nodiscard]] static auto kind_name(BackendKind kind) -> std::string_view;

private:
    std::span<const CapabilityEntry> entries_;
};

} // namespace polyfmt::registry

#endif // POLYFMT_REGISTRY_CAPABILITY_HPP
