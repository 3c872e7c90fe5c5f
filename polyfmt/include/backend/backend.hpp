//! # Backend Contract
//!
//! Every formatter, wherever it runs, is reached through `Backend::format`:
//! source text plus its translated native configuration in, formatted text or
//! a `FormatError` out.
//!
//! ## Error Kinds
//!
//! | Kind | Meaning | Run-level effect |
//! |------|---------|------------------|
//! | `UnsupportedType` | No capability entry | File passed through, counted unchanged |
//! | `ParseFailure` | Backend could not understand the input | Original text kept, counted unchanged |
//! | `BackendUnavailable` | Library or module failed to load | Warned once, files unchanged |
//! | `SandboxTrap` | The WASM module trapped | Per-file failure, instance recreated |
//! | `ContractViolation` | Malformed backend result | Per-file failure |
//! | `Io` | The file could not be read | Per-file failure |

#ifndef POLYFMT_BACKEND_BACKEND_HPP
#define POLYFMT_BACKEND_BACKEND_HPP

#include "common.hpp"
#include "config/translator.hpp"
#include "registry/capability.hpp"

#include <string>
#include <string_view>

namespace polyfmt::backend {

enum class ErrorKind : uint8_t {
    UnsupportedType,
    ParseFailure,
    BackendUnavailable,
    SandboxTrap,
    ContractViolation,
    Io,
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;

struct FormatError {
    ErrorKind kind;
    std::string message;

    [[nodiscard]] static auto make(ErrorKind kind, std::string message) -> FormatError {
        return FormatError{kind, std::move(message)};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

template <typename T> using FormatResult = Result<T, FormatError>;

/// Everything a backend needs to format one file.
struct FormatRequest {
    std::string_view path;
    std::string_view text;
    const registry::CapabilityEntry& entry;
    const config::NativeConfig& native;
};

/// A formatting backend.
///
/// Implementations must be callable from several batch workers at once.
class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual auto id() const -> registry::BackendId = 0;

    virtual auto format(const FormatRequest& request) -> FormatResult<std::string> = 0;
};

} // namespace polyfmt::backend

#endif // POLYFMT_BACKEND_BACKEND_HPP
