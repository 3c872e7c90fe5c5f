//! # Dispatcher
//!
//! Routes one file to the backend its capability entry names and classifies
//! the result. The dispatcher holds no formatting logic and no per-language
//! branches: adding a language is a registry change plus, at most, one
//! `register_backend` call.
//!
//! ## Outcome Mapping
//!
//! | Backend result | Outcome |
//! |----------------|---------|
//! | No capability entry | `Unchanged` |
//! | Text identical to the input | `Unchanged` |
//! | Different text | `Formatted` |
//! | `ParseFailure`, `BackendUnavailable` | `Unchanged` (original kept) |
//! | `SandboxTrap`, `ContractViolation` | `Failed` |
//! | File unreadable | `Failed` with `Io` |

#ifndef POLYFMT_DISPATCH_DISPATCHER_HPP
#define POLYFMT_DISPATCH_DISPATCHER_HPP

#include "backend/backend.hpp"
#include "ffi/foreign_bridge.hpp"
#include "sandbox/sandbox_host.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace polyfmt::dispatch {

enum class OutcomeKind : uint8_t { Formatted, Unchanged, Failed };

[[nodiscard]] auto outcome_kind_name(OutcomeKind kind) -> std::string_view;

struct FormatOutcome {
    OutcomeKind kind = OutcomeKind::Unchanged;
    /// The new content; set only for `Formatted`.
    std::string text;
    /// Set only for `Failed`.
    std::optional<backend::FormatError> error;

    [[nodiscard]] static auto formatted(std::string text) -> FormatOutcome {
        return FormatOutcome{OutcomeKind::Formatted, std::move(text), std::nullopt};
    }

    [[nodiscard]] static auto unchanged() -> FormatOutcome {
        return FormatOutcome{OutcomeKind::Unchanged, {}, std::nullopt};
    }

    [[nodiscard]] static auto failed(backend::FormatError error) -> FormatOutcome {
        return FormatOutcome{OutcomeKind::Failed, {}, std::move(error)};
    }
};

/// Reads a whole file as bytes.
[[nodiscard]] auto read_text_file(const std::filesystem::path& path)
    -> Result<std::string, std::string>;

class Dispatcher {
public:
    explicit Dispatcher(const registry::CapabilityRegistry& registry =
                            registry::CapabilityRegistry::global());

    // Non-copyable
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Installs `backend` for its id, replacing any previous one.
    void register_backend(Box<backend::Backend> backend);

    /// Installs the script and JSON engines plus adapters for every foreign
    /// and sandboxed entry in the registry.
    void register_default_backends(ffi::ForeignBridge& bridge, sandbox::SandboxHost& host);

    /// The backend installed for `id`, or null.
    [[nodiscard]] auto backend(registry::BackendId id) const -> backend::Backend*;

    /// Reads `path` and formats its content. Never throws.
    [[nodiscard]] auto dispatch(const std::filesystem::path& path, registry::FileType type,
                                const config::FormatConfig& config) const -> FormatOutcome;

    /// Formats in-memory content; `path` only labels logs and errors.
    [[nodiscard]] auto dispatch_text(std::string_view path, std::string_view text,
                                     registry::FileType type,
                                     const config::FormatConfig& config) const -> FormatOutcome;

    [[nodiscard]] auto registry() const -> const registry::CapabilityRegistry& { return registry_; }

private:
    static constexpr size_t BACKEND_SLOTS = 4;

    const registry::CapabilityRegistry& registry_;
    std::array<Box<backend::Backend>, BACKEND_SLOTS> backends_;
};

} // namespace polyfmt::dispatch

#endif // POLYFMT_DISPATCH_DISPATCHER_HPP
