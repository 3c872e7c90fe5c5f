//! # Foreign Bridge
//!
//! Calls natively compiled formatters through the C ABI in `foreign_abi.h`.
//!
//! ## Lifecycle
//!
//! Each library is loaded on first use under `std::call_once`; its release
//! functions and the format and batch entry points of every capability entry
//! naming it are resolved in the same step and stay read-only afterwards. A
//! library that cannot be loaded, or lacks an entry point, is unavailable for
//! the rest of the run: one warning is logged and every call reports
//! `BackendUnavailable`.
//!
//! ## Calls
//!
//! | Step | Detail |
//! |------|--------|
//! | Marshal | Pointer plus explicit length, no reliance on NUL |
//! | Invoke | Serialized per library unless it exports `polyfmt_backend_reentrant` |
//! | Copy | Result copied into host memory |
//! | Release | Paired free through a scoped owner on every path |

#ifndef POLYFMT_FFI_FOREIGN_BRIDGE_HPP
#define POLYFMT_FFI_FOREIGN_BRIDGE_HPP

#include "backend/backend.hpp"
#include "ffi/foreign_abi.h"
#include "ffi/library_loader.hpp"
#include "registry/capability.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace polyfmt::ffi {

using BatchResult = backend::FormatResult<std::vector<backend::FormatResult<std::string>>>;

class ForeignBridge {
public:
    /// `explicit_dirs` are searched before the environment and the
    /// executable-relative directories.
    explicit ForeignBridge(std::vector<fs::path> explicit_dirs = {},
                           const registry::CapabilityRegistry& registry =
                               registry::CapabilityRegistry::global());

    // Non-copyable
    ForeignBridge(const ForeignBridge&) = delete;
    ForeignBridge& operator=(const ForeignBridge&) = delete;

    /// Formats one text with the entry's format entry point.
    auto format(const registry::CapabilityEntry& entry, std::string_view text,
                const config::NativeConfig& native) -> backend::FormatResult<std::string>;

    /// Formats many texts with one call to the entry's batch entry point.
    ///
    /// The outer result fails only when the library is unavailable or returns
    /// no array; a missing element fails that element alone.
    auto format_batch(const registry::CapabilityEntry& entry,
                      const std::vector<std::string_view>& texts,
                      const config::NativeConfig& native) -> BatchResult;

    /// Loads the library if needed and reports whether it is usable.
    [[nodiscard]] auto is_available(std::string_view artifact) -> bool;

private:
    struct Library {
        std::once_flag once;
        bool available = false;
        bool reentrant = false;
        std::string error;
        PolyfmtFreeStringFn free_string = nullptr;
        PolyfmtFreeStringArrayFn free_array = nullptr;
        std::unordered_map<std::string, void*> symbols;
        std::mutex call_mutex;
    };

    auto library(std::string_view artifact) -> Library&;
    void initialize(const std::string& artifact, Library& lib);
    static auto lock_for(Library& lib) -> std::unique_lock<std::mutex>;

    const registry::CapabilityRegistry& registry_;
    LibraryLoader loader_;
    std::mutex libraries_mutex_;
    std::unordered_map<std::string, Box<Library>> libraries_;
};

} // namespace polyfmt::ffi

#endif // POLYFMT_FFI_FOREIGN_BRIDGE_HPP
