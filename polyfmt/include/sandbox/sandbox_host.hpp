//! # Sandbox Host
//!
//! Runs a formatter compiled to WebAssembly (the clang-format build) inside
//! the wasmtime runtime. The module never sees host memory: inputs are copied
//! into buffers it allocates with its own `malloc`, and results are copied out
//! before the module releases them.
//!
//! ## Module Protocol
//!
//! | Export | Signature | Purpose |
//! |--------|-----------|---------|
//! | `malloc` / `free` | `(i32) -> i32` / `(i32)` | Module heap |
//! | `wasm_init` | `()` | One-time setup after instantiation |
//! | `wasm_set_style` | `(ptr, len) -> i32` | Style string, 0 on success |
//! | `wasm_format` | `(src, src_len, name, name_len) -> i32` | 0 ok, 1 error, 2 unchanged |
//! | `wasm_get_result_ptr` / `_len` | `() -> i32` | Result or error message |
//! | `wasm_free_result` | `()` | Releases the result |
//!
//! ## Instance Lifecycle
//!
//! ```text
//! Uninitialized → Initialized → StyleSet → Ready ⟲ (same style)
//!                                   ↑         │ style change
//!                                   └─────────┘
//! any state ── trap ──→ Poisoned (discarded, replaced on next checkout)
//! ```
//!
//! The module is compiled once. Instances are created lazily, at most
//! `pool_size` of them, and each call holds one exclusively.
//!
//! A module that compiles but cannot be instantiated (unresolved import,
//! missing export, failing `wasm_init`) retires the host: one warning, and
//! every later call reports `BackendUnavailable` without instantiating again.

#ifndef POLYFMT_SANDBOX_SANDBOX_HOST_HPP
#define POLYFMT_SANDBOX_SANDBOX_HOST_HPP

#include "backend/backend.hpp"
#include "ffi/library_loader.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <initializer_list>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::sandbox {

enum class InstanceState : uint8_t { Uninitialized, Initialized, StyleSet, Ready, Poisoned };

[[nodiscard]] auto instance_state_name(InstanceState state) -> std::string_view;

/// Counters kept across the lifetime of a host.
struct SandboxStats {
    size_t instantiations = 0;
    size_t style_writes = 0;
    size_t traps = 0;
    size_t allocs = 0;
    size_t frees = 0;
};

/// Locates `<name>.wasm.zst`, `<name>.wasm` or `<name>.wat` in `dirs` and
/// returns the module bytes, WAT text converted to binary.
[[nodiscard]] auto load_module_bytes(const std::string& name, const std::vector<fs::path>& dirs)
    -> Result<std::vector<uint8_t>, std::string>;

class SandboxHost {
public:
    /// `module_name` is resolved in the backend search path extended by
    /// `explicit_dirs`. Nothing is loaded until the first call.
    SandboxHost(std::string module_name, size_t pool_size,
                std::vector<fs::path> explicit_dirs = {});
    ~SandboxHost();

    // Non-copyable
    SandboxHost(const SandboxHost&) = delete;
    SandboxHost& operator=(const SandboxHost&) = delete;

    /// Formats `text`; `filename` lets the module pick the language.
    ///
    /// A module-reported error comes back as `ParseFailure`, a trap as
    /// `SandboxTrap`, a module that cannot be loaded or instantiated as
    /// `BackendUnavailable`. Never throws and never lets a trap escape.
    auto format(std::string_view text, std::string_view filename, const std::string& style)
        -> backend::FormatResult<std::string>;

    /// Compiles the module if needed and reports whether it is usable: it
    /// compiled and no instantiation has failed.
    [[nodiscard]] auto is_available() -> bool;

    [[nodiscard]] auto stats() const -> SandboxStats;

    [[nodiscard]] auto pool_size() const -> size_t { return pool_size_; }

    /// Number of instances currently alive, idle or checked out.
    [[nodiscard]] auto live_instances() const -> size_t;

private:
    struct Runtime;
    struct Instance;

    /// Module exports called by the host, in lookup order.
    enum class Export : uint8_t {
        Malloc,
        Free,
        Init,
        SetStyle,
        Format,
        ResultPtr,
        ResultLen,
        FreeResult,
    };

    void compile();
    auto instantiate() -> backend::FormatResult<Box<Instance>>;
    auto checkout() -> backend::FormatResult<Box<Instance>>;
    void checkin(Box<Instance> instance);
    void retire(const std::string& reason);
    [[nodiscard]] auto unavailable_reason() const -> std::string;

    auto call(Instance& inst, Export fn, std::initializer_list<int32_t> args,
              size_t nresults) -> backend::FormatResult<int32_t>;
    auto write_bytes(Instance& inst, std::string_view bytes) -> backend::FormatResult<int32_t>;
    auto release(Instance& inst, int32_t ptr) -> backend::FormatResult<int32_t>;
    auto read_result(Instance& inst) -> backend::FormatResult<std::string>;
    auto apply_style(Instance& inst, const std::string& style) -> backend::FormatResult<int32_t>;
    auto run(Instance& inst, std::string_view text, std::string_view filename,
             const std::string& style) -> backend::FormatResult<std::string>;

    std::string module_name_;
    size_t pool_size_;
    std::vector<fs::path> search_dirs_;

    std::once_flag compile_once_;
    Box<Runtime> runtime_;
    std::string unavailable_reason_;

    mutable std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<Box<Instance>> idle_;
    size_t live_ = 0;
    bool retired_ = false;
    std::string retired_reason_;

    std::atomic<size_t> instantiations_{0};
    std::atomic<size_t> style_writes_{0};
    std::atomic<size_t> traps_{0};
    std::atomic<size_t> allocs_{0};
    std::atomic<size_t> frees_{0};
};

} // namespace polyfmt::sandbox

#endif // POLYFMT_SANDBOX_SANDBOX_HOST_HPP
