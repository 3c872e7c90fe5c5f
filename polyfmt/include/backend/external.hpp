//! # External Backends
//!
//! Adapters from the `Backend` contract to formatters that live outside the
//! host's own code: shared libraries reached through the foreign bridge and
//! the WASM module run by the sandbox host. Both hold a reference to a bridge
//! or host owned by the caller, which must outlive them.

#ifndef POLYFMT_BACKEND_EXTERNAL_HPP
#define POLYFMT_BACKEND_EXTERNAL_HPP

#include "backend/backend.hpp"
#include "ffi/foreign_bridge.hpp"
#include "sandbox/sandbox_host.hpp"

namespace polyfmt::backend {

class ForeignBackend final : public Backend {
public:
    ForeignBackend(registry::BackendId id, ffi::ForeignBridge& bridge) : id_(id), bridge_(bridge) {}

    [[nodiscard]] auto id() const -> registry::BackendId override { return id_; }

    auto format(const FormatRequest& request) -> FormatResult<std::string> override {
        return bridge_.format(request.entry, request.text, request.native);
    }

private:
    registry::BackendId id_;
    ffi::ForeignBridge& bridge_;
};

class SandboxBackend final : public Backend {
public:
    SandboxBackend(registry::BackendId id, sandbox::SandboxHost& host) : id_(id), host_(host) {}

    [[nodiscard]] auto id() const -> registry::BackendId override { return id_; }

    /// The file name goes to the module so it can pick the language.
    auto format(const FormatRequest& request) -> FormatResult<std::string> override {
        return host_.format(request.text, request.path, request.native.sandbox_style());
    }

private:
    registry::BackendId id_;
    sandbox::SandboxHost& host_;
};

} // namespace polyfmt::backend

#endif // POLYFMT_BACKEND_EXTERNAL_HPP
