//! # In-Process Backends
//!
//! Engines linked into the host: the script reprinter for the JavaScript
//! family and the JSON reprinter. Both are stateless per call, so one instance
//! serves every batch worker.
//!
//! | Backend | File types | Engine |
//! |---------|------------|--------|
//! | `ScriptBackend` | JavaScript, TypeScript, Jsx, Tsx | `script::ScriptFormatter` |
//! | `JsonBackend` | Json, Jsonc | `json::JsonFormatter` |

#ifndef POLYFMT_BACKEND_IN_PROCESS_HPP
#define POLYFMT_BACKEND_IN_PROCESS_HPP

#include "backend/backend.hpp"
#include "json/json_formatter.hpp"
#include "script/script_formatter.hpp"

namespace polyfmt::backend {

class ScriptBackend final : public Backend {
public:
    [[nodiscard]] auto id() const -> registry::BackendId override {
        return registry::BackendId::Script;
    }

    auto format(const FormatRequest& request) -> FormatResult<std::string> override;

    /// Engine options from a translated configuration; absent slots keep defaults.
    [[nodiscard]] static auto options_from(const config::NativeConfig& native)
        -> script::ScriptOptions;

    [[nodiscard]] static auto dialect_for(registry::FileType type) -> script::ScriptDialect;
};

class JsonBackend final : public Backend {
public:
    [[nodiscard]] auto id() const -> registry::BackendId override {
        return registry::BackendId::Json;
    }

    auto format(const FormatRequest& request) -> FormatResult<std::string> override;

    [[nodiscard]] static auto options_from(const config::NativeConfig& native)
        -> json::JsonFormatOptions;
};

} // namespace polyfmt::backend

#endif // POLYFMT_BACKEND_IN_PROCESS_HPP
