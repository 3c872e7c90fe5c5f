#include "dispatch/dispatcher.hpp"

#include "backend/external.hpp"
#include "backend/in_process.hpp"
#include "config/translator.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace polyfmt::dispatch {

using backend::ErrorKind;
using backend::FormatError;
using registry::BackendId;
using registry::CapabilityRegistry;

auto outcome_kind_name(OutcomeKind kind) -> std::string_view {
    switch (kind) {
    case OutcomeKind::Formatted:
        return "formatted";
    case OutcomeKind::Unchanged:
        return "unchanged";
    case OutcomeKind::Failed:
        return "failed";
    }
    return "unknown";
}

auto read_text_file(const std::filesystem::path& path) -> Result<std::string, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot open " + path.string();
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return "read error on " + path.string();
    }
    return buffer.str();
}

Dispatcher::Dispatcher(const CapabilityRegistry& registry) : registry_(registry) {}

void Dispatcher::register_backend(Box<backend::Backend> backend) {
    auto slot = static_cast<size_t>(backend->id());
    backends_.at(slot) = std::move(backend);
}

void Dispatcher::register_default_backends(ffi::ForeignBridge& bridge,
                                           sandbox::SandboxHost& host) {
    register_backend(make_box<backend::ScriptBackend>());
    register_backend(make_box<backend::JsonBackend>());

    for (const auto& entry : registry_.entries()) {
        if (this->backend(entry.backend)) {
            continue;
        }
        switch (entry.kind) {
        case registry::BackendKind::Foreign:
            register_backend(make_box<backend::ForeignBackend>(entry.backend, bridge));
            break;
        case registry::BackendKind::Sandbox:
            register_backend(make_box<backend::SandboxBackend>(entry.backend, host));
            break;
        case registry::BackendKind::InProcess:
            break;
        }
    }
}

auto Dispatcher::backend(BackendId id) const -> backend::Backend* {
    auto slot = static_cast<size_t>(id);
    return slot < backends_.size() ? backends_[slot].get() : nullptr;
}

auto Dispatcher::dispatch(const std::filesystem::path& path, registry::FileType type,
                          const config::FormatConfig& config) const -> FormatOutcome {
    // Unsupported files are never opened.
    if (!registry_.lookup(type)) {
        POLYFMT_LOG_TRACE("dispatch", path.string() << ": no backend for "
                                                    << registry::file_type_name(type));
        return FormatOutcome::unchanged();
    }

    auto content = read_text_file(path);
    if (is_err(content)) {
        return FormatOutcome::failed(FormatError::make(ErrorKind::Io, unwrap_err(content)));
    }
    return dispatch_text(path.string(), unwrap(content), type, config);
}

auto Dispatcher::dispatch_text(std::string_view path, std::string_view text,
                               registry::FileType type, const config::FormatConfig& config) const
    -> FormatOutcome {
    auto entry = registry_.lookup(type);
    if (!entry) {
        POLYFMT_LOG_TRACE("dispatch", path << ": no backend for "
                                           << registry::file_type_name(type));
        return FormatOutcome::unchanged();
    }

    const std::string_view backend_name = CapabilityRegistry::backend_name(entry->backend);
    backend::Backend* target = backend(entry->backend);
    if (!target) {
        POLYFMT_LOG_DEBUG("dispatch", path << ": backend " << backend_name << " not registered");
        return FormatOutcome::unchanged();
    }

    const config::NativeConfig native = config::translate(config, *entry);
    const backend::FormatRequest request{path, text, *entry, native};
    auto result = target->format(request);

    if (is_err(result)) {
        auto& error = unwrap_err(result);
        switch (error.kind) {
        case ErrorKind::ParseFailure:
        case ErrorKind::BackendUnavailable:
        case ErrorKind::UnsupportedType:
            POLYFMT_LOG_DEBUG("dispatch", path << ": " << backend_name << " kept original ("
                                               << error.to_string() << ")");
            return FormatOutcome::unchanged();
        case ErrorKind::SandboxTrap:
        case ErrorKind::ContractViolation:
        case ErrorKind::Io:
            break;
        }
        error.message = std::string(backend_name) + ": " + error.message;
        POLYFMT_LOG_DEBUG("dispatch", path << ": " << error.to_string());
        return FormatOutcome::failed(std::move(error));
    }

    auto& formatted = unwrap(result);
    if (formatted == text) {
        return FormatOutcome::unchanged();
    }
    return FormatOutcome::formatted(std::move(formatted));
}

} // namespace polyfmt::dispatch
