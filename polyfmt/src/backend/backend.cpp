#include "backend/backend.hpp"

namespace polyfmt::backend {

auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
    case ErrorKind::UnsupportedType:
        return "unsupported type";
    case ErrorKind::ParseFailure:
        return "parse failure";
    case ErrorKind::BackendUnavailable:
        return "backend unavailable";
    case ErrorKind::SandboxTrap:
        return "sandbox trap";
    case ErrorKind::ContractViolation:
        return "contract violation";
    case ErrorKind::Io:
        return "io";
    }
    return "unknown";
}

} // namespace polyfmt::backend
