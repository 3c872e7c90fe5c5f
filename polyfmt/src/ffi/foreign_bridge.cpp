#include "ffi/foreign_bridge.hpp"

#include "ffi/foreign_buffer.hpp"
#include "log/log.hpp"

#include <optional>

namespace polyfmt::ffi {

using backend::ErrorKind;
using backend::FormatError;

namespace {

// An empty view may carry a null data pointer.
auto data_or_empty(std::string_view text) -> const char* {
    return text.data() ? text.data() : "";
}

} // namespace

ForeignBridge::ForeignBridge(std::vector<fs::path> explicit_dirs,
                             const registry::CapabilityRegistry& registry)
    : registry_(registry), loader_(backend_search_dirs(explicit_dirs)) {}

auto ForeignBridge::library(std::string_view artifact) -> Library& {
    Library* lib = nullptr;
    std::string name(artifact);
    {
        std::lock_guard<std::mutex> lock(libraries_mutex_);
        auto& slot = libraries_[name];
        if (!slot) {
            slot = make_box<Library>();
        }
        lib = slot.get();
    }
    std::call_once(lib->once, [&] { initialize(name, *lib); });
    return *lib;
}

void ForeignBridge::initialize(const std::string& artifact, Library& lib) {
    auto loaded = loader_.load(artifact);
    if (is_err(loaded)) {
        lib.error = unwrap_err(loaded);
    } else {
        void* handle = unwrap(loaded);
        lib.free_string = reinterpret_cast<PolyfmtFreeStringFn>(
            LibraryLoader::symbol(handle, POLYFMT_FREE_STRING_SYMBOL));
        lib.free_array = reinterpret_cast<PolyfmtFreeStringArrayFn>(
            LibraryLoader::symbol(handle, POLYFMT_FREE_STRING_ARRAY_SYMBOL));

        std::vector<std::string> missing;
        if (!lib.free_string) {
            missing.emplace_back(POLYFMT_FREE_STRING_SYMBOL);
        }
        if (!lib.free_array) {
            missing.emplace_back(POLYFMT_FREE_STRING_ARRAY_SYMBOL);
        }

        for (const auto& entry : registry_.entries()) {
            if (entry.kind != registry::BackendKind::Foreign || entry.artifact != artifact) {
                continue;
            }
            for (std::string_view name : {entry.format_symbol, entry.batch_symbol}) {
                std::string symbol(name);
                if (lib.symbols.count(symbol) > 0) {
                    continue;
                }
                void* fn = LibraryLoader::symbol(handle, symbol.c_str());
                if (!fn) {
                    missing.push_back(symbol);
                    continue;
                }
                lib.symbols.emplace(symbol, fn);
            }
        }

        if (missing.empty()) {
            auto reentrant_fn = reinterpret_cast<PolyfmtReentrantFn>(
                LibraryLoader::symbol(handle, POLYFMT_REENTRANT_SYMBOL));
            lib.reentrant = reentrant_fn && reentrant_fn() != 0;
            lib.available = true;
            POLYFMT_LOG_DEBUG("ffi", "backend '" << artifact << "' loaded"
                                                 << (lib.reentrant ? " (reentrant)" : ""));
            return;
        }

        lib.error = "missing entry points:";
        for (const auto& symbol : missing) {
            lib.error += " " + symbol;
        }
    }

    POLYFMT_LOG_WARN("ffi", "backend '" << artifact << "' unavailable, files it handles are left "
                                        << "unchanged: " << lib.error);
}

auto ForeignBridge::lock_for(Library& lib) -> std::unique_lock<std::mutex> {
    if (lib.reentrant) {
        return std::unique_lock<std::mutex>(lib.call_mutex, std::defer_lock);
    }
    return std::unique_lock<std::mutex>(lib.call_mutex);
}

auto ForeignBridge::is_available(std::string_view artifact) -> bool {
    return library(artifact).available;
}

auto ForeignBridge::format(const registry::CapabilityEntry& entry, std::string_view text,
                           const config::NativeConfig& native) -> backend::FormatResult<std::string> {
    Library& lib = library(entry.artifact);
    if (!lib.available) {
        return FormatError::make(ErrorKind::BackendUnavailable,
                                 std::string(entry.artifact) + ": " + lib.error);
    }

    auto fn = reinterpret_cast<PolyfmtFormatFn>(lib.symbols.at(std::string(entry.format_symbol)));
    const unsigned indent = native.foreign_indent();

    std::optional<std::string> copied;
    {
        auto lock = lock_for(lib);
        ForeignString result(fn(data_or_empty(text), text.size(), indent), lib.free_string);
        if (!result.is_null()) {
            copied = result.to_string();
        }
    }

    if (!copied) {
        return FormatError::make(ErrorKind::ContractViolation,
                                 std::string(entry.format_symbol) + " returned null");
    }
    return std::move(*copied);
}

auto ForeignBridge::format_batch(const registry::CapabilityEntry& entry,
                                 const std::vector<std::string_view>& texts,
                                 const config::NativeConfig& native) -> BatchResult {
    Library& lib = library(entry.artifact);
    if (!lib.available) {
        return FormatError::make(ErrorKind::BackendUnavailable,
                                 std::string(entry.artifact) + ": " + lib.error);
    }

    std::vector<backend::FormatResult<std::string>> results;
    if (texts.empty()) {
        return results;
    }

    auto fn =
        reinterpret_cast<PolyfmtFormatBatchFn>(lib.symbols.at(std::string(entry.batch_symbol)));
    const unsigned indent = native.foreign_indent();

    std::vector<const char*> sources;
    std::vector<size_t> lengths;
    sources.reserve(texts.size());
    lengths.reserve(texts.size());
    for (auto text : texts) {
        sources.push_back(data_or_empty(text));
        lengths.push_back(text.size());
    }

    results.reserve(texts.size());
    {
        auto lock = lock_for(lib);
        ForeignStringArray array(fn(sources.data(), lengths.data(), texts.size(), indent),
                                 texts.size(), lib.free_array);
        if (array.is_null()) {
            return FormatError::make(ErrorKind::ContractViolation,
                                     std::string(entry.batch_symbol) + " returned null");
        }
        for (size_t i = 0; i < array.size(); ++i) {
            const char* element = array.at(i);
            if (!element) {
                results.emplace_back(FormatError::make(
                    ErrorKind::ContractViolation,
                    std::string(entry.batch_symbol) + " returned null for element " +
                        std::to_string(i)));
            } else {
                results.emplace_back(std::string(element));
            }
        }
    }
    return results;
}

} // namespace polyfmt::ffi
