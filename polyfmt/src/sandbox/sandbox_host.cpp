//! # Sandbox Host Implementation
//!
//! ## Runtime Objects
//!
//! | Object | Lifetime | Shared |
//! |--------|----------|--------|
//! | `wasm_engine_t` | Host | Yes |
//! | `wasmtime_module_t` | Host, compiled once | Yes |
//! | `wasmtime_linker_t` | Host, WASI plus `env` stubs | Yes |
//! | `wasmtime_store_t` | One per instance | No, checked out exclusively |
//!
//! Stores are deleted before the runtime; a store owns everything its
//! instance allocated, so discarding a poisoned instance reclaims its memory.

#include "sandbox/sandbox_host.hpp"

#include "log/log.hpp"

#include <wasi.h>
#include <wasmtime.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

namespace polyfmt::sandbox {

using backend::ErrorKind;
using backend::FormatError;

namespace {

// Indexed by `SandboxHost::Export`.
constexpr std::array<const char*, 8> EXPORT_NAMES = {
    "malloc",      "free",
    "wasm_init",   "wasm_set_style",
    "wasm_format", "wasm_get_result_ptr",
    "wasm_get_result_len", "wasm_free_result",
};

constexpr int32_t STATUS_OK = 0;
constexpr int32_t STATUS_ERROR = 1;
constexpr int32_t STATUS_UNCHANGED = 2;

/// An `env` import of the Emscripten build answered by the host.
struct EnvStub {
    const char* name;
    size_t params;
    size_t results;
};

constexpr std::array<EnvStub, 8> ENV_STUBS = {{
    {"emscripten_notify_memory_growth", 1, 0},
    {"__syscall_getcwd", 2, 1},
    {"__syscall_chdir", 1, 1},
    {"__syscall_faccessat", 4, 1},
    {"__syscall_statfs64", 3, 1},
    {"__syscall_unlinkat", 3, 1},
    {"__syscall_readlinkat", 4, 1},
    {"__syscall_getdents64", 3, 1},
}};

// Every syscall fails; the formatter never needs a filesystem.
auto env_stub(void* /*env*/, wasmtime_caller_t* /*caller*/, const wasmtime_val_t* /*args*/,
              size_t /*nargs*/, wasmtime_val_t* results, size_t nresults) -> wasm_trap_t* {
    for (size_t i = 0; i < nresults; ++i) {
        results[i].kind = WASMTIME_I32;
        results[i].of.i32 = -1;
    }
    return nullptr;
}

auto i32_vec(size_t count) -> wasm_valtype_vec_t {
    wasm_valtype_vec_t vec;
    if (count == 0) {
        wasm_valtype_vec_new_empty(&vec);
        return vec;
    }
    std::vector<wasm_valtype_t*> types;
    types.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        types.push_back(wasm_valtype_new_i32());
    }
    wasm_valtype_vec_new(&vec, types.size(), types.data());
    return vec;
}

auto take_error(wasmtime_error_t* error) -> std::string {
    wasm_name_t message;
    wasmtime_error_message(error, &message);
    std::string text(message.data, message.size);
    wasm_byte_vec_delete(&message);
    wasmtime_error_delete(error);
    return text;
}

auto take_trap(wasm_trap_t* trap) -> std::string {
    wasm_message_t message;
    wasm_trap_message(trap, &message);
    std::string text(message.data, message.size);
    wasm_byte_vec_delete(&message);
    wasm_trap_delete(trap);
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

struct CallFailure {
    bool trapped;
    std::string message;
};

auto invoke(wasmtime_context_t* context, const wasmtime_func_t& func,
            std::initializer_list<int32_t> args, size_t nresults) -> Result<int32_t, CallFailure> {
    std::array<wasmtime_val_t, 4> params{};
    size_t nargs = 0;
    for (int32_t arg : args) {
        params[nargs].kind = WASMTIME_I32;
        params[nargs].of.i32 = arg;
        ++nargs;
    }
    wasmtime_val_t result{};
    wasm_trap_t* trap = nullptr;
    wasmtime_error_t* error = wasmtime_func_call(context, &func, params.data(), nargs, &result,
                                                 nresults, &trap);
    if (error) {
        return CallFailure{false, take_error(error)};
    }
    if (trap) {
        return CallFailure{true, take_trap(trap)};
    }
    if (nresults == 0) {
        return 0;
    }
    if (result.kind != WASMTIME_I32) {
        return CallFailure{false, "export returned a non-i32 value"};
    }
    return result.of.i32;
}

auto contract(std::string message) -> FormatError {
    return FormatError::make(ErrorKind::ContractViolation, std::move(message));
}

} // namespace

auto instance_state_name(InstanceState state) -> std::string_view {
    switch (state) {
    case InstanceState::Uninitialized:
        return "uninitialized";
    case InstanceState::Initialized:
        return "initialized";
    case InstanceState::StyleSet:
        return "style-set";
    case InstanceState::Ready:
        return "ready";
    case InstanceState::Poisoned:
        return "poisoned";
    }
    return "unknown";
}

// ============================================================================
// Module Loading
// ============================================================================

namespace {

auto to_bytes(const std::vector<char>& data) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(data.begin(), data.end());
}

auto wat_to_wasm(const std::vector<char>& text) -> Result<std::vector<uint8_t>, std::string> {
    wasm_byte_vec_t wasm;
    if (wasmtime_error_t* error = wasmtime_wat2wasm(text.data(), text.size(), &wasm)) {
        return take_error(error);
    }
    std::vector<uint8_t> bytes(wasm.data, wasm.data + wasm.size);
    wasm_byte_vec_delete(&wasm);
    return bytes;
}

} // namespace

auto load_module_bytes(const std::string& name, const std::vector<fs::path>& dirs)
    -> Result<std::vector<uint8_t>, std::string> {
    std::string tried;
    for (const auto& dir : dirs) {
        fs::path compressed = dir / (name + ".wasm.zst");
        fs::path binary = dir / (name + ".wasm");
        fs::path text = dir / (name + ".wat");

        if (fs::exists(compressed)) {
            auto raw = ffi::read_file_bytes(compressed);
            if (is_err(raw)) {
                return unwrap_err(raw);
            }
            auto decompressed = ffi::decompress_zstd(unwrap(raw));
            if (is_err(decompressed)) {
                return compressed.string() + ": " + unwrap_err(decompressed);
            }
            return to_bytes(unwrap(decompressed));
        }
        if (fs::exists(binary)) {
            auto raw = ffi::read_file_bytes(binary);
            if (is_err(raw)) {
                return unwrap_err(raw);
            }
            return to_bytes(unwrap(raw));
        }
        if (fs::exists(text)) {
            auto raw = ffi::read_file_bytes(text);
            if (is_err(raw)) {
                return unwrap_err(raw);
            }
            auto wasm = wat_to_wasm(unwrap(raw));
            if (is_err(wasm)) {
                return text.string() + ": " + unwrap_err(wasm);
            }
            return std::move(unwrap(wasm));
        }
        tried += "\n  " + dir.string();
    }
    return "module '" + name + "' not found in:" + tried;
}

// ============================================================================
// Runtime and Instances
// ============================================================================

struct SandboxHost::Runtime {
    wasm_engine_t* engine = nullptr;
    wasmtime_module_t* module = nullptr;
    wasmtime_linker_t* linker = nullptr;

    Runtime() = default;
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    ~Runtime() {
        if (linker) {
            wasmtime_linker_delete(linker);
        }
        if (module) {
            wasmtime_module_delete(module);
        }
        if (engine) {
            wasm_engine_delete(engine);
        }
    }
};

struct SandboxHost::Instance {
    wasmtime_store_t* store = nullptr;
    wasmtime_context_t* context = nullptr;
    wasmtime_instance_t instance{};
    wasmtime_memory_t memory{};
    std::array<wasmtime_func_t, EXPORT_NAMES.size()> exports{};
    InstanceState state = InstanceState::Uninitialized;
    std::string style;

    Instance() = default;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    ~Instance() {
        if (store) {
            wasmtime_store_delete(store);
        }
    }

    [[nodiscard]] auto memory_span() const -> std::pair<uint8_t*, size_t> {
        return {wasmtime_memory_data(context, &memory), wasmtime_memory_data_size(context, &memory)};
    }

    [[nodiscard]] auto in_bounds(int32_t ptr, size_t len) const -> bool {
        auto offset = static_cast<size_t>(static_cast<uint32_t>(ptr));
        size_t size = memory_span().second;
        return offset <= size && len <= size - offset;
    }
};

SandboxHost::SandboxHost(std::string module_name, size_t pool_size,
                         std::vector<fs::path> explicit_dirs)
    : module_name_(std::move(module_name)), pool_size_(std::max<size_t>(pool_size, 1)),
      search_dirs_(ffi::backend_search_dirs(explicit_dirs)) {}

SandboxHost::~SandboxHost() {
    // Stores reference the engine.
    idle_.clear();
    runtime_.reset();
}

void SandboxHost::compile() {
    auto bytes = load_module_bytes(module_name_, search_dirs_);
    if (is_err(bytes)) {
        unavailable_reason_ = unwrap_err(bytes);
    } else {
        auto runtime = make_box<Runtime>();
        runtime->engine = wasm_engine_new();
        const auto& wasm = unwrap(bytes);

        wasmtime_error_t* error =
            wasmtime_module_new(runtime->engine, wasm.data(), wasm.size(), &runtime->module);
        if (!error) {
            runtime->linker = wasmtime_linker_new(runtime->engine);
            error = wasmtime_linker_define_wasi(runtime->linker);
        }
        for (const auto& stub : ENV_STUBS) {
            if (error) {
                break;
            }
            wasm_valtype_vec_t params = i32_vec(stub.params);
            wasm_valtype_vec_t results = i32_vec(stub.results);
            wasm_functype_t* type = wasm_functype_new(&params, &results);
            error = wasmtime_linker_define_func(runtime->linker, "env", 3, stub.name,
                                                std::strlen(stub.name), type, env_stub, nullptr,
                                                nullptr);
            wasm_functype_delete(type);
        }

        if (!error) {
            runtime_ = std::move(runtime);
            POLYFMT_LOG_DEBUG("sandbox", "module '" << module_name_ << "' compiled ("
                                                    << wasm.size() << " bytes)");
            return;
        }
        unavailable_reason_ = take_error(error);
    }

    POLYFMT_LOG_WARN("sandbox", "module '" << module_name_ << "' unavailable, files it handles "
                                           << "are left unchanged: " << unavailable_reason_);
}

auto SandboxHost::is_available() -> bool {
    std::call_once(compile_once_, [this] { compile(); });
    if (!runtime_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return !retired_;
}

auto SandboxHost::unavailable_reason() const -> std::string {
    if (!runtime_) {
        return unavailable_reason_;
    }
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return retired_reason_;
}

auto SandboxHost::instantiate() -> backend::FormatResult<Box<Instance>> {
    auto inst = make_box<Instance>();
    inst->store = wasmtime_store_new(runtime_->engine, nullptr, nullptr);
    inst->context = wasmtime_store_context(inst->store);

    if (wasmtime_error_t* error = wasmtime_context_set_wasi(inst->context, wasi_config_new())) {
        return contract("WASI setup failed: " + take_error(error));
    }

    wasm_trap_t* trap = nullptr;
    wasmtime_error_t* error = wasmtime_linker_instantiate(runtime_->linker, inst->context,
                                                          runtime_->module, &inst->instance, &trap);
    if (error) {
        return contract("instantiation failed: " + take_error(error));
    }
    if (trap) {
        traps_++;
        return FormatError::make(ErrorKind::SandboxTrap,
                                 "trap during instantiation: " + take_trap(trap));
    }

    wasmtime_extern_t item;
    if (!wasmtime_instance_export_get(inst->context, &inst->instance, "memory", 6, &item) ||
        item.kind != WASMTIME_EXTERN_MEMORY) {
        return contract("module does not export 'memory'");
    }
    inst->memory = item.of.memory;

    for (size_t i = 0; i < EXPORT_NAMES.size(); ++i) {
        const char* name = EXPORT_NAMES[i];
        if (!wasmtime_instance_export_get(inst->context, &inst->instance, name, std::strlen(name),
                                          &item) ||
            item.kind != WASMTIME_EXTERN_FUNC) {
            return contract(std::string("module does not export '") + name + "'");
        }
        inst->exports[i] = item.of.func;
    }

    // Reactor modules run their constructors from `_initialize`.
    if (wasmtime_instance_export_get(inst->context, &inst->instance, "_initialize", 11, &item) &&
        item.kind == WASMTIME_EXTERN_FUNC) {
        auto started = invoke(inst->context, item.of.func, {}, 0);
        if (is_err(started)) {
            auto& failure = unwrap_err(started);
            if (failure.trapped) {
                traps_++;
                return FormatError::make(ErrorKind::SandboxTrap, "_initialize: " + failure.message);
            }
            return contract("_initialize: " + failure.message);
        }
    }

    auto initialized = call(*inst, Export::Init, {}, 0);
    if (is_err(initialized)) {
        return std::move(unwrap_err(initialized));
    }

    inst->state = InstanceState::Initialized;
    instantiations_++;
    POLYFMT_LOG_DEBUG("sandbox", "instance created (" << instantiations_.load() << " total)");
    return inst;
}

// ============================================================================
// Instance Pool
// ============================================================================

auto SandboxHost::checkout() -> backend::FormatResult<Box<Instance>> {
    {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        pool_cv_.wait(lock, [this] { return retired_ || !idle_.empty() || live_ < pool_size_; });
        if (retired_) {
            return FormatError::make(ErrorKind::BackendUnavailable,
                                     module_name_ + ": " + retired_reason_);
        }
        if (!idle_.empty()) {
            Box<Instance> inst = std::move(idle_.back());
            idle_.pop_back();
            return inst;
        }
        live_++;
    }

    auto created = instantiate();
    if (is_err(created)) {
        const std::string reason = unwrap_err(created).to_string();
        retire(reason);
        return FormatError::make(ErrorKind::BackendUnavailable, module_name_ + ": " + reason);
    }
    return created;
}

void SandboxHost::retire(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    live_--;
    if (!retired_) {
        retired_ = true;
        retired_reason_ = reason;
        POLYFMT_LOG_WARN("sandbox", "module '" << module_name_ << "' cannot be instantiated, "
                                               << "files it handles are left unchanged: "
                                               << reason);
    }
    pool_cv_.notify_all();
}

void SandboxHost::checkin(Box<Instance> instance) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (instance->state == InstanceState::Poisoned) {
        POLYFMT_LOG_DEBUG("sandbox", "discarding poisoned instance");
        instance.reset();
        live_--;
    } else {
        idle_.push_back(std::move(instance));
    }
    pool_cv_.notify_one();
}

auto SandboxHost::live_instances() const -> size_t {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return live_;
}

auto SandboxHost::stats() const -> SandboxStats {
    SandboxStats result;
    result.instantiations = instantiations_.load();
    result.style_writes = style_writes_.load();
    result.traps = traps_.load();
    result.allocs = allocs_.load();
    result.frees = frees_.load();
    return result;
}

// ============================================================================
// Calls
// ============================================================================

auto SandboxHost::call(Instance& inst, Export fn, std::initializer_list<int32_t> args,
                       size_t nresults) -> backend::FormatResult<int32_t> {
    auto index = static_cast<size_t>(fn);
    auto result = invoke(inst.context, inst.exports[index], args, nresults);
    if (is_ok(result)) {
        return unwrap(result);
    }

    auto& failure = unwrap_err(result);
    inst.state = InstanceState::Poisoned;
    std::string message = std::string(EXPORT_NAMES[index]) + ": " + failure.message;
    if (failure.trapped) {
        traps_++;
        POLYFMT_LOG_DEBUG("sandbox", "trap in " << message);
        return FormatError::make(ErrorKind::SandboxTrap, std::move(message));
    }
    return contract(std::move(message));
}

auto SandboxHost::write_bytes(Instance& inst, std::string_view bytes)
    -> backend::FormatResult<int32_t> {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        return contract("input of " + std::to_string(bytes.size()) + " bytes exceeds module limits");
    }
    auto size = static_cast<int32_t>(std::max<size_t>(bytes.size(), 1));
    auto allocated = call(inst, Export::Malloc, {size}, 1);
    if (is_err(allocated)) {
        return allocated;
    }
    int32_t ptr = unwrap(allocated);
    if (ptr == 0) {
        inst.state = InstanceState::Poisoned;
        return contract("malloc returned null for " + std::to_string(size) + " bytes");
    }
    allocs_++;

    if (!inst.in_bounds(ptr, bytes.size())) {
        inst.state = InstanceState::Poisoned;
        return contract("malloc returned an out-of-bounds pointer");
    }
    if (!bytes.empty()) {
        std::memcpy(inst.memory_span().first + static_cast<uint32_t>(ptr), bytes.data(),
                    bytes.size());
    }
    return ptr;
}

auto SandboxHost::release(Instance& inst, int32_t ptr) -> backend::FormatResult<int32_t> {
    auto freed = call(inst, Export::Free, {ptr}, 0);
    if (is_ok(freed)) {
        frees_++;
    }
    return freed;
}

auto SandboxHost::read_result(Instance& inst) -> backend::FormatResult<std::string> {
    auto ptr = call(inst, Export::ResultPtr, {}, 1);
    if (is_err(ptr)) {
        return std::move(unwrap_err(ptr));
    }
    auto len = call(inst, Export::ResultLen, {}, 1);
    if (is_err(len)) {
        return std::move(unwrap_err(len));
    }
    if (unwrap(len) < 0 || !inst.in_bounds(unwrap(ptr), static_cast<size_t>(unwrap(len)))) {
        return contract("result buffer lies outside module memory");
    }

    const auto* data = inst.memory_span().first + static_cast<uint32_t>(unwrap(ptr));
    std::string text(reinterpret_cast<const char*>(data), static_cast<size_t>(unwrap(len)));

    auto freed = call(inst, Export::FreeResult, {}, 0);
    if (is_err(freed)) {
        return std::move(unwrap_err(freed));
    }
    return text;
}

auto SandboxHost::apply_style(Instance& inst, const std::string& style)
    -> backend::FormatResult<int32_t> {
    if (inst.state != InstanceState::Initialized && inst.style == style) {
        return STATUS_OK;
    }

    auto ptr = write_bytes(inst, style);
    if (is_err(ptr)) {
        return ptr;
    }
    auto status =
        call(inst, Export::SetStyle, {unwrap(ptr), static_cast<int32_t>(style.size())}, 1);
    if (is_err(status)) {
        return status;
    }
    auto released = release(inst, unwrap(ptr));
    if (is_err(released)) {
        return released;
    }
    if (unwrap(status) != STATUS_OK) {
        return contract("module rejected style " + style);
    }

    inst.state = InstanceState::StyleSet;
    inst.style = style;
    style_writes_++;
    return STATUS_OK;
}

auto SandboxHost::run(Instance& inst, std::string_view text, std::string_view filename,
                      const std::string& style) -> backend::FormatResult<std::string> {
    auto styled = apply_style(inst, style);
    if (is_err(styled)) {
        return std::move(unwrap_err(styled));
    }

    auto src = write_bytes(inst, text);
    if (is_err(src)) {
        return std::move(unwrap_err(src));
    }
    auto name = write_bytes(inst, filename);
    if (is_err(name)) {
        return std::move(unwrap_err(name));
    }

    auto status = call(inst, Export::Format,
                       {unwrap(src), static_cast<int32_t>(text.size()), unwrap(name),
                        static_cast<int32_t>(filename.size())},
                       1);
    if (is_err(status)) {
        // A trapped instance is discarded with its whole heap.
        return std::move(unwrap_err(status));
    }
    for (int32_t ptr : {unwrap(src), unwrap(name)}) {
        auto released = release(inst, ptr);
        if (is_err(released)) {
            return std::move(unwrap_err(released));
        }
    }
    inst.state = InstanceState::Ready;

    switch (unwrap(status)) {
    case STATUS_OK:
        return read_result(inst);
    case STATUS_ERROR: {
        auto message = read_result(inst);
        if (is_err(message)) {
            return message;
        }
        return FormatError::make(ErrorKind::ParseFailure, unwrap(message));
    }
    case STATUS_UNCHANGED:
        return std::string(text);
    default:
        return contract("wasm_format returned status " + std::to_string(unwrap(status)));
    }
}

auto SandboxHost::format(std::string_view text, std::string_view filename,
                         const std::string& style) -> backend::FormatResult<std::string> {
    if (!is_available()) {
        return FormatError::make(ErrorKind::BackendUnavailable,
                                 module_name_ + ": " + unavailable_reason());
    }

    auto lease = checkout();
    if (is_err(lease)) {
        return std::move(unwrap_err(lease));
    }
    Box<Instance> inst = std::move(unwrap(lease));
    auto result = run(*inst, text, filename, style);
    checkin(std::move(inst));
    return result;
}

} // namespace polyfmt::sandbox
