//! # Backend Library Loader Implementation
//!
//! Linux dynamic loading with zstd decompression and a CRC32C-validated disk
//! cache.

#include "ffi/library_loader.hpp"

#include "common/crc32c.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <dlfcn.h>
#include <unistd.h>
#include <zstd.h>

namespace polyfmt::ffi {

// ============================================================================
// Paths and files
// ============================================================================

auto exe_dir() -> fs::path {
    char buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        return fs::path(buf).parent_path();
    }
    return fs::current_path();
}

auto backend_search_dirs(const std::vector<fs::path>& explicit_dirs) -> std::vector<fs::path> {
    std::vector<fs::path> dirs = explicit_dirs;

    const char* env = std::getenv(BACKEND_DIR_ENV);
    if (env && *env) {
        dirs.emplace_back(env);
    }

    auto exe = exe_dir();
    dirs.push_back(exe / "backends");
    dirs.push_back(exe / ".." / "lib" / "polyfmt" / "backends");
    return dirs;
}

auto read_file_bytes(const fs::path& path) -> Result<std::vector<char>, std::string> {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return "cannot open " + path.string();
    }
    auto size = static_cast<size_t>(in.tellg());
    in.seekg(0);
    std::vector<char> bytes(size);
    in.read(bytes.data(), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(in.gcount()) != size) {
        return "short read from " + path.string();
    }
    return bytes;
}

auto decompress_zstd(const std::vector<char>& compressed)
    -> Result<std::vector<char>, std::string> {
    auto content_size = ZSTD_getFrameContentSize(compressed.data(), compressed.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR) {
        return std::string("not a zstd frame");
    }

    if (content_size != ZSTD_CONTENTSIZE_UNKNOWN) {
        std::vector<char> out(static_cast<size_t>(content_size));
        size_t result = ZSTD_decompress(out.data(), out.size(), compressed.data(), compressed.size());
        if (ZSTD_isError(result)) {
            return std::string("zstd decompression failed: ") + ZSTD_getErrorName(result);
        }
        out.resize(result);
        return out;
    }

    // Frame without a recorded size: stream it out
    ZSTD_DStream* stream = ZSTD_createDStream();
    if (!stream) {
        return std::string("cannot allocate zstd stream");
    }
    std::vector<char> out;
    std::vector<char> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{compressed.data(), compressed.size(), 0};
    size_t status = 1;
    while (input.pos < input.size && status != 0) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        status = ZSTD_decompressStream(stream, &output, &input);
        if (ZSTD_isError(status)) {
            std::string message = std::string("zstd decompression failed: ") + ZSTD_getErrorName(status);
            ZSTD_freeDStream(stream);
            return message;
        }
        out.insert(out.end(), chunk.data(), chunk.data() + output.pos);
    }
    ZSTD_freeDStream(stream);
    return out;
}

// ============================================================================
// Platform dynamic library operations
// ============================================================================

auto LibraryLoader::dl_open(const fs::path& path) -> void* {
    return dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
}

void LibraryLoader::dl_close(void* handle) {
    if (!handle)
        return;
    dlclose(handle);
}

auto LibraryLoader::dl_error() -> std::string {
    const char* err = dlerror();
    return err ? err : "";
}

auto LibraryLoader::symbol(void* handle, const char* name) -> void* {
    return dlsym(handle, name);
}

// ============================================================================
// Loader lifecycle
// ============================================================================

LibraryLoader::LibraryLoader(std::vector<fs::path> search_dirs)
    : search_dirs_(std::move(search_dirs)), cache_dir_(exe_dir() / "cache" / "backends") {}

LibraryLoader::~LibraryLoader() {
    for (auto& [name, handle] : handles_) {
        dl_close(handle);
    }
    handles_.clear();
}

auto LibraryLoader::load(const std::string& name) -> Result<void*, std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto it = handles_.find(name); it != handles_.end()) {
        return it->second;
    }

    const std::string file_name = "lib" + name + ".so";
    const std::string zst_name = file_name + ".zst";
    std::ostringstream searched;

    for (const auto& dir : search_dirs_) {
        fs::path zst_path = dir / zst_name;
        fs::path raw_path = dir / file_name;
        fs::path load_path;

        std::error_code ec;
        if (fs::exists(zst_path, ec)) {
            fs::path cache_path = cache_dir_ / file_name;
            if (is_cache_valid(zst_path, cache_path)) {
                load_path = cache_path;
            } else {
                auto decompressed = decompress_to_cache(zst_path, cache_path);
                if (is_err(decompressed)) {
                    return unwrap_err(decompressed);
                }
                load_path = unwrap(decompressed);
            }
        } else if (fs::exists(raw_path, ec)) {
            load_path = raw_path;
        } else {
            searched << "\n    " << raw_path.string() << "[.zst]";
            continue;
        }

        POLYFMT_LOG_DEBUG("ffi", "loading " << load_path.string());
        void* handle = dl_open(load_path);
        if (!handle) {
            return "failed to load " + load_path.string() + ": " + dl_error();
        }
        handles_.emplace(name, handle);
        return handle;
    }

    return "library '" + file_name + "' not found; searched:" + searched.str();
}

// ============================================================================
// Compression / Cache
// ============================================================================

auto LibraryLoader::is_cache_valid(const fs::path& zst_path, const fs::path& cache_path) -> bool {
    std::error_code ec;
    if (!fs::exists(cache_path, ec))
        return false;

    // cache_path + ".hash" stores the CRC32C of the .zst file
    fs::path hash_path = cache_path;
    hash_path += ".hash";

    std::ifstream hf(hash_path);
    if (!hf)
        return false;
    std::string stored_hash;
    std::getline(hf, stored_hash);

    std::string current_hash = crc32c_file(zst_path.string());
    return !current_hash.empty() && current_hash == stored_hash;
}

auto LibraryLoader::decompress_to_cache(const fs::path& zst_path, const fs::path& cache_path)
    -> Result<fs::path, std::string> {
    auto compressed = read_file_bytes(zst_path);
    if (is_err(compressed)) {
        return unwrap_err(compressed);
    }
    auto decompressed = decompress_zstd(unwrap(compressed));
    if (is_err(decompressed)) {
        return zst_path.string() + ": " + unwrap_err(decompressed);
    }
    const auto& bytes = unwrap(decompressed);

    std::error_code ec;
    fs::create_directories(cache_path.parent_path(), ec);
    if (ec) {
        return "cannot create " + cache_path.parent_path().string() + ": " + ec.message();
    }

    std::ofstream out(cache_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot write " + cache_path.string();
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return "cannot write " + cache_path.string();
    }

    std::string hash = crc32c_file(zst_path.string());
    if (!hash.empty()) {
        fs::path hash_path = cache_path;
        hash_path += ".hash";
        std::ofstream hf(hash_path);
        if (hf) {
            hf << hash << "\n";
        }
    }

    POLYFMT_LOG_DEBUG("ffi", "decompressed " << zst_path.string() << " to " << cache_path.string());
    return cache_path;
}

} // namespace polyfmt::ffi
