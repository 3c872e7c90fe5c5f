//! # Backend Library Loader
//!
//! Locates backend artifacts (shared libraries and WASM modules) and opens
//! shared libraries with `dlopen`. Artifacts may ship compressed with zstd;
//! libraries are then decompressed into a cache directory and validated by a
//! CRC32C hash of the compressed file on later runs.
//!
//! ## Loading Flow
//!
//! ```text
//! 1. Look for <dir>/libfoo.so.zst, then <dir>/libfoo.so, in each search dir
//! 2. Compressed: reuse cache/backends/libfoo.so if its .hash matches,
//!    otherwise decompress and write the hash next to it
//! 3. dlopen the resolved file
//! ```
//!
//! ## Search Order
//!
//! 1. Directories given explicitly
//! 2. `POLYFMT_BACKEND_DIR` environment variable
//! 3. `<exe_dir>/backends/`
//! 4. `<exe_dir>/../lib/polyfmt/backends/`

#ifndef POLYFMT_FFI_LIBRARY_LOADER_HPP
#define POLYFMT_FFI_LIBRARY_LOADER_HPP

#include "common.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace polyfmt::ffi {

/// Environment variable naming an extra backend directory.
constexpr const char* BACKEND_DIR_ENV = "POLYFMT_BACKEND_DIR";

/// Directory containing the running executable.
[[nodiscard]] auto exe_dir() -> fs::path;

/// Full search path: `explicit_dirs`, then the environment, then the
/// directories relative to the executable.
[[nodiscard]] auto backend_search_dirs(const std::vector<fs::path>& explicit_dirs)
    -> std::vector<fs::path>;

/// Reads a whole file.
[[nodiscard]] auto read_file_bytes(const fs::path& path) -> Result<std::vector<char>, std::string>;

/// Decompresses one zstd frame.
[[nodiscard]] auto decompress_zstd(const std::vector<char>& compressed)
    -> Result<std::vector<char>, std::string>;

/// Opens backend shared libraries by short name (`goffi` → `libgoffi.so`).
///
/// Handles stay open until the loader is destroyed. `load` may be called from
/// several threads.
class LibraryLoader {
public:
    explicit LibraryLoader(std::vector<fs::path> search_dirs);
    ~LibraryLoader();

    // Non-copyable
    LibraryLoader(const LibraryLoader&) = delete;
    LibraryLoader& operator=(const LibraryLoader&) = delete;

    /// Opens a library, returning its handle or a description of every
    /// location tried.
    auto load(const std::string& name) -> Result<void*, std::string>;

    /// Looks up an exported symbol; null when absent.
    static auto symbol(void* handle, const char* name) -> void*;

    [[nodiscard]] auto search_dirs() const -> const std::vector<fs::path>& {
        return search_dirs_;
    }

    [[nodiscard]] auto cache_dir() const -> const fs::path& {
        return cache_dir_;
    }

private:
    auto decompress_to_cache(const fs::path& zst_path, const fs::path& cache_path)
        -> Result<fs::path, std::string>;
    auto is_cache_valid(const fs::path& zst_path, const fs::path& cache_path) -> bool;

    static auto dl_open(const fs::path& path) -> void*;
    static void dl_close(void* handle);
    static auto dl_error() -> std::string;

    std::vector<fs::path> search_dirs_;
    fs::path cache_dir_;
    std::mutex mutex_;
    std::unordered_map<std::string, void*> handles_;
};

} // namespace polyfmt::ffi

#endif // POLYFMT_FFI_LIBRARY_LOADER_HPP
