//! # CRC32C Content Hash
//!
//! CRC32C (Castagnoli polynomial) used to validate decompressed backend
//! artifacts in the on-disk cache. Not a cryptographic hash; it only detects
//! a stale or truncated cache entry.
//!
//! ## Usage
//!
//! ```cpp
//! #include "common/crc32c.hpp"
//!
//! std::string key = polyfmt::crc32c_hex(bytes.data(), bytes.size());
//! std::string on_disk = polyfmt::crc32c_file(cached_path);
//! ```

#ifndef POLYFMT_COMMON_CRC32C_HPP
#define POLYFMT_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace polyfmt {

// ============================================================================
// Lookup Table
// ============================================================================

/// Reflected form of the Castagnoli polynomial 0x1EDC6F41.
inline constexpr uint32_t CRC32C_POLY_REFLECTED = 0x82F63B78;

/// Builds the byte-wise lookup table at compile time.
[[nodiscard]] constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32C_POLY_REFLECTED : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

// ============================================================================
// Hash Functions
// ============================================================================

/// Computes the CRC32C of a byte range.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

/// Returns a 16-character hex key: the CRC32C in the high half, the low 32
/// bits of the length in the low half.
[[nodiscard]] inline std::string crc32c_hex(const void* data, size_t len) {
    uint64_t combined =
        (static_cast<uint64_t>(crc32c(data, len)) << 32) | static_cast<uint64_t>(len & 0xFFFFFFFF);

    static constexpr char HEX_CHARS[] = "0123456789abcdef";
    std::string hex(16, '0');
    for (int i = 15; i >= 0; --i) {
        hex[static_cast<size_t>(i)] = HEX_CHARS[combined & 0xF];
        combined >>= 4;
    }
    return hex;
}

/// Hashes a whole file with `crc32c_hex`.
///
/// Returns an empty string if the file cannot be read.
[[nodiscard]] std::string crc32c_file(const std::string& file_path);

} // namespace polyfmt

#endif // POLYFMT_COMMON_CRC32C_HPP
