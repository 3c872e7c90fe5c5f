//! # Foreign Buffers
//!
//! Move-only owners for memory allocated by a backend library. Each owner
//! calls the library's paired release function exactly once, on whatever path
//! leaves the scope. No pointer into foreign memory survives the owner.

#ifndef POLYFMT_FFI_FOREIGN_BUFFER_HPP
#define POLYFMT_FFI_FOREIGN_BUFFER_HPP

#include "ffi/foreign_abi.h"

#include <cstddef>
#include <string>
#include <utility>

namespace polyfmt::ffi {

/// A NUL-terminated string returned by a format entry point.
class ForeignString {
public:
    ForeignString() = default;
    ForeignString(char* ptr, PolyfmtFreeStringFn release) noexcept : ptr_(ptr), release_(release) {}

    ~ForeignString() {
        reset();
    }

    ForeignString(const ForeignString&) = delete;
    ForeignString& operator=(const ForeignString&) = delete;

    ForeignString(ForeignString&& other) noexcept
        : ptr_(std::exchange(other.ptr_, nullptr)), release_(other.release_) {}

    ForeignString& operator=(ForeignString&& other) noexcept {
        if (this != &other) {
            reset();
            ptr_ = std::exchange(other.ptr_, nullptr);
            release_ = other.release_;
        }
        return *this;
    }

    [[nodiscard]] auto is_null() const -> bool {
        return ptr_ == nullptr;
    }

    /// Copies the bytes into host memory.
    [[nodiscard]] auto to_string() const -> std::string {
        return ptr_ ? std::string(ptr_) : std::string();
    }

    void reset() {
        if (ptr_ && release_) {
            release_(ptr_);
        }
        ptr_ = nullptr;
    }

private:
    char* ptr_ = nullptr;
    PolyfmtFreeStringFn release_ = nullptr;
};

/// An array of strings returned by a batch entry point. Released as a whole
/// with `FreeStringArray`, which frees every element and the array.
class ForeignStringArray {
public:
    ForeignStringArray() = default;
    ForeignStringArray(char** arr, size_t count, PolyfmtFreeStringArrayFn release) noexcept
        : arr_(arr), count_(count), release_(release) {}

    ~ForeignStringArray() {
        reset();
    }

    ForeignStringArray(const ForeignStringArray&) = delete;
    ForeignStringArray& operator=(const ForeignStringArray&) = delete;

    ForeignStringArray(ForeignStringArray&& other) noexcept
        : arr_(std::exchange(other.arr_, nullptr)), count_(std::exchange(other.count_, 0)),
          release_(other.release_) {}

    ForeignStringArray& operator=(ForeignStringArray&& other) noexcept {
        if (this != &other) {
            reset();
            arr_ = std::exchange(other.arr_, nullptr);
            count_ = std::exchange(other.count_, 0);
            release_ = other.release_;
        }
        return *this;
    }

    [[nodiscard]] auto is_null() const -> bool {
        return arr_ == nullptr;
    }

    [[nodiscard]] auto size() const -> size_t {
        return count_;
    }

    /// Element `index`; null when the library reported nothing for it.
    [[nodiscard]] auto at(size_t index) const -> const char* {
        return arr_ && index < count_ ? arr_[index] : nullptr;
    }

    void reset() {
        if (arr_ && release_) {
            release_(arr_, count_);
        }
        arr_ = nullptr;
        count_ = 0;
    }

private:
    char** arr_ = nullptr;
    size_t count_ = 0;
    PolyfmtFreeStringArrayFn release_ = nullptr;
};

} // namespace polyfmt::ffi

#endif // POLYFMT_FFI_FOREIGN_BUFFER_HPP
