//! # JSON Value Types
//!
//! The in-memory JSON tree returned by `parse_json`.
//!
//! ## Type Mapping
//!
//! | JSON Type | C++ Storage |
//! |-----------|-------------|
//! | `null` | `std::monostate` |
//! | `true`/`false` | `bool` |
//! | number | `JsonNumber` |
//! | string | `std::string` |
//! | array | `Box<JsonArray>` |
//! | object | `Box<JsonObject>` |
//!
//! Arrays and objects are boxed so the variant stays small; values are
//! move-only.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace polyfmt::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;

/// Keys are kept sorted; the formatter works on tokens, not on this tree,
/// so source key order is never taken from here.
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number in its most precise representation.
///
/// Numbers without a fraction or exponent are integers (`Int64`, or `Uint64`
/// above `INT64_MAX`); everything else is `Double`.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Uint64, Double };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    /// # Panics
    ///
    /// The `as_*` accessors throw `std::bad_variant_access` on a type mismatch;
    /// check with the matching `is_*` first.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    /// Returns the member named `key`, or nullptr if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Human-readable name of the held type, for error messages.
    [[nodiscard]] auto type_name() const -> std::string_view {
        switch (data.index()) {
        case 0:
            return "null";
        case 1:
            return "boolean";
        case 2:
            return "number";
        case 3:
            return "string";
        case 4:
            return "array";
        default:
            return "object";
        }
    }
};

} // namespace polyfmt::json
