//! # Parse Value Types
//!
//! This module provides `JsonValue`, the schema-agnostic intermediate tree
//! produced by the structural parser and consumed once by the binder.
//!
//! ## Features
//!
//! - **Raw numbers**: Numbers keep their exact decimal text; conversion to a
//!   concrete width happens only in the binder, against the declared type
//! - **Null vs. missing**: `Missing` and `Null` are distinct alternatives and
//!   are never conflated
//! - **Ordered objects**: Members keep their input order, with a key index
//!   for constant-time lookup
//! - **Positions**: Every node records the line/column/offset where it started
//!
//! ## Value Kinds
//!
//! | Kind | C++ Storage | Produced by |
//! |------|-------------|-------------|
//! | `Missing` | `JsonValue::Missing` | `JsonObject::get()` for an absent key |
//! | `Null` | `std::monostate` | `null` |
//! | `Bool` | `bool` | `true` / `false` |
//! | `Number` | `JsonNumber` | `-?[0-9]+(\.[0-9]+)?` |
//! | `String` | `std::string` | `"..."` (unescaped, valid UTF-8) |
//! | `Array` | `Box<JsonArray>` | `[...]` |
//! | `Object` | `Box<JsonObject>` | `{...}` |
//!
//! `JsonValue` is move-only: a parse tree is built for one call, handed to
//! the binder and discarded.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strictjson::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;
class JsonObject;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number kept as its source text.
///
/// The tokenizer has already checked the text against the accepted grammar
/// (no exponent, no leading zeros), so `text` is always one of `0`, `-0`,
/// `123`, `-4.50`, and so on.
struct JsonNumber {
    /// The exact source text.
    std::string text;

    /// `true` when the text contains a fractional part.
    bool has_fraction = false;

    [[nodiscard]] auto is_negative() const -> bool {
        return !text.empty() && text[0] == '-';
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// The kind of a `JsonValue`, in variant-index order.
enum class JsonKind : uint8_t {
    Missing,
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/// Returns a lowercase name for a kind, e.g. `"string"`.
[[nodiscard]] auto json_kind_name(JsonKind kind) -> const char*;

/// A parsed JSON value.
///
/// # Example
///
/// ```cpp
/// auto result = parse_json(R"({"tags": ["a", "b"]})", LimitConfig{});
/// const auto& root = unwrap(result);
/// const auto& tags = root.as_object().get("tags");
/// for (const auto& tag : tags.as_array()) {
///     std::cout << tag.as_string() << "\n";
/// }
/// ```
struct JsonValue {
    /// Marker for a key that was not present in its object.
    struct Missing {};

    /// The null type.
    using Null = std::monostate;

    using ValueVariant = std::variant<Missing, Null, bool, JsonNumber, std::string,
                                      Box<JsonArray>, Box<JsonObject>>;

    /// The underlying variant storage.
    ValueVariant data;

    /// Where this value started in the input.
    SourcePos pos;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(Missing) : data(Missing{}) {}
    explicit JsonValue(bool value, SourcePos at = {}) : data(value), pos(at) {}
    explicit JsonValue(JsonNumber value, SourcePos at = {}) : data(std::move(value)), pos(at) {}
    explicit JsonValue(std::string value, SourcePos at = {}) : data(std::move(value)), pos(at) {}
    explicit JsonValue(const char* value, SourcePos at = {}) : data(std::string(value)), pos(at) {}
    explicit JsonValue(JsonArray value, SourcePos at = {});
    explicit JsonValue(JsonObject value, SourcePos at = {});

    /// Creates a `null` value at the given position.
    [[nodiscard]] static auto null_at(SourcePos at) -> JsonValue {
        JsonValue value;
        value.pos = at;
        return value;
    }

    JsonValue(JsonValue&&) noexcept = default;
    auto operator=(JsonValue&&) noexcept -> JsonValue& = default;
    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;
    ~JsonValue();

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto kind() const -> JsonKind {
        return static_cast<JsonKind>(data.index());
    }

    [[nodiscard]] auto kind_name() const -> const char* {
        return json_kind_name(kind());
    }

    [[nodiscard]] auto is_missing() const -> bool {
        return std::holds_alternative<Missing>(data);
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // Accessors throw `std::bad_variant_access` on a kind mismatch; callers
    // check the kind first.

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

    /// Returns the shared immutable `Missing` value.
    [[nodiscard]] static auto missing() -> const JsonValue&;
};

// ============================================================================
// JsonObject
// ============================================================================

/// One `"key": value` pair of an object.
struct JsonMember {
    std::string key;
    SourcePos key_pos;
    JsonValue value;
};

/// A JSON object: members in input order plus a key index.
///
/// Keys are unique; the parser reports a second occurrence of a key as
/// `DuplicateField` instead of inserting it.
class JsonObject {
public:
    JsonObject() = default;

    /// Appends a member. Returns `false` (and leaves the object unchanged)
    /// when the key is already present.
    auto insert(std::string key, SourcePos key_pos, JsonValue value) -> bool;

    /// Returns the member value for `key`, or `nullptr` if absent.
    [[nodiscard]] auto find(std::string_view key) const -> const JsonValue*;

    /// Returns the member value for `key`, or the shared `Missing` value.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue&;

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        return find(key) != nullptr;
    }

    [[nodiscard]] auto size() const -> size_t {
        return members_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return members_.empty();
    }

    [[nodiscard]] auto members() const -> const std::vector<JsonMember>& {
        return members_;
    }

    [[nodiscard]] auto begin() const {
        return members_.begin();
    }

    [[nodiscard]] auto end() const {
        return members_.end();
    }

private:
    std::vector<JsonMember> members_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace strictjson::json
