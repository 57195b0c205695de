//! # Bound Values
//!
//! The typed output of a successful bind: a plain value tree whose shape
//! matches the schema exactly. A `BoundValue` is owned by the caller and
//! holds no reference to the input or the schema.
//!
//! ## Value Kinds
//!
//! | Schema | C++ Storage |
//! |--------|-------------|
//! | `int32` | `int32_t` |
//! | `int64` | `int64_t` |
//! | `float64` | `double` |
//! | `boolean` | `bool` |
//! | `string` | `std::string` |
//! | `timestamp` | `Timestamp` |
//! | `list_of(t)` | `BoundList` |
//! | `set_of(t)` | `BoundSet` |
//! | `object(name)` | `BoundObject` |
//! | absent or null optional field | `NoValue` |
//!
//! ## Presence
//!
//! Every declared field of an object appears in its `BoundObject`, in
//! declared order, with a `FieldState` telling whether it was present,
//! explicitly `null`, or missing from the input.
//!
//! ```cpp
//! const auto& order = result.as_object();
//! if (order.state("age") == FieldState::Null) { ... }
//! int64_t id = order.get("id").as_int64();
//! ```

#pragma once

#include "bind/timestamp.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace strictjson::bind {

struct BoundValue;
struct BoundField;

/// Marker for a field with no value (absent, or an allowed `null`).
struct NoValue {
    auto operator==(const NoValue&) const -> bool {
        return true;
    }
};

/// An ordered collection; duplicates kept.
struct BoundList {
    std::vector<BoundValue> items;

    [[nodiscard]] auto size() const -> size_t {
        return items.size();
    }

    auto operator==(const BoundList& other) const -> bool;
};

/// A de-duplicated collection, in first-occurrence order.
///
/// Equality ignores order.
struct BoundSet {
    std::vector<BoundValue> items;

    [[nodiscard]] auto size() const -> size_t {
        return items.size();
    }

    [[nodiscard]] auto contains(const BoundValue& value) const -> bool;

    auto operator==(const BoundSet& other) const -> bool;
};

/// Presence of a declared field in the input.
enum class FieldState : uint8_t {
    Present, ///< Present with a non-null value
    Null,    ///< Present as an explicit `null` (nullable fields only)
    Missing  ///< Absent from the input (optional fields only)
};

[[nodiscard]] auto field_state_name(FieldState state) -> const char*;

/// A bound object: every declared field in declared order.
struct BoundObject {
    std::string type_name;
    std::vector<BoundField> fields;

    /// Returns the field named `name`, or `nullptr` if it is not declared.
    [[nodiscard]] auto field(std::string_view name) const -> const BoundField*;

    /// Returns the presence of `name`; undeclared names report `Missing`.
    [[nodiscard]] auto state(std::string_view name) const -> FieldState;

    /// Returns the value of `name`, or a shared `NoValue` value.
    [[nodiscard]] auto get(std::string_view name) const -> const BoundValue&;

    auto operator==(const BoundObject& other) const -> bool;
};

// ============================================================================
// BoundValue
// ============================================================================

/// One node of a bound result.
struct BoundValue {
    using ValueVariant = std::variant<NoValue, int32_t, int64_t, double, bool, std::string,
                                      Timestamp, BoundList, BoundSet, BoundObject>;

    ValueVariant data;

    BoundValue() : data(NoValue{}) {}

    template <typename T>
        requires(!std::is_same_v<std::remove_cvref_t<T>, BoundValue>) &&
                std::is_constructible_v<ValueVariant, T&&>
    BoundValue(T&& value) : data(std::forward<T>(value)) {}

    [[nodiscard]] auto has_value() const -> bool {
        return !std::holds_alternative<NoValue>(data);
    }

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] auto as_int32() const -> int32_t {
        return std::get<int32_t>(data);
    }

    [[nodiscard]] auto as_int64() const -> int64_t {
        return std::get<int64_t>(data);
    }

    [[nodiscard]] auto as_double() const -> double {
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_timestamp() const -> const Timestamp& {
        return std::get<Timestamp>(data);
    }

    [[nodiscard]] auto as_list() const -> const BoundList& {
        return std::get<BoundList>(data);
    }

    [[nodiscard]] auto as_set() const -> const BoundSet& {
        return std::get<BoundSet>(data);
    }

    [[nodiscard]] auto as_object() const -> const BoundObject& {
        return std::get<BoundObject>(data);
    }

    /// Compact JSON-like rendering, used in diagnostics and the lint tool.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const BoundValue& other) const -> bool;
};

/// One declared field of a `BoundObject`.
struct BoundField {
    std::string name;
    FieldState state = FieldState::Missing;
    BoundValue value;

    auto operator==(const BoundField& other) const -> bool;
};

/// Structural hash consistent with `operator==` (set elements hash the
/// same regardless of order).
[[nodiscard]] auto hash_value(const BoundValue& value) -> size_t;

} // namespace strictjson::bind
