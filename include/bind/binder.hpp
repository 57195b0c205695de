//! # Strict Binder
//!
//! Maps a parsed `JsonValue` onto a `CompiledSchema`, enforcing every
//! semantic rule, and produces a `BoundValue` or the first violation.
//!
//! ## Rules
//!
//! | Declared | Accepts | Rejects with |
//! |----------|---------|--------------|
//! | `int32` / `int64` | Numbers with no fractional part, in range | `TypeMismatch` (quoted numbers included) |
//! | `float64` | Any number | `TypeMismatch` |
//! | `boolean` | `true` / `false` | `TypeMismatch` (`"true"` and `1` included) |
//! | `string` | Strings, verbatim | `TypeMismatch`, `StringTooLong` |
//! | `timestamp` | `YYYY-MM-DDTHH:mm:ss(.fff)?Z` | `InvalidDateFormat`, or `TypeMismatch` for non-strings |
//! | `list_of` / `set_of` | Arrays only, never a bare value | `TypeMismatch` |
//! | `object` | Objects with exactly the declared keys | `UnknownField`, `MissingRequiredField`, `UnexpectedNull` |
//!
//! Binding is depth-first and fail-fast: the first violation aborts the
//! whole call and no partial result is returned. Within one object the
//! input keys are checked against the declaration first, so under
//! `UnknownFieldPolicy::Reject` an unknown key is reported ahead of any
//! problem with a declared field. Declared fields are then visited in
//! declared order.
//!
//! ## Example
//!
//! ```cpp
//! auto parsed = json::parse_json(bytes, limits);
//! auto bound = bind(unwrap(parsed), *schema, BindOptions{});
//! if (is_err(bound)) {
//!     std::cerr << unwrap_err(bound).to_string() << "\n";
//! }
//! ```

#pragma once

#include "bind/bound_value.hpp"
#include "common.hpp"
#include "common/cancellation.hpp"
#include "json/json_error.hpp"
#include "json/json_limits.hpp"
#include "json/json_value.hpp"
#include "schema/schema_registry.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace strictjson::bind {

/// What to do with an input key that has no declared field.
enum class UnknownFieldPolicy : uint8_t {
    Reject, ///< Fail with `UnknownField` (default)
    Ignore  ///< Skip the key
};

[[nodiscard]] auto unknown_field_policy_name(UnknownFieldPolicy policy) -> const char*;

/// Parses `"reject"` or `"ignore"`.
[[nodiscard]] auto parse_unknown_field_policy(std::string_view text)
    -> std::optional<UnknownFieldPolicy>;

/// Binder settings.
struct BindOptions {
    UnknownFieldPolicy unknown_fields = UnknownFieldPolicy::Reject;

    /// Ceiling on object levels along any path from the root.
    size_t max_nesting_depth = json::LimitConfig::DEFAULT_MAX_NESTING_DEPTH;

    /// Ceiling on bound string length, in bytes.
    size_t max_string_length = json::LimitConfig::DEFAULT_MAX_STRING_LENGTH;
};

/// One bind operation.
///
/// A `Binder` is created per call; it only reads the schema and the parse
/// tree, so any number of binders may share one `CompiledSchema`.
class Binder {
public:
    Binder(const schema::CompiledSchema& schema, const BindOptions& options,
           const CancellationToken* cancel = nullptr);

    /// Binds `root` against the schema's root object type.
    [[nodiscard]] auto bind(const json::JsonValue& root) -> Result<BoundValue, json::DecodeError>;

    /// Binds `value` against an arbitrary `type` from the same schema.
    [[nodiscard]] auto bind_as(const json::JsonValue& value, const schema::SchemaType& type,
                               const std::string& path) -> Result<BoundValue, json::DecodeError>;

private:
    const schema::CompiledSchema& schema_;
    BindOptions options_;
    const CancellationToken* cancel_;

    /// Current object depth along the path being bound.
    size_t depth_ = 0;

    auto bind_value(const json::JsonValue& value, const schema::SchemaType& type,
                    const std::string& path) -> Result<BoundValue, json::DecodeError>;
    auto bind_scalar(const json::JsonValue& value, schema::ScalarKind kind,
                     const std::string& path) -> Result<BoundValue, json::DecodeError>;
    auto bind_integer(const json::JsonValue& value, schema::ScalarKind kind,
                      const std::string& path) -> Result<BoundValue, json::DecodeError>;
    auto bind_float(const json::JsonValue& value, const std::string& path)
        -> Result<BoundValue, json::DecodeError>;
    auto bind_timestamp(const json::JsonValue& value, const std::string& path)
        -> Result<BoundValue, json::DecodeError>;
    auto bind_collection(const json::JsonValue& value, const schema::SchemaType& type,
                         const std::string& path) -> Result<BoundValue, json::DecodeError>;
    auto bind_object(const json::JsonValue& value, const schema::ObjectSchema& object,
                     const std::string& path) -> Result<BoundValue, json::DecodeError>;

    [[nodiscard]] auto check_cancelled(const json::JsonValue& value, const std::string& path) const
        -> std::optional<json::DecodeError>;
};

/// Convenience wrapper: one `Binder` for one call.
[[nodiscard]] auto bind(const json::JsonValue& root, const schema::CompiledSchema& schema,
                        const BindOptions& options = {},
                        const CancellationToken* cancel = nullptr)
    -> Result<BoundValue, json::DecodeError>;

} // namespace strictjson::bind
