//! # Schema Types
//!
//! The closed set of shapes a document can be bound to. There is no "any"
//! type: every field names a scalar, a collection of a declared element
//! type, or a registered object type.
//!
//! ## Type Kinds
//!
//! | Factory | Accepts |
//! |---------|---------|
//! | `int32()` / `int64()` | Numbers without a fractional part, in range |
//! | `float64()` | Any number |
//! | `boolean()` | `true` / `false` |
//! | `string()` | Strings, verbatim |
//! | `timestamp()` | `YYYY-MM-DDTHH:mm:ss(.fff)?Z` strings |
//! | `list_of(t)` | Arrays of `t`, order and duplicates kept |
//! | `set_of(t)` | Arrays of `t`, de-duplicated after binding |
//! | `object(name)` | Objects of the registered type `name` |
//!
//! ## Example
//!
//! ```cpp
//! auto customer = ObjectSchema("Customer")
//!     .required("name", SchemaType::string())
//!     .optional("age", SchemaType::int32(), /*nullable=*/true);
//!
//! auto order = ObjectSchema("Order")
//!     .required("id", SchemaType::int64())
//!     .required("customer", SchemaType::object("Customer"))
//!     .required("tags", SchemaType::list_of(SchemaType::string()));
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strictjson::schema {

/// Scalar kinds a leaf field can take.
enum class ScalarKind : uint8_t {
    Int32,
    Int64,
    Float64,
    Boolean,
    String,
    Timestamp
};

/// Returns the lowercase name of a scalar kind, e.g. `"int64"`.
[[nodiscard]] auto scalar_kind_name(ScalarKind kind) -> const char*;

/// The four shapes of `SchemaType`.
enum class SchemaKind : uint8_t {
    Scalar,
    List,
    Set,
    Object
};

// ============================================================================
// SchemaType
// ============================================================================

/// A statically declared expected shape.
///
/// `SchemaType` is a small immutable value; collection element types are
/// shared through `Rc`, so copies are cheap and never deep.
class SchemaType {
public:
    static auto int32() -> SchemaType;
    static auto int64() -> SchemaType;
    static auto float64() -> SchemaType;
    static auto boolean() -> SchemaType;
    static auto string() -> SchemaType;
    static auto timestamp() -> SchemaType;

    /// An ordered collection of `element`.
    static auto list_of(SchemaType element) -> SchemaType;

    /// A de-duplicated collection of `element`.
    static auto set_of(SchemaType element) -> SchemaType;

    /// A reference to the object type registered under `name`.
    static auto object(std::string name) -> SchemaType;

    [[nodiscard]] auto kind() const -> SchemaKind {
        return kind_;
    }

    [[nodiscard]] auto is_scalar() const -> bool {
        return kind_ == SchemaKind::Scalar;
    }

    [[nodiscard]] auto is_collection() const -> bool {
        return kind_ == SchemaKind::List || kind_ == SchemaKind::Set;
    }

    [[nodiscard]] auto is_object() const -> bool {
        return kind_ == SchemaKind::Object;
    }

    /// Scalar kind; meaningful only when `is_scalar()`.
    [[nodiscard]] auto scalar() const -> ScalarKind {
        return scalar_;
    }

    /// Element type; non-null only when `is_collection()`.
    [[nodiscard]] auto element() const -> const SchemaType* {
        return element_.get();
    }

    /// Referenced type name; non-empty only when `is_object()`.
    [[nodiscard]] auto object_name() const -> const std::string& {
        return object_name_;
    }

    /// Human-readable description, e.g. `list<string>` or `object Customer`.
    [[nodiscard]] auto describe() const -> std::string;

    /// Walks through collections to the object type this type refers to,
    /// or returns `nullptr` for scalar leaves.
    [[nodiscard]] auto referenced_object() const -> const std::string*;

private:
    SchemaKind kind_ = SchemaKind::Scalar;
    ScalarKind scalar_ = ScalarKind::String;
    Rc<const SchemaType> element_;
    std::string object_name_;

    SchemaType() = default;
    explicit SchemaType(ScalarKind scalar) : kind_(SchemaKind::Scalar), scalar_(scalar) {}
};

// ============================================================================
// Fields and Objects
// ============================================================================

/// One declared field of an object type.
///
/// `name` is the only accepted wire name; matching is exact and
/// case-sensitive.
struct FieldSpec {
    std::string name;
    SchemaType type;
    bool required = true;
    bool nullable = false;
};

/// An object type: a name plus its fields in declared order.
///
/// Built with the chaining methods and handed to `SchemaRegistry::add`.
/// Field-name uniqueness is checked when the registry compiles.
class ObjectSchema {
public:
    explicit ObjectSchema(std::string name) : name_(std::move(name)) {}

    /// Adds a field that must be present in every input object.
    auto required(std::string name, SchemaType type, bool nullable = false) -> ObjectSchema&&;

    /// Adds a field that may be absent.
    auto optional(std::string name, SchemaType type, bool nullable = false) -> ObjectSchema&&;

    /// Adds a fully specified field.
    auto field(FieldSpec spec) -> ObjectSchema&&;

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto fields() const -> const std::vector<FieldSpec>& {
        return fields_;
    }

    /// Returns the field named exactly `name`, or `nullptr`.
    [[nodiscard]] auto find_field(std::string_view name) const -> const FieldSpec*;

    /// Declared field names, in order.
    [[nodiscard]] auto field_names() const -> std::vector<std::string>;

private:
    std::string name_;
    std::vector<FieldSpec> fields_;
};

} // namespace strictjson::schema
