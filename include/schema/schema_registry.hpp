//! # Schema Registry
//!
//! Collects object types and compiles them into an immutable
//! `CompiledSchema`. Compilation is the only place structural schema
//! problems are detected; a compiled schema is known to be well-formed and
//! is never validated again on the request path.
//!
//! ## Compile-Time Checks
//!
//! | Check | Failure |
//! |-------|---------|
//! | Type names are unique | `SchemaError` |
//! | The root type is registered | `SchemaError` |
//! | Field names are unique within each object | `SchemaError` |
//! | Every `object(name)` reference resolves | `SchemaError` |
//! | The type graph reachable from the root is acyclic | `SchemaError`, naming the cycle |
//! | Longest object chain from the root is at most `max_depth` | `SchemaError` |
//!
//! ## Example
//!
//! ```cpp
//! SchemaRegistry registry;
//! registry.add(ObjectSchema("Customer").required("name", SchemaType::string()));
//! registry.add(ObjectSchema("Order").required("customer", SchemaType::object("Customer")));
//!
//! auto compiled = registry.compile("Order");
//! if (is_err(compiled)) {
//!     // startup-fatal
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "schema/schema_type.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strictjson::schema {

/// Default ceiling on the number of object levels from root to leaf.
constexpr size_t DEFAULT_MAX_SCHEMA_DEPTH = 10;

/// An immutable, validated schema graph rooted at one object type.
///
/// Safe to share across threads without locking; hold it through
/// `Rc<const CompiledSchema>`.
class CompiledSchema {
public:
    /// The root object type.
    [[nodiscard]] auto root() const -> const ObjectSchema&;

    [[nodiscard]] auto root_name() const -> const std::string& {
        return root_;
    }

    /// Returns the object type registered as `name`, or `nullptr` if it is
    /// not part of this graph.
    [[nodiscard]] auto find_object(std::string_view name) const -> const ObjectSchema*;

    /// Longest chain of object types from the root, counting the root as 1.
    [[nodiscard]] auto depth() const -> size_t {
        return depth_;
    }

    /// Number of object types reachable from the root.
    [[nodiscard]] auto object_count() const -> size_t {
        return objects_.size();
    }

private:
    friend class SchemaRegistry;

    std::string root_;
    std::unordered_map<std::string, ObjectSchema> objects_;
    size_t depth_ = 0;
};

/// Mutable collection of object types, used once at startup.
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    /// Registers an object type. Duplicate names are reported by `compile()`.
    auto add(ObjectSchema object) -> SchemaRegistry&;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return objects_.size();
    }

    /// Validates the graph reachable from `root` and freezes it.
    ///
    /// # Returns
    ///
    /// `Ok(CompiledSchema)` holding only the reachable types, or
    /// `Err(DecodeError)` with kind `SchemaError` describing the first problem.
    [[nodiscard]] auto compile(const std::string& root,
                               size_t max_depth = DEFAULT_MAX_SCHEMA_DEPTH) const
        -> Result<CompiledSchema, json::DecodeError>;

private:
    std::vector<ObjectSchema> objects_;
};

} // namespace strictjson::schema
