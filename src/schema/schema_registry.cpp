//! # Schema Registry Implementation
//!
//! Compilation is a depth-first walk from the root with a three-colour
//! visiting set. The walk finds unresolved references and cycles, and
//! computes the longest object chain on the way back up.

#include "schema/schema_registry.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace strictjson::schema {

using json::DecodeError;
using json::ErrorKind;

// ============================================================================
// CompiledSchema
// ============================================================================

auto CompiledSchema::root() const -> const ObjectSchema& {
    return objects_.at(root_);
}

auto CompiledSchema::find_object(std::string_view name) const -> const ObjectSchema* {
    auto it = objects_.find(std::string(name));
    return it == objects_.end() ? nullptr : &it->second;
}

// ============================================================================
// Graph Walk
// ============================================================================

namespace {

enum class Mark : uint8_t { Unvisited, Visiting, Done };

auto schema_error(std::string msg) -> DecodeError {
    return DecodeError::make(ErrorKind::SchemaError, std::move(msg));
}

class GraphWalker {
public:
    GraphWalker(const std::unordered_map<std::string, const ObjectSchema*>& by_name,
                size_t max_depth)
        : by_name_(by_name), max_depth_(max_depth) {}

    /// Visits `name` and everything it references. Returns the length of
    /// the longest object chain starting at `name`.
    auto visit(const std::string& name) -> Result<size_t, DecodeError> {
        auto mark = marks_.find(name);
        if (mark != marks_.end() && mark->second == Mark::Done) {
            return depths_.at(name);
        }
        if (mark != marks_.end() && mark->second == Mark::Visiting) {
            return cycle_error(name);
        }

        marks_[name] = Mark::Visiting;
        stack_.push_back(name);
        const ObjectSchema& object = *by_name_.at(name);

        if (auto err = check_fields(object)) {
            return std::move(*err);
        }

        size_t longest_child = 0;
        for (const auto& spec : object.fields()) {
            const std::string* target = spec.type.referenced_object();
            if (target == nullptr) {
                continue;
            }
            if (by_name_.find(*target) == by_name_.end()) {
                return schema_error("field '" + name + "." + spec.name +
                                    "' references unregistered type '" + *target + "'")
                    .with_path(spec.name)
                    .expected_found("a registered object type", "'" + *target + "'");
            }
            auto child = visit(*target);
            if (is_err(child)) {
                return child;
            }
            longest_child = std::max(longest_child, unwrap(child));
        }

        stack_.pop_back();
        marks_[name] = Mark::Done;
        size_t depth = longest_child + 1;
        depths_[name] = depth;

        if (depth > max_depth_) {
            return schema_error("schema nesting starting at '" + name + "' is " +
                                std::to_string(depth) + " object levels deep")
                .expected_found("at most " + std::to_string(max_depth_) + " levels",
                                std::to_string(depth) + " levels")
                .with_hint("flatten the schema or split it into separate documents");
        }
        return depth;
    }

    [[nodiscard]] auto visited() const -> std::vector<std::string> {
        std::vector<std::string> names;
        for (const auto& [name, mark] : marks_) {
            if (mark == Mark::Done) {
                names.push_back(name);
            }
        }
        return names;
    }

private:
    const std::unordered_map<std::string, const ObjectSchema*>& by_name_;
    size_t max_depth_;
    std::unordered_map<std::string, Mark> marks_;
    std::unordered_map<std::string, size_t> depths_;
    std::vector<std::string> stack_;

    auto cycle_error(const std::string& name) const -> DecodeError {
        auto start = std::find(stack_.begin(), stack_.end(), name);
        std::string chain;
        for (auto it = start; it != stack_.end(); ++it) {
            chain += *it;
            chain += " -> ";
        }
        chain += name;
        return schema_error("cyclic reference between object types: " + chain)
            .expected_found("an acyclic type graph", chain)
            .with_hint("break the cycle by referencing the type by id instead of embedding it");
    }

    static auto check_fields(const ObjectSchema& object) -> std::optional<DecodeError> {
        std::unordered_set<std::string> seen;
        for (const auto& spec : object.fields()) {
            if (spec.name.empty()) {
                return schema_error("object type '" + object.name() + "' declares an unnamed field");
            }
            if (!seen.insert(spec.name).second) {
                return schema_error("object type '" + object.name() + "' declares field '" +
                                    spec.name + "' more than once")
                    .with_path(spec.name);
            }
        }
        return std::nullopt;
    }
};

} // anonymous namespace

// ============================================================================
// SchemaRegistry
// ============================================================================

auto SchemaRegistry::add(ObjectSchema object) -> SchemaRegistry& {
    STRICTJSON_LOG_DEBUG("schema", "Registered object type '" << object.name() << "' with "
                                                              << object.fields().size()
                                                              << " fields");
    objects_.push_back(std::move(object));
    return *this;
}

auto SchemaRegistry::contains(std::string_view name) const -> bool {
    return std::any_of(objects_.begin(), objects_.end(),
                       [&](const ObjectSchema& object) { return object.name() == name; });
}

auto SchemaRegistry::compile(const std::string& root, size_t max_depth) const
    -> Result<CompiledSchema, DecodeError> {
    std::unordered_map<std::string, const ObjectSchema*> by_name;
    for (const auto& object : objects_) {
        if (object.name().empty()) {
            return schema_error("object types must have a name");
        }
        if (!by_name.emplace(object.name(), &object).second) {
            STRICTJSON_LOG_ERROR("schema", "Duplicate object type '" << object.name() << "'");
            return schema_error("object type '" + object.name() + "' is registered more than once");
        }
    }

    if (by_name.find(root) == by_name.end()) {
        STRICTJSON_LOG_ERROR("schema", "Root type '" << root << "' is not registered");
        return schema_error("root type '" + root + "' is not registered")
            .expected_found("a registered object type", "'" + root + "'");
    }

    GraphWalker walker(by_name, max_depth);
    auto depth = walker.visit(root);
    if (is_err(depth)) {
        STRICTJSON_LOG_ERROR("schema", "Schema rooted at '" << root
                                                            << "' rejected: "
                                                            << unwrap_err(depth).message);
        return unwrap_err(depth);
    }

    CompiledSchema compiled;
    compiled.root_ = root;
    compiled.depth_ = unwrap(depth);
    for (const auto& name : walker.visited()) {
        compiled.objects_.emplace(name, *by_name.at(name));
    }

    STRICTJSON_LOG_INFO("schema", "Compiled schema '" << root << "': " << compiled.objects_.size()
                                                      << " object types, depth "
                                                      << compiled.depth_);
    return compiled;
}

} // namespace strictjson::schema
