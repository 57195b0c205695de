//! # Schema Types Implementation

#include "schema/schema_type.hpp"

namespace strictjson::schema {

auto scalar_kind_name(ScalarKind kind) -> const char* {
    switch (kind) {
    case ScalarKind::Int32:
        return "int32";
    case ScalarKind::Int64:
        return "int64";
    case ScalarKind::Float64:
        return "float64";
    case ScalarKind::Boolean:
        return "boolean";
    case ScalarKind::String:
        return "string";
    case ScalarKind::Timestamp:
        return "timestamp";
    }
    return "unknown";
}

// ============================================================================
// SchemaType Factories
// ============================================================================

auto SchemaType::int32() -> SchemaType {
    return SchemaType(ScalarKind::Int32);
}

auto SchemaType::int64() -> SchemaType {
    return SchemaType(ScalarKind::Int64);
}

auto SchemaType::float64() -> SchemaType {
    return SchemaType(ScalarKind::Float64);
}

auto SchemaType::boolean() -> SchemaType {
    return SchemaType(ScalarKind::Boolean);
}

auto SchemaType::string() -> SchemaType {
    return SchemaType(ScalarKind::String);
}

auto SchemaType::timestamp() -> SchemaType {
    return SchemaType(ScalarKind::Timestamp);
}

auto SchemaType::list_of(SchemaType element) -> SchemaType {
    SchemaType type;
    type.kind_ = SchemaKind::List;
    type.element_ = make_rc<const SchemaType>(std::move(element));
    return type;
}

auto SchemaType::set_of(SchemaType element) -> SchemaType {
    SchemaType type;
    type.kind_ = SchemaKind::Set;
    type.element_ = make_rc<const SchemaType>(std::move(element));
    return type;
}

auto SchemaType::object(std::string name) -> SchemaType {
    SchemaType type;
    type.kind_ = SchemaKind::Object;
    type.object_name_ = std::move(name);
    return type;
}

auto SchemaType::describe() const -> std::string {
    switch (kind_) {
    case SchemaKind::Scalar:
        return scalar_kind_name(scalar_);
    case SchemaKind::List:
        return "list<" + element_->describe() + ">";
    case SchemaKind::Set:
        return "set<" + element_->describe() + ">";
    case SchemaKind::Object:
        return "object " + object_name_;
    }
    return "unknown";
}

auto SchemaType::referenced_object() const -> const std::string* {
    const SchemaType* type = this;
    while (type->is_collection()) {
        type = type->element();
    }
    return type->is_object() ? &type->object_name_ : nullptr;
}

// ============================================================================
// ObjectSchema
// ============================================================================

auto ObjectSchema::required(std::string name, SchemaType type, bool nullable) -> ObjectSchema&& {
    fields_.push_back(FieldSpec{std::move(name), std::move(type), true, nullable});
    return std::move(*this);
}

auto ObjectSchema::optional(std::string name, SchemaType type, bool nullable) -> ObjectSchema&& {
    fields_.push_back(FieldSpec{std::move(name), std::move(type), false, nullable});
    return std::move(*this);
}

auto ObjectSchema::field(FieldSpec spec) -> ObjectSchema&& {
    fields_.push_back(std::move(spec));
    return std::move(*this);
}

auto ObjectSchema::find_field(std::string_view name) const -> const FieldSpec* {
    for (const auto& spec : fields_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

auto ObjectSchema::field_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& spec : fields_) {
        names.push_back(spec.name);
    }
    return names;
}

} // namespace strictjson::schema
