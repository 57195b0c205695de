//! # Parse Value Implementation
//!
//! Out-of-line pieces of `JsonValue` that need `JsonObject` to be complete,
//! and the `JsonObject` member index.

#include "json/json_value.hpp"

namespace strictjson::json {

auto json_kind_name(JsonKind kind) -> const char* {
    switch (kind) {
    case JsonKind::Missing:
        return "missing";
    case JsonKind::Null:
        return "null";
    case JsonKind::Bool:
        return "boolean";
    case JsonKind::Number:
        return "number";
    case JsonKind::String:
        return "string";
    case JsonKind::Array:
        return "array";
    case JsonKind::Object:
        return "object";
    }
    return "unknown";
}

// ============================================================================
// JsonValue
// ============================================================================

JsonValue::JsonValue(JsonArray value, SourcePos at)
    : data(make_box<JsonArray>(std::move(value))), pos(at) {}

JsonValue::JsonValue(JsonObject value, SourcePos at)
    : data(make_box<JsonObject>(std::move(value))), pos(at) {}

JsonValue::~JsonValue() = default;

auto JsonValue::missing() -> const JsonValue& {
    static const JsonValue sentinel{Missing{}};
    return sentinel;
}

// ============================================================================
// JsonObject
// ============================================================================

auto JsonObject::insert(std::string key, SourcePos key_pos, JsonValue value) -> bool {
    if (index_.find(key) != index_.end()) {
        return false;
    }
    index_.emplace(key, members_.size());
    members_.push_back(JsonMember{std::move(key), key_pos, std::move(value)});
    return true;
}

auto JsonObject::find(std::string_view key) const -> const JsonValue* {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &members_[it->second].value;
}

auto JsonObject::get(std::string_view key) const -> const JsonValue& {
    const JsonValue* value = find(key);
    return value != nullptr ? *value : JsonValue::missing();
}

} // namespace strictjson::json
