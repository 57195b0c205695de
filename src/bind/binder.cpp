//! # Strict Binder Implementation
//!
//! Recursive descent over the schema, driven by the schema kind and never
//! by the input: the input can only satisfy or violate what is declared.

#include "bind/binder.hpp"

#include "common/suggest.hpp"
#include "json/json_parser.hpp"

#include <charconv>
#include <limits>
#include <unordered_map>

namespace strictjson::bind {

using json::DecodeError;
using json::ErrorKind;
using json::JsonKind;
using json::JsonValue;
using schema::ScalarKind;
using schema::SchemaKind;
using schema::SchemaType;

namespace {

constexpr size_t MAX_QUOTED_PREVIEW = 40;

/// Increments a depth counter for the lifetime of one object bind.
class DepthScope {
public:
    explicit DepthScope(size_t& depth) : depth_(depth) {
        ++depth_;
    }
    ~DepthScope() {
        --depth_;
    }
    DepthScope(const DepthScope&) = delete;
    auto operator=(const DepthScope&) -> DepthScope& = delete;

private:
    size_t& depth_;
};

auto describe_found(const JsonValue& value) -> std::string {
    switch (value.kind()) {
    case JsonKind::Bool:
        return value.as_bool() ? "boolean true" : "boolean false";
    case JsonKind::Number:
        return "number " + value.as_number().text;
    case JsonKind::String: {
        const std::string& text = value.as_string();
        if (text.size() > MAX_QUOTED_PREVIEW) {
            return "string \"" + text.substr(0, MAX_QUOTED_PREVIEW) + "...\"";
        }
        return "string \"" + text + "\"";
    }
    default:
        return value.kind_name();
    }
}

/// `true` when `text` would be a valid number token if it were unquoted.
auto looks_numeric(const std::string& text) -> bool {
    size_t i = 0;
    if (i < text.size() && text[i] == '-') {
        ++i;
    }
    size_t digits = 0;
    while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
        ++i;
        ++digits;
    }
    if (digits == 0) {
        return false;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
        size_t fraction = 0;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
            ++i;
            ++fraction;
        }
        if (fraction == 0) {
            return false;
        }
    }
    return i == text.size();
}

auto is_numeric_scalar(const SchemaType& type) -> bool {
    return type.is_scalar() &&
           (type.scalar() == ScalarKind::Int32 || type.scalar() == ScalarKind::Int64 ||
            type.scalar() == ScalarKind::Float64);
}

/// Picks a remediation hint for a value of the wrong kind.
auto mismatch_hint(const JsonValue& value, const SchemaType& expected) -> std::string {
    if (expected.is_collection() && !value.is_array()) {
        return "wrap the value in [ ]";
    }
    if (is_numeric_scalar(expected) && value.is_string() && looks_numeric(value.as_string())) {
        return "remove the quotes around the numeric value";
    }
    if (expected.is_scalar() && expected.scalar() == ScalarKind::Boolean) {
        if (value.is_string() && (value.as_string() == "true" || value.as_string() == "false")) {
            return "remove the quotes around the boolean value";
        }
        if (value.is_number()) {
            return "use the literal true or false";
        }
    }
    if (expected.is_scalar() && expected.scalar() == ScalarKind::Timestamp && value.is_number()) {
        return std::string("send the timestamp as a string in ") + TIMESTAMP_FORMAT + " form";
    }
    if (expected.is_scalar() && expected.scalar() == ScalarKind::String && !value.is_string()) {
        return "quote the value if it is meant to be text";
    }
    return {};
}

auto where(const std::string& path) -> std::string {
    return path.empty() ? "the document root" : "field '" + path + "'";
}

auto type_mismatch(const JsonValue& value, const SchemaType& expected, const std::string& path)
    -> DecodeError {
    return DecodeError::make(ErrorKind::TypeMismatch, "type mismatch at " + where(path), value.pos)
        .with_path(path)
        .expected_found(expected.describe(), describe_found(value))
        .with_hint(mismatch_hint(value, expected));
}

auto out_of_range(const JsonValue& value, const char* type_name, const std::string& path)
    -> DecodeError {
    return DecodeError::make(ErrorKind::TypeMismatch,
                             "number out of range for " + std::string(type_name) + " at " +
                                 where(path),
                             value.pos)
        .with_path(path)
        .expected_found(std::string("a value representable as ") + type_name,
                        describe_found(value));
}

} // anonymous namespace

// ============================================================================
// Unknown Field Policy
// ============================================================================

auto unknown_field_policy_name(UnknownFieldPolicy policy) -> const char* {
    switch (policy) {
    case UnknownFieldPolicy::Reject:
        return "reject";
    case UnknownFieldPolicy::Ignore:
        return "ignore";
    }
    return "unknown";
}

auto parse_unknown_field_policy(std::string_view text) -> std::optional<UnknownFieldPolicy> {
    if (text == "reject") {
        return UnknownFieldPolicy::Reject;
    }
    if (text == "ignore") {
        return UnknownFieldPolicy::Ignore;
    }
    return std::nullopt;
}

// ============================================================================
// Binder
// ============================================================================

Binder::Binder(const schema::CompiledSchema& schema, const BindOptions& options,
               const CancellationToken* cancel)
    : schema_(schema), options_(options), cancel_(cancel) {}

auto Binder::bind(const JsonValue& root) -> Result<BoundValue, DecodeError> {
    return bind_as(root, SchemaType::object(schema_.root_name()), "");
}

auto Binder::bind_as(const JsonValue& value, const SchemaType& type, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    depth_ = 0;
    if (value.is_missing()) {
        return DecodeError::make(ErrorKind::MissingRequiredField, "no value to bind", value.pos)
            .with_path(path)
            .expected_found(type.describe(), "nothing");
    }
    return bind_value(value, type, path);
}

auto Binder::check_cancelled(const JsonValue& value, const std::string& path) const
    -> std::optional<DecodeError> {
    if (cancel_ == nullptr || !cancel_->is_cancelled()) {
        return std::nullopt;
    }
    return DecodeError::make(ErrorKind::Cancelled, "decoding was cancelled", value.pos)
        .with_path(path);
}

auto Binder::bind_value(const JsonValue& value, const SchemaType& type, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    if (value.is_null()) {
        return DecodeError::make(ErrorKind::UnexpectedNull, "unexpected null at " + where(path),
                                 value.pos)
            .with_path(path)
            .expected_found(type.describe(), "null");
    }

    switch (type.kind()) {
    case SchemaKind::Scalar:
        return bind_scalar(value, type.scalar(), path);

    case SchemaKind::List:
    case SchemaKind::Set:
        return bind_collection(value, type, path);

    case SchemaKind::Object: {
        const schema::ObjectSchema* object = schema_.find_object(type.object_name());
        if (object == nullptr) {
            return DecodeError::make(ErrorKind::SchemaError,
                                     "object type '" + type.object_name() +
                                         "' is not part of the compiled schema",
                                     value.pos)
                .with_path(path);
        }
        return bind_object(value, *object, path);
    }
    }
    return type_mismatch(value, type, path);
}

// ============================================================================
// Scalars
// ============================================================================

auto Binder::bind_scalar(const JsonValue& value, ScalarKind kind, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    switch (kind) {
    case ScalarKind::Int32:
    case ScalarKind::Int64:
        return bind_integer(value, kind, path);

    case ScalarKind::Float64:
        return bind_float(value, path);

    case ScalarKind::Boolean:
        if (!value.is_bool()) {
            return type_mismatch(value, SchemaType::boolean(), path);
        }
        return BoundValue(value.as_bool());

    case ScalarKind::String: {
        if (!value.is_string()) {
            return type_mismatch(value, SchemaType::string(), path);
        }
        const std::string& text = value.as_string();
        if (text.size() > options_.max_string_length) {
            return DecodeError::make(ErrorKind::StringTooLong,
                                     "string exceeds the configured length limit", value.pos)
                .with_path(path)
                .expected_found("at most " + std::to_string(options_.max_string_length) +
                                    " bytes",
                                std::to_string(text.size()) + " bytes");
        }
        return BoundValue(text);
    }

    case ScalarKind::Timestamp:
        return bind_timestamp(value, path);
    }
    return type_mismatch(value, SchemaType::string(), path);
}

auto Binder::bind_integer(const JsonValue& value, ScalarKind kind, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    const SchemaType type = kind == ScalarKind::Int32 ? SchemaType::int32() : SchemaType::int64();
    if (!value.is_number()) {
        return type_mismatch(value, type, path);
    }

    const json::JsonNumber& number = value.as_number();
    if (number.has_fraction) {
        return DecodeError::make(ErrorKind::TypeMismatch,
                                 "integer field has a fractional part at " + where(path),
                                 value.pos)
            .with_path(path)
            .expected_found(type.describe(), describe_found(value))
            .with_hint("integer fields do not accept a decimal point");
    }

    int64_t parsed = 0;
    const char* first = number.text.data();
    const char* last = first + number.text.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc{} || ptr != last) {
        return out_of_range(value, "int64", path);
    }

    if (kind == ScalarKind::Int64) {
        return BoundValue(parsed);
    }
    if (parsed < std::numeric_limits<int32_t>::min() ||
        parsed > std::numeric_limits<int32_t>::max()) {
        return out_of_range(value, "int32", path);
    }
    return BoundValue(static_cast<int32_t>(parsed));
}

auto Binder::bind_float(const JsonValue& value, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    if (!value.is_number()) {
        return type_mismatch(value, SchemaType::float64(), path);
    }

    const std::string& text = value.as_number().text;
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return out_of_range(value, "float64", path);
    }
    return BoundValue(parsed);
}

auto Binder::bind_timestamp(const JsonValue& value, const std::string& path)
    -> Result<BoundValue, DecodeError> {
    if (!value.is_string()) {
        return type_mismatch(value, SchemaType::timestamp(), path);
    }

    auto parsed = Timestamp::parse(value.as_string());
    if (is_err(parsed)) {
        return DecodeError::make(ErrorKind::InvalidDateFormat,
                                 "invalid timestamp at " + where(path) + ": " +
                                     unwrap_err(parsed),
                                 value.pos)
            .with_path(path)
            .expected_found(TIMESTAMP_FORMAT, describe_found(value))
            .with_hint("use UTC with the 'Z' designator, e.g. 2024-12-25T14:30:00Z");
    }
    return BoundValue(unwrap(parsed));
}

// ============================================================================
// Collections
// ============================================================================

auto Binder::bind_collection(const JsonValue& value, const SchemaType& type,
                             const std::string& path) -> Result<BoundValue, DecodeError> {
    if (auto err = check_cancelled(value, path)) {
        return std::move(*err);
    }
    if (!value.is_array()) {
        return type_mismatch(value, type, path);
    }

    const json::JsonArray& elements = value.as_array();
    const SchemaType& element_type = *type.element();

    if (type.kind() == SchemaKind::List) {
        BoundList list;
        list.items.reserve(elements.size());
        for (size_t i = 0; i < elements.size(); ++i) {
            auto item = bind_value(elements[i], element_type, json::index_path(path, i));
            if (is_err(item)) {
                return item;
            }
            list.items.push_back(std::move(unwrap(item)));
        }
        return BoundValue(std::move(list));
    }

    // Set: keep the first occurrence of each distinct value
    BoundSet set;
    std::unordered_map<size_t, std::vector<size_t>> buckets;
    for (size_t i = 0; i < elements.size(); ++i) {
        auto item = bind_value(elements[i], element_type, json::index_path(path, i));
        if (is_err(item)) {
            return item;
        }
        BoundValue& bound = unwrap(item);
        auto& bucket = buckets[hash_value(bound)];
        bool duplicate = false;
        for (size_t index : bucket) {
            if (set.items[index] == bound) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            bucket.push_back(set.items.size());
            set.items.push_back(std::move(bound));
        }
    }
    return BoundValue(std::move(set));
}

// ============================================================================
// Objects
// ============================================================================

/// Binds one object against its declaration.
///
/// Input keys are checked first so a misspelled key is reported as an
/// unknown field (with a suggestion) rather than as the missing field it
/// was meant to be.
auto Binder::bind_object(const JsonValue& value, const schema::ObjectSchema& object,
                         const std::string& path) -> Result<BoundValue, DecodeError> {
    if (auto err = check_cancelled(value, path)) {
        return std::move(*err);
    }
    if (!value.is_object()) {
        return type_mismatch(value, SchemaType::object(object.name()), path);
    }

    DepthScope scope(depth_);
    if (depth_ > options_.max_nesting_depth) {
        return DecodeError::make(ErrorKind::NestingTooDeep,
                                 "object nesting exceeds the configured limit at " + where(path),
                                 value.pos)
            .with_path(path)
            .expected_found("depth at most " + std::to_string(options_.max_nesting_depth),
                            "depth " + std::to_string(depth_))
            .with_hint("flatten the structure");
    }

    const json::JsonObject& input = value.as_object();

    if (options_.unknown_fields == UnknownFieldPolicy::Reject) {
        for (const auto& member : input) {
            if (object.find_field(member.key) != nullptr) {
                continue;
            }
            auto names = object.field_names();
            std::string suggestion = find_similar(member.key, names);
            std::string hint = suggestion.empty()
                                   ? "remove the field; '" + object.name() +
                                         "' does not declare it"
                                   : "did you mean '" + suggestion + "'?";
            std::string declared;
            for (size_t i = 0; i < names.size(); ++i) {
                declared += (i == 0 ? "" : ", ") + names[i];
            }
            return DecodeError::make(ErrorKind::UnknownField,
                                     "unknown field '" + member.key + "' in " + object.name(),
                                     member.key_pos)
                .with_path(json::join_path(path, member.key))
                .expected_found(names.empty() ? "no fields" : "one of: " + declared,
                                "'" + member.key + "'")
                .with_hint(std::move(hint));
        }
    }

    BoundObject out;
    out.type_name = object.name();
    out.fields.reserve(object.fields().size());

    for (const auto& spec : object.fields()) {
        std::string field_path = json::join_path(path, spec.name);
        const JsonValue* member = input.find(spec.name);

        if (member == nullptr) {
            if (spec.required) {
                std::vector<std::string> keys;
                keys.reserve(input.size());
                for (const auto& m : input) {
                    keys.push_back(m.key);
                }
                std::string similar = find_similar(spec.name, keys);
                std::string hint = similar.empty()
                                       ? "add the field to the input"
                                       : "the input has '" + similar +
                                             "'; field names are matched exactly";
                return DecodeError::make(ErrorKind::MissingRequiredField,
                                         "missing required field '" + spec.name + "' in " +
                                             object.name(),
                                         value.pos)
                    .with_path(field_path)
                    .expected_found(spec.type.describe(), "nothing")
                    .with_hint(std::move(hint));
            }
            out.fields.push_back(BoundField{spec.name, FieldState::Missing, BoundValue{}});
            continue;
        }

        if (member->is_null()) {
            if (!spec.nullable) {
                return DecodeError::make(ErrorKind::UnexpectedNull,
                                         "field '" + spec.name + "' of " + object.name() +
                                             " is not nullable",
                                         member->pos)
                    .with_path(field_path)
                    .expected_found(spec.type.describe(), "null")
                    .with_hint(spec.required ? "send a value for the field"
                                             : "omit the field instead of sending null");
            }
            out.fields.push_back(BoundField{spec.name, FieldState::Null, BoundValue{}});
            continue;
        }

        auto bound = bind_value(*member, spec.type, field_path);
        if (is_err(bound)) {
            return bound;
        }
        out.fields.push_back(BoundField{spec.name, FieldState::Present, std::move(unwrap(bound))});
    }

    return BoundValue(std::move(out));
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto bind(const JsonValue& root, const schema::CompiledSchema& schema,
          const BindOptions& options, const CancellationToken* cancel)
    -> Result<BoundValue, DecodeError> {
    Binder binder(schema, options, cancel);
    return binder.bind(root);
}

} // namespace strictjson::bind
