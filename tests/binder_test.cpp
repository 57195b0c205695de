//! # Strict Binder Tests
//!
//! Tests for schema binding, including:
//! - Scalar matching without coercion
//! - No auto-wrapping of scalars into lists
//! - Null versus missing fields
//! - Depth boundary at 10 and 11 object levels
//! - Timestamp strictness
//! - Fail-fast ordering and unknown field policy
//! - Error paths, positions and hints

#include "bind/binder.hpp"
#include "json/json_parser.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace strictjson;
using namespace strictjson::bind;
using namespace strictjson::json;
using namespace strictjson::schema;

namespace {

auto compile_or_fail(const SchemaRegistry& registry, const std::string& root,
                     size_t max_depth = DEFAULT_MAX_SCHEMA_DEPTH) -> Box<CompiledSchema> {
    auto result = registry.compile(root, max_depth);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
    if (is_err(result)) {
        return nullptr;
    }
    return make_box<CompiledSchema>(std::move(unwrap(result)));
}

/// Schema with a single required field `x` of the given type.
auto single_field(SchemaType type) -> Box<CompiledSchema> {
    SchemaRegistry registry;
    registry.add(ObjectSchema("Single").required("x", std::move(type)));
    return compile_or_fail(registry, "Single");
}

/// Parses with generous limits and binds against `schema`.
auto bind_text(std::string_view text, const CompiledSchema& schema, BindOptions options = {},
               const CancellationToken* cancel = nullptr) -> Result<BoundValue, DecodeError> {
    LimitConfig limits;
    limits.max_nesting_depth = 32;
    auto parsed = parse_json(text, limits);
    EXPECT_TRUE(is_ok(parsed)) << (is_err(parsed) ? unwrap_err(parsed).to_string() : "");
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    return bind::bind(unwrap(parsed), schema, options, cancel);
}

auto bind_error(std::string_view text, const CompiledSchema& schema, BindOptions options = {})
    -> DecodeError {
    auto result = bind_text(text, schema, options);
    EXPECT_TRUE(is_err(result)) << "expected failure for: " << text;
    if (is_ok(result)) {
        return DecodeError::make(ErrorKind::SchemaError, "<bound successfully>");
    }
    return unwrap_err(result);
}

/// Registers `L1` .. `Ln`, each with an int32 `value` and an optional `next`.
auto chain_registry(size_t levels) -> SchemaRegistry {
    SchemaRegistry registry;
    for (size_t i = 1; i <= levels; ++i) {
        ObjectSchema object("L" + std::to_string(i));
        object.required("value", SchemaType::int32());
        if (i < levels) {
            object.optional("next", SchemaType::object("L" + std::to_string(i + 1)));
        }
        registry.add(std::move(object));
    }
    return registry;
}

/// `{"value":1,"next":{"value":1,...}}` with `levels` objects.
auto chain_data(size_t levels) -> std::string {
    std::string out;
    for (size_t i = 0; i < levels; ++i) {
        out += R"({"value":1)";
        if (i + 1 < levels) {
            out += R"(,"next":)";
        }
    }
    out += std::string(levels, '}');
    return out;
}

} // anonymous namespace

// ============================================================================
// Integers
// ============================================================================

TEST(BinderScalarTest, Int64RoundTrip) {
    auto schema = single_field(SchemaType::int64());
    ASSERT_NE(schema, nullptr);

    for (int64_t v : {int64_t{0}, int64_t{-1}, int64_t{42}, std::numeric_limits<int64_t>::max(),
                      std::numeric_limits<int64_t>::min()}) {
        auto result = bind_text(R"({"x": )" + std::to_string(v) + "}", *schema);
        ASSERT_TRUE(is_ok(result)) << v;
        EXPECT_EQ(unwrap(result).as_object().get("x").as_int64(), v);
    }
}

TEST(BinderScalarTest, QuotedNumberNeverCoerces) {
    auto schema = single_field(SchemaType::int64());
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"x": "42"})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.path, "x");
    EXPECT_EQ(err.expected, "int64");
    EXPECT_EQ(err.actual, "string \"42\"");
    EXPECT_EQ(err.hint, "remove the quotes around the numeric value");
}

TEST(BinderScalarTest, Int64Overflow) {
    auto schema = single_field(SchemaType::int64());
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(bind_error(R"({"x": 9223372036854775808})", *schema).kind, ErrorKind::TypeMismatch);
}

TEST(BinderScalarTest, Int32Range) {
    auto schema = single_field(SchemaType::int32());
    ASSERT_NE(schema, nullptr);

    auto max = bind_text(R"({"x": 2147483647})", *schema);
    ASSERT_TRUE(is_ok(max));
    EXPECT_EQ(unwrap(max).as_object().get("x").as_int32(), 2147483647);

    auto min = bind_text(R"({"x": -2147483648})", *schema);
    ASSERT_TRUE(is_ok(min));
    EXPECT_EQ(unwrap(min).as_object().get("x").as_int32(), std::numeric_limits<int32_t>::min());

    auto err = bind_error(R"({"x": 2147483648})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_NE(err.message.find("int32"), std::string::npos);
}

TEST(BinderScalarTest, IntegerRejectsFraction) {
    auto schema = single_field(SchemaType::int32());
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"x": 1.0})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.hint, "integer fields do not accept a decimal point");
}

// ============================================================================
// Other Scalars
// ============================================================================

TEST(BinderScalarTest, Float64AcceptsAnyNumber) {
    auto schema = single_field(SchemaType::float64());
    ASSERT_NE(schema, nullptr);

    auto whole = bind_text(R"({"x": 3})", *schema);
    ASSERT_TRUE(is_ok(whole));
    EXPECT_DOUBLE_EQ(unwrap(whole).as_object().get("x").as_double(), 3.0);

    auto frac = bind_text(R"({"x": -0.125})", *schema);
    ASSERT_TRUE(is_ok(frac));
    EXPECT_DOUBLE_EQ(unwrap(frac).as_object().get("x").as_double(), -0.125);

    EXPECT_EQ(bind_error(R"({"x": "3.5"})", *schema).hint,
              "remove the quotes around the numeric value");
}

TEST(BinderScalarTest, BooleanIsStrict) {
    auto schema = single_field(SchemaType::boolean());
    ASSERT_NE(schema, nullptr);

    auto ok = bind_text(R"({"x": false})", *schema);
    ASSERT_TRUE(is_ok(ok));
    EXPECT_FALSE(unwrap(ok).as_object().get("x").as_bool());

    auto quoted = bind_error(R"({"x": "true"})", *schema);
    EXPECT_EQ(quoted.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(quoted.hint, "remove the quotes around the boolean value");

    auto numeric = bind_error(R"({"x": 1})", *schema);
    EXPECT_EQ(numeric.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(numeric.hint, "use the literal true or false");
}

TEST(BinderScalarTest, StringIsVerbatim) {
    auto schema = single_field(SchemaType::string());
    ASSERT_NE(schema, nullptr);

    auto ok = bind_text(R"({"x": "  Mixed Case é "})", *schema);
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).as_object().get("x").as_string(), "  Mixed Case \xC3\xA9 ");

    EXPECT_EQ(bind_error(R"({"x": 12})", *schema).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(bind_error(R"({"x": {}})", *schema).kind, ErrorKind::TypeMismatch);
}

TEST(BinderScalarTest, StringLengthOption) {
    auto schema = single_field(SchemaType::string());
    ASSERT_NE(schema, nullptr);

    BindOptions options;
    options.max_string_length = 3;
    EXPECT_TRUE(is_ok(bind_text(R"({"x": "abc"})", *schema, options)));
    EXPECT_EQ(bind_error(R"({"x": "abcd"})", *schema, options).kind, ErrorKind::StringTooLong);
}

// ============================================================================
// Timestamps
// ============================================================================

TEST(BinderTimestampTest, AcceptsUtc) {
    auto schema = single_field(SchemaType::timestamp());
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(R"({"x": "2024-12-25T14:30:00Z"})", *schema);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_object().get("x").as_timestamp().to_string(),
              "2024-12-25T14:30:00.000Z");
}

TEST(BinderTimestampTest, RejectsOffsetAndDateOnly) {
    auto schema = single_field(SchemaType::timestamp());
    ASSERT_NE(schema, nullptr);

    auto offset = bind_error(R"({"x": "2024-12-25T14:30:00+02:00"})", *schema);
    EXPECT_EQ(offset.kind, ErrorKind::InvalidDateFormat);
    EXPECT_EQ(offset.expected, TIMESTAMP_FORMAT);
    EXPECT_EQ(offset.hint, "use UTC with the 'Z' designator, e.g. 2024-12-25T14:30:00Z");

    EXPECT_EQ(bind_error(R"({"x": "2024-12-25"})", *schema).kind, ErrorKind::InvalidDateFormat);
    EXPECT_EQ(bind_error(R"({"x": "2023-02-29T00:00:00Z"})", *schema).kind,
              ErrorKind::InvalidDateFormat);
}

TEST(BinderTimestampTest, RejectsEpochNumber) {
    auto schema = single_field(SchemaType::timestamp());
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"x": 1735126200})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_NE(err.hint.find(TIMESTAMP_FORMAT), std::string::npos);
}

// ============================================================================
// Collections
// ============================================================================

TEST(BinderCollectionTest, NoAutoWrap) {
    auto schema = single_field(SchemaType::list_of(SchemaType::string()));
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"x": "a"})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.hint, "wrap the value in [ ]");

    auto ok = bind_text(R"({"x": ["a"]})", *schema);
    ASSERT_TRUE(is_ok(ok));
    const auto& list = unwrap(ok).as_object().get("x").as_list();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list.items[0].as_string(), "a");
}

TEST(BinderCollectionTest, ListKeepsOrderAndDuplicates) {
    auto schema = single_field(SchemaType::list_of(SchemaType::int32()));
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(R"({"x": [3, 1, 3, 2]})", *schema);
    ASSERT_TRUE(is_ok(result));
    const auto& list = unwrap(result).as_object().get("x").as_list();
    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list.items[0].as_int32(), 3);
    EXPECT_EQ(list.items[2].as_int32(), 3);
    EXPECT_EQ(list.items[3].as_int32(), 2);
}

TEST(BinderCollectionTest, SetDeduplicatesKeepingFirst) {
    auto schema = single_field(SchemaType::set_of(SchemaType::string()));
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(R"({"x": ["b", "a", "b", "c", "a"]})", *schema);
    ASSERT_TRUE(is_ok(result));
    const auto& set = unwrap(result).as_object().get("x").as_set();
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set.items[0].as_string(), "b");
    EXPECT_EQ(set.items[1].as_string(), "a");
    EXPECT_EQ(set.items[2].as_string(), "c");
}

TEST(BinderCollectionTest, SetOfObjectsUsesStructuralEquality) {
    SchemaRegistry registry;
    registry.add(ObjectSchema("Tag").required("k", SchemaType::string()));
    registry.add(ObjectSchema("Root").required("tags", SchemaType::set_of(SchemaType::object("Tag"))));
    auto schema = compile_or_fail(registry, "Root");
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(R"({"tags": [{"k": "a"}, {"k": "b"}, {"k": "a"}]})", *schema);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_object().get("tags").as_set().size(), 2u);
}

TEST(BinderCollectionTest, ElementErrorCarriesIndexPath) {
    SchemaRegistry registry;
    registry.add(ObjectSchema("Line").required("sku", SchemaType::string()));
    registry.add(ObjectSchema("Order").required("items", SchemaType::list_of(SchemaType::object("Line"))));
    auto schema = compile_or_fail(registry, "Order");
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"items": [{"sku": "a"}, {"sku": 7}]})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.path, "items[1].sku");
}

TEST(BinderCollectionTest, NullElementIsRejected) {
    auto schema = single_field(SchemaType::list_of(SchemaType::int32()));
    ASSERT_NE(schema, nullptr);

    auto err = bind_error(R"({"x": [1, null]})", *schema);
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedNull);
    EXPECT_EQ(err.path, "x[1]");
}

// ============================================================================
// Null and Missing
// ============================================================================

class BinderNullTest : public ::testing::Test {
protected:
    void SetUp() override {
        SchemaRegistry registry;
        registry.add(ObjectSchema("Person")
                         .required("name", SchemaType::string())
                         .optional("age", SchemaType::int32(), true)
                         .optional("email", SchemaType::string())
                         .required("nickname", SchemaType::string(), true));
        schema_ = compile_or_fail(registry, "Person");
        ASSERT_NE(schema_, nullptr);
    }

    Box<CompiledSchema> schema_;
};

TEST_F(BinderNullTest, NullAndMissingAreDistinguishable) {
    auto missing = bind_text(R"({"name": "Ada", "nickname": "A"})", *schema_);
    auto null = bind_text(R"({"name": "Ada", "nickname": "A", "age": null})", *schema_);
    ASSERT_TRUE(is_ok(missing));
    ASSERT_TRUE(is_ok(null));

    EXPECT_EQ(unwrap(missing).as_object().state("age"), FieldState::Missing);
    EXPECT_EQ(unwrap(null).as_object().state("age"), FieldState::Null);
    EXPECT_NE(unwrap(missing), unwrap(null));
}

TEST_F(BinderNullTest, RequiredNonNullableRejectsNull) {
    auto err = bind_error(R"({"name": null, "nickname": "A"})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedNull);
    EXPECT_EQ(err.path, "name");
    EXPECT_EQ(err.column, 10u);
}

TEST_F(BinderNullTest, RequiredMissing) {
    auto err = bind_error(R"({"nickname": "A"})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::MissingRequiredField);
    EXPECT_EQ(err.path, "name");
    EXPECT_EQ(err.expected, "string");
}

TEST_F(BinderNullTest, OptionalNonNullableRejectsExplicitNull) {
    auto err = bind_error(R"({"name": "Ada", "nickname": "A", "email": null})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnexpectedNull);
    EXPECT_EQ(err.hint, "omit the field instead of sending null");
}

TEST_F(BinderNullTest, RequiredNullableAcceptsNullButNotAbsence) {
    auto ok = bind_text(R"({"name": "Ada", "nickname": null})", *schema_);
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).as_object().state("nickname"), FieldState::Null);

    auto err = bind_error(R"({"name": "Ada"})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::MissingRequiredField);
    EXPECT_EQ(err.path, "nickname");
}

TEST_F(BinderNullTest, FieldsFollowDeclaredOrder) {
    auto result =
        bind_text(R"({"nickname": "A", "email": "a@b.c", "age": 3, "name": "Ada"})", *schema_);
    ASSERT_TRUE(is_ok(result));
    const auto& fields = unwrap(result).as_object().fields;
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0].name, "name");
    EXPECT_EQ(fields[1].name, "age");
    EXPECT_EQ(fields[2].name, "email");
    EXPECT_EQ(fields[3].name, "nickname");
}

// ============================================================================
// Depth Boundary
// ============================================================================

TEST(BinderDepthTest, TenLevelsSucceed) {
    auto registry = chain_registry(10);
    auto schema = compile_or_fail(registry, "L1");
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(chain_data(10), *schema);
    ASSERT_TRUE(is_ok(result));
}

TEST(BinderDepthTest, ElevenLevelsFail) {
    auto registry = chain_registry(11);
    auto schema = compile_or_fail(registry, "L1", 11);
    ASSERT_NE(schema, nullptr);

    for (int run = 0; run < 3; ++run) {
        auto err = bind_error(chain_data(11), *schema);
        EXPECT_EQ(err.kind, ErrorKind::NestingTooDeep);
        EXPECT_EQ(err.path, "next.next.next.next.next.next.next.next.next.next");
    }
}

TEST(BinderDepthTest, ElevenLevelSchemaRejectedAtCompile) {
    auto registry = chain_registry(11);
    auto result = registry.compile("L1");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::SchemaError);
}

// ============================================================================
// Fail-Fast Ordering
// ============================================================================

TEST(BinderFailFastTest, FirstDeclaredFieldWins) {
    SchemaRegistry registry;
    registry.add(ObjectSchema("Pair")
                     .required("a", SchemaType::int32())
                     .required("b", SchemaType::int32()));
    auto schema = compile_or_fail(registry, "Pair");
    ASSERT_NE(schema, nullptr);

    auto result = bind_text(R"({"b": "bad", "a": "also bad"})", *schema);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path, "a");
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
}

TEST(BinderFailFastTest, RootMustBeObject) {
    auto schema = single_field(SchemaType::int32());
    ASSERT_NE(schema, nullptr);

    auto err = bind_error("[1]", *schema);
    EXPECT_EQ(err.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(err.path, "");
    EXPECT_EQ(err.expected, "object Single");

    EXPECT_EQ(bind_error("null", *schema).kind, ErrorKind::UnexpectedNull);
}

// ============================================================================
// Unknown Fields
// ============================================================================

class BinderUnknownFieldTest : public ::testing::Test {
protected:
    void SetUp() override {
        SchemaRegistry registry;
        registry.add(ObjectSchema("User").required("name", SchemaType::string()));
        schema_ = compile_or_fail(registry, "User");
        ASSERT_NE(schema_, nullptr);
    }

    Box<CompiledSchema> schema_;
};

TEST_F(BinderUnknownFieldTest, RejectedByDefault) {
    auto err = bind_error(R"({"name": "John", "extra": 1})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnknownField);
    EXPECT_EQ(err.path, "extra");
    EXPECT_EQ(err.column, 18u);
    EXPECT_EQ(err.expected, "one of: name");
}

TEST_F(BinderUnknownFieldTest, IgnoredWhenConfigured) {
    BindOptions options;
    options.unknown_fields = UnknownFieldPolicy::Ignore;

    auto result = bind_text(R"({"name": "John", "extra": 1})", *schema_, options);
    ASSERT_TRUE(is_ok(result));
    const auto& user = unwrap(result).as_object();
    EXPECT_EQ(user.fields.size(), 1u);
    EXPECT_EQ(user.get("name").as_string(), "John");
}

TEST_F(BinderUnknownFieldTest, SuggestsCloseName) {
    auto err = bind_error(R"({"nmae": "John"})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnknownField);
    EXPECT_EQ(err.hint, "did you mean 'name'?");
}

TEST_F(BinderUnknownFieldTest, CaseMismatchIsUnknown) {
    auto err = bind_error(R"({"Name": "John"})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnknownField);
    EXPECT_EQ(err.hint, "did you mean 'name'?");
}

TEST_F(BinderUnknownFieldTest, ReportedBeforeDeclaredFieldErrors) {
    auto err = bind_error(R"({"name": 42, "extra": 1})", *schema_);
    EXPECT_EQ(err.kind, ErrorKind::UnknownField);
    EXPECT_EQ(err.path, "extra");

    BindOptions options;
    options.unknown_fields = UnknownFieldPolicy::Ignore;
    auto ignored = bind_error(R"({"name": 42, "extra": 1})", *schema_, options);
    EXPECT_EQ(ignored.kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(ignored.path, "name");
}

TEST_F(BinderUnknownFieldTest, MissingFieldMentionsNearMatchWhenIgnoring) {
    BindOptions options;
    options.unknown_fields = UnknownFieldPolicy::Ignore;

    auto err = bind_error(R"({"Name": "John"})", *schema_, options);
    EXPECT_EQ(err.kind, ErrorKind::MissingRequiredField);
    EXPECT_NE(err.hint.find("'Name'"), std::string::npos);
}

TEST(UnknownFieldPolicyTest, NamesRoundTrip) {
    EXPECT_EQ(parse_unknown_field_policy("reject"), UnknownFieldPolicy::Reject);
    EXPECT_EQ(parse_unknown_field_policy("ignore"), UnknownFieldPolicy::Ignore);
    EXPECT_FALSE(parse_unknown_field_policy("Ignore").has_value());
    EXPECT_STREQ(unknown_field_policy_name(UnknownFieldPolicy::Ignore), "ignore");
}

// ============================================================================
// Positions, Rendering and Cancellation
// ============================================================================

TEST(BinderErrorTest, ReportsPositionOfOffendingValue) {
    SchemaRegistry registry;
    registry.add(ObjectSchema("User").required("age", SchemaType::int32()));
    auto schema = compile_or_fail(registry, "User");
    ASSERT_NE(schema, nullptr);

    auto err = bind_error("{\n  \"age\": \"36\"\n}", *schema);
    EXPECT_EQ(err.line, 2u);
    EXPECT_EQ(err.column, 10u);
    EXPECT_EQ(err.to_string(),
              "[B001] line 2, column 10: type mismatch at field 'age' (at 'age'): expected int32, "
              "found string \"36\"; hint: remove the quotes around the numeric value");
}

TEST(BinderErrorTest, CancelledBinding) {
    auto schema = single_field(SchemaType::int32());
    ASSERT_NE(schema, nullptr);

    CancellationToken token;
    token.cancel();
    auto result = bind_text(R"({"x": 1})", *schema, BindOptions{}, &token);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Cancelled);
}

TEST(BinderErrorTest, BindAsArbitraryType) {
    auto schema = single_field(SchemaType::int32());
    ASSERT_NE(schema, nullptr);

    auto parsed = parse_json("[1, 2]", LimitConfig{});
    ASSERT_TRUE(is_ok(parsed));

    Binder binder(*schema, BindOptions{});
    auto result = binder.bind_as(unwrap(parsed), SchemaType::list_of(SchemaType::int64()), "ids");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_list().items[1].as_int64(), 2);

    auto bad = binder.bind_as(unwrap(parsed), SchemaType::string(), "ids");
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).path, "ids");
}
