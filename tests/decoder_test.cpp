//! # Strict Decoder Tests
//!
//! End-to-end pipeline behaviour, profile limits, cancellation and
//! timeouts, and concurrent decoding against one shared schema.

#include "decoder.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace strictjson;
using namespace strictjson::bind;
using namespace strictjson::config;
using namespace strictjson::json;
using namespace strictjson::schema;

namespace {

auto order_schema() -> Rc<const CompiledSchema> {
    SchemaRegistry registry;
    registry.add(ObjectSchema("Customer")
                     .required("name", SchemaType::string())
                     .optional("age", SchemaType::int32(), true));
    registry.add(ObjectSchema("Line")
                     .required("sku", SchemaType::string())
                     .required("quantity", SchemaType::int32())
                     .required("price", SchemaType::float64()));
    registry.add(ObjectSchema("Order")
                     .required("id", SchemaType::int64())
                     .required("customer", SchemaType::object("Customer"))
                     .required("lines", SchemaType::list_of(SchemaType::object("Line")))
                     .optional("tags", SchemaType::set_of(SchemaType::string()))
                     .required("placed_at", SchemaType::timestamp()));

    auto compiled = registry.compile("Order");
    EXPECT_TRUE(is_ok(compiled));
    return make_rc<const CompiledSchema>(std::move(unwrap(compiled)));
}

auto order_json(int id) -> std::string {
    std::string out = R"({"id": )" + std::to_string(id) + R"(, "customer": {"name": "c)" +
                      std::to_string(id % 17) + R"("}, "lines": [)";
    for (int i = 0; i < id % 4 + 1; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += R"({"sku": "s)" + std::to_string(i) + R"(", "quantity": )" + std::to_string(i + 1) +
               R"(, "price": )" + std::to_string(i) + ".5}";
    }
    out += R"(], "tags": ["a", "b", "a"], "placed_at": "2024-12-25T14:30:00Z"})";
    return out;
}

/// Every seventh input carries a defect so both outcomes are exercised.
auto mixed_input(int i) -> std::string {
    switch (i % 7) {
    case 3:
        return R"({"id": ")" + std::to_string(i) + R"("})";
    case 5:
        return order_json(i) + ",";
    default:
        return order_json(i);
    }
}

/// Collapses a decode result into a comparable string.
auto fingerprint(const Result<BoundValue, DecodeError>& result) -> std::string {
    if (is_ok(result)) {
        return "ok:" + unwrap(result).to_string();
    }
    return "err:" + unwrap_err(result).to_string();
}

} // anonymous namespace

// ============================================================================
// Pipeline
// ============================================================================

TEST(StrictDecoderTest, DecodesValidDocument) {
    StrictDecoder decoder(order_schema());
    auto result = decoder.decode(order_json(2));
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    const auto& order = unwrap(result).as_object();
    EXPECT_EQ(order.type_name, "Order");
    EXPECT_EQ(order.get("id").as_int64(), 2);
    EXPECT_EQ(order.get("customer").as_object().get("name").as_string(), "c2");
    EXPECT_EQ(order.get("customer").as_object().state("age"), FieldState::Missing);
    EXPECT_EQ(order.get("lines").as_list().size(), 3u);
    EXPECT_EQ(order.get("tags").as_set().size(), 2u);
    EXPECT_EQ(order.get("placed_at").as_timestamp().to_string(), "2024-12-25T14:30:00.000Z");
}

TEST(StrictDecoderTest, SyntaxErrorsStopBeforeBinding) {
    StrictDecoder decoder(order_schema());
    auto result = decoder.decode(R"({"id": 1,})");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::SyntaxError);
}

TEST(StrictDecoderTest, BindErrorsCarryFullPath) {
    StrictDecoder decoder(order_schema());
    std::string input = order_json(1);
    input.replace(input.find(R"("quantity": 2)"), 13, R"("quantity": "2")");

    auto result = decoder.decode(input);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::TypeMismatch);
    EXPECT_EQ(unwrap_err(result).path, "lines[1].quantity");
}

TEST(StrictDecoderTest, ParseOnlySkipsSchema) {
    StrictDecoder decoder(order_schema());
    EXPECT_TRUE(is_ok(decoder.parse_only(R"({"anything": [1, 2]})")));
    EXPECT_TRUE(is_err(decoder.parse_only(R"({"anything": [1, 2,]})")));
}

TEST(StrictDecoderTest, ExposesSchemaAndConfig) {
    StrictDecoder decoder(order_schema(), DecoderConfig::development());
    EXPECT_EQ(decoder.schema().root_name(), "Order");
    EXPECT_EQ(decoder.config(), DecoderConfig::development());
}

// ============================================================================
// Configuration
// ============================================================================

TEST(StrictDecoderTest, PayloadLimitFromConfig) {
    DecoderConfig config;
    config.limits.max_payload_bytes = 32;
    StrictDecoder decoder(order_schema(), config);

    auto result = decoder.decode(order_json(1));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::PayloadTooLarge);
}

TEST(StrictDecoderTest, UnknownFieldPolicyFromConfig) {
    std::string input = order_json(1);
    input.insert(1, R"("note": "x", )");

    StrictDecoder strict(order_schema());
    auto rejected = strict.decode(input);
    ASSERT_TRUE(is_err(rejected));
    EXPECT_EQ(unwrap_err(rejected).kind, ErrorKind::UnknownField);

    DecoderConfig config;
    config.unknown_fields = UnknownFieldPolicy::Ignore;
    StrictDecoder lenient(order_schema(), config);
    EXPECT_TRUE(is_ok(lenient.decode(input)));
}

TEST(ParseDocumentTest, UsesConfiguredLimits) {
    DecoderConfig config;
    config.limits.max_array_elements = 2;
    EXPECT_TRUE(is_ok(parse_document("[1, 2]", config)));
    auto result = parse_document("[1, 2, 3]", config);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::ArrayTooLarge);
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(StrictDecoderTest, CallerCancellation) {
    StrictDecoder decoder(order_schema());
    CancellationToken token;
    token.cancel();

    auto result = decoder.decode(order_json(1), &token);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Cancelled);
    EXPECT_EQ(category_of(unwrap_err(result).kind), ErrorCategory::Cancellation);
}

TEST(StrictDecoderTest, ExpiredDeadline) {
    StrictDecoder decoder(order_schema());
    auto token = CancellationToken::with_timeout(std::chrono::milliseconds(0));

    auto result = decoder.decode(order_json(1), &token);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Cancelled);
}

TEST(StrictDecoderTest, GenerousTimeoutFromConfig) {
    DecoderConfig config;
    config.timeout = std::chrono::milliseconds(60000);
    StrictDecoder decoder(order_schema(), config);
    EXPECT_TRUE(is_ok(decoder.decode(order_json(3))));
}

TEST(StrictDecoderTest, CenturiesLongTimeoutDoesNotExpire) {
    ConfigParser parser("[decoder]\ntimeout_ms = 10000000000000\n");
    auto file = parser.parse();
    ASSERT_TRUE(file.has_value()) << parser.error();

    StrictDecoder decoder(order_schema(), file->decoder);
    auto result = decoder.decode(order_json(1));
    EXPECT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
}

TEST(CancellationTokenTest, TimeoutSaturatesAtClockEnd) {
    auto token = CancellationToken::with_timeout(std::chrono::milliseconds::max());
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.deadline() == CancellationToken::Clock::time_point::max());

    auto near = CancellationToken::with_timeout(std::chrono::milliseconds(60000));
    EXPECT_FALSE(near.is_cancelled());
    EXPECT_LT(*near.deadline(), CancellationToken::Clock::time_point::max());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(StrictDecoderTest, ConcurrentDecodingMatchesSequential) {
    constexpr int INPUT_COUNT = 10000;
    const StrictDecoder decoder(order_schema());

    std::vector<std::string> inputs;
    inputs.reserve(INPUT_COUNT);
    for (int i = 0; i < INPUT_COUNT; ++i) {
        inputs.push_back(mixed_input(i));
    }

    std::vector<std::string> sequential(INPUT_COUNT);
    for (int i = 0; i < INPUT_COUNT; ++i) {
        sequential[i] = fingerprint(decoder.decode(inputs[i]));
    }

    unsigned thread_count = std::max(4u, std::thread::hardware_concurrency());
    std::vector<std::string> concurrent(INPUT_COUNT);
    std::atomic<int> next{0};
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (unsigned t = 0; t < thread_count; ++t) {
        workers.emplace_back([&] {
            for (int i = next.fetch_add(1); i < INPUT_COUNT; i = next.fetch_add(1)) {
                concurrent[i] = fingerprint(decoder.decode(inputs[i]));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    int failures = 0;
    for (int i = 0; i < INPUT_COUNT; ++i) {
        if (sequential[i].rfind("err:", 0) == 0) {
            ++failures;
        }
        EXPECT_EQ(concurrent[i], sequential[i]) << "input " << i;
    }
    EXPECT_GT(failures, 0);
    EXPECT_LT(failures, INPUT_COUNT);
}
