//! # Strict Decoder
//!
//! The public entry point: bytes in, a schema-conformant `BoundValue` or
//! exactly one `DecodeError` out.
//!
//! ```text
//! bytes -> payload check -> tokenizer -> parser -> binder -> BoundValue
//!                      (limit guard throughout)
//! ```
//!
//! ## Example
//!
//! ```cpp
//! SchemaRegistry registry;
//! registry.add(ObjectSchema("User")
//!                  .required("name", SchemaType::string())
//!                  .optional("age", SchemaType::int32(), true));
//! auto compiled = registry.compile("User");
//! // startup: treat a SchemaError as fatal
//!
//! StrictDecoder decoder(make_rc<const CompiledSchema>(std::move(unwrap(compiled))),
//!                       DecoderConfig::defaults());
//! auto result = decoder.decode(R"({"name": "Ada"})");
//! ```

#pragma once

#include "bind/binder.hpp"
#include "bind/bound_value.hpp"
#include "common.hpp"
#include "common/cancellation.hpp"
#include "config/decoder_config.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"
#include "schema/schema_registry.hpp"

#include <string_view>

namespace strictjson {

/// Runs the guarded structural parse only, honouring the configured
/// limits and timeout. Used for schema-less validation.
[[nodiscard]] auto parse_document(std::string_view bytes, const config::DecoderConfig& config,
                                  const CancellationToken* cancel = nullptr)
    -> Result<json::JsonValue, json::DecodeError>;

/// Decodes documents against one compiled schema.
///
/// Stateless after construction: `decode()` is `const`, keeps nothing
/// between calls and may run concurrently from any number of threads.
class StrictDecoder {
public:
    StrictDecoder(Rc<const schema::CompiledSchema> schema,
                  config::DecoderConfig config = config::DecoderConfig::defaults());

    /// Validates and binds `bytes`.
    ///
    /// When `cancel` is null and the configuration sets a timeout, a
    /// deadline token for this call is created internally.
    [[nodiscard]] auto decode(std::string_view bytes,
                              const CancellationToken* cancel = nullptr) const
        -> Result<bind::BoundValue, json::DecodeError>;

    /// Structural validation without binding.
    [[nodiscard]] auto parse_only(std::string_view bytes,
                                  const CancellationToken* cancel = nullptr) const
        -> Result<json::JsonValue, json::DecodeError>;

    [[nodiscard]] auto schema() const -> const schema::CompiledSchema& {
        return *schema_;
    }

    [[nodiscard]] auto config() const -> const config::DecoderConfig& {
        return config_;
    }

private:
    Rc<const schema::CompiledSchema> schema_;
    config::DecoderConfig config_;
};

} // namespace strictjson
