//! # Strict Decoder Implementation

#include "decoder.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <optional>

namespace strictjson {

namespace {

/// Returns the token to poll: the caller's, or a per-call deadline token
/// stored in `local` when the config sets a timeout.
auto effective_token(const CancellationToken* cancel, const config::DecoderConfig& config,
                     std::optional<CancellationToken>& local) -> const CancellationToken* {
    if (cancel != nullptr || !config.timeout) {
        return cancel;
    }
    local.emplace(CancellationToken::with_timeout(*config.timeout));
    return &*local;
}

} // anonymous namespace

auto parse_document(std::string_view bytes, const config::DecoderConfig& config,
                    const CancellationToken* cancel) -> Result<json::JsonValue, json::DecodeError> {
    std::optional<CancellationToken> local;
    const CancellationToken* token = effective_token(cancel, config, local);

    auto parsed = json::parse_json(bytes, config.limits, token);
    if (is_err(parsed)) {
        STRICTJSON_LOG_DEBUG("decode", "Parse rejected: " << unwrap_err(parsed).to_string());
    }
    return parsed;
}

StrictDecoder::StrictDecoder(Rc<const schema::CompiledSchema> schema,
                             config::DecoderConfig config)
    : schema_(std::move(schema)), config_(std::move(config)) {}

auto StrictDecoder::decode(std::string_view bytes, const CancellationToken* cancel) const
    -> Result<bind::BoundValue, json::DecodeError> {
    std::optional<CancellationToken> local;
    const CancellationToken* token = effective_token(cancel, config_, local);

    auto parsed = json::parse_json(bytes, config_.limits, token);
    if (is_err(parsed)) {
        STRICTJSON_LOG_DEBUG("decode", "Parse rejected: " << unwrap_err(parsed).to_string());
        return unwrap_err(parsed);
    }

    auto bound = bind::bind(unwrap(parsed), *schema_, config_.bind_options(), token);
    if (is_err(bound)) {
        STRICTJSON_LOG_DEBUG("decode", "Bind rejected: " << unwrap_err(bound).to_string());
        return bound;
    }

    STRICTJSON_LOG_TRACE("decode", "Decoded " << bytes.size() << " bytes as "
                                              << schema_->root_name());
    return bound;
}

auto StrictDecoder::parse_only(std::string_view bytes, const CancellationToken* cancel) const
    -> Result<json::JsonValue, json::DecodeError> {
    return parse_document(bytes, config_, cancel);
}

} // namespace strictjson
