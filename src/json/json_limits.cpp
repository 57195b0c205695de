//! # Limit Guard Implementation

#include "json/json_limits.hpp"

namespace strictjson::json {

namespace {

constexpr size_t MAX_SUPPORTED_DEPTH = 64;

auto describe_bytes(size_t bytes) -> std::string {
    return std::to_string(bytes) + " bytes";
}

} // anonymous namespace

auto LimitConfig::validate() const -> std::optional<std::string> {
    if (max_payload_bytes == 0) {
        return "max_payload_bytes must be greater than zero";
    }
    if (max_nesting_depth == 0) {
        return "max_nesting_depth must be greater than zero";
    }
    if (max_nesting_depth > MAX_SUPPORTED_DEPTH) {
        return "max_nesting_depth must not exceed " + std::to_string(MAX_SUPPORTED_DEPTH);
    }
    if (max_array_elements == 0) {
        return "max_array_elements must be greater than zero";
    }
    if (max_string_length == 0) {
        return "max_string_length must be greater than zero";
    }
    return std::nullopt;
}

auto LimitGuard::check_payload(size_t size) const -> std::optional<DecodeError> {
    if (size <= config_.max_payload_bytes) {
        return std::nullopt;
    }
    return DecodeError::make(ErrorKind::PayloadTooLarge, "payload exceeds the configured size limit")
        .expected_found("at most " + describe_bytes(config_.max_payload_bytes),
                        describe_bytes(size))
        .with_hint("split the document or raise max_payload_bytes for this profile");
}

auto LimitGuard::enter_scope(SourcePos pos, const std::string& path)
    -> std::optional<DecodeError> {
    if (depth_ + 1 > config_.max_nesting_depth) {
        return DecodeError::make(ErrorKind::NestingTooDeep,
                                 "nesting depth exceeds the configured limit", pos)
            .with_path(path)
            .expected_found("depth at most " + std::to_string(config_.max_nesting_depth),
                            "depth " + std::to_string(depth_ + 1))
            .with_hint("flatten the structure");
    }
    ++depth_;
    return std::nullopt;
}

auto LimitGuard::check_array_count(size_t count, SourcePos pos, const std::string& path) const
    -> std::optional<DecodeError> {
    if (count <= config_.max_array_elements) {
        return std::nullopt;
    }
    return DecodeError::make(ErrorKind::ArrayTooLarge, "array exceeds the configured element limit",
                             pos)
        .with_path(path)
        .expected_found("at most " + std::to_string(config_.max_array_elements) + " elements",
                        "more than " + std::to_string(config_.max_array_elements))
        .with_hint("paginate the collection");
}

auto LimitGuard::check_string_length(size_t length, SourcePos pos) const
    -> std::optional<DecodeError> {
    if (length <= config_.max_string_length) {
        return std::nullopt;
    }
    return DecodeError::make(ErrorKind::StringTooLong, "string exceeds the configured length limit",
                             pos)
        .expected_found("at most " + describe_bytes(config_.max_string_length),
                        "at least " + describe_bytes(length));
}

} // namespace strictjson::json
