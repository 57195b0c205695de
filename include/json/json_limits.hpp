//! # Limit Guard
//!
//! Resource ceilings enforced while bytes are tokenized and parsed. Every
//! check is O(1) and fails fast, before the offending input is buffered.
//!
//! ## Limits
//!
//! | Option | Default | Error |
//! |--------|---------|-------|
//! | `max_payload_bytes` | 10 MiB | `PayloadTooLarge` |
//! | `max_nesting_depth` | 10 | `NestingTooDeep` |
//! | `max_array_elements` | 10,000 | `ArrayTooLarge` |
//! | `max_string_length` | 1 MiB | `StringTooLong` |
//!
//! Depth counts open objects and arrays together, so `[[1]]` has depth 2.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace strictjson::json {

/// The four independently configurable ceilings.
struct LimitConfig {
    static constexpr size_t DEFAULT_MAX_PAYLOAD_BYTES = 10 * 1024 * 1024;
    static constexpr size_t DEFAULT_MAX_NESTING_DEPTH = 10;
    static constexpr size_t DEFAULT_MAX_ARRAY_ELEMENTS = 10000;
    static constexpr size_t DEFAULT_MAX_STRING_LENGTH = 1024 * 1024;

    size_t max_payload_bytes = DEFAULT_MAX_PAYLOAD_BYTES;
    size_t max_nesting_depth = DEFAULT_MAX_NESTING_DEPTH;
    size_t max_array_elements = DEFAULT_MAX_ARRAY_ELEMENTS;
    size_t max_string_length = DEFAULT_MAX_STRING_LENGTH;

    /// Returns an error message if any limit is unusable, `std::nullopt` otherwise.
    [[nodiscard]] auto validate() const -> std::optional<std::string>;

    [[nodiscard]] auto operator==(const LimitConfig& other) const -> bool = default;
};

/// Applies a `LimitConfig` to one parse.
///
/// A guard is created per parse call and owned by the parser; it tracks the
/// current nesting depth and is never shared between threads.
///
/// # Example
///
/// ```cpp
/// LimitGuard guard(config);
/// if (auto err = guard.check_payload(input.size())) {
///     return std::move(*err);
/// }
/// ```
class LimitGuard {
public:
    explicit LimitGuard(const LimitConfig& config) : config_(config) {}

    [[nodiscard]] auto config() const -> const LimitConfig& {
        return config_;
    }

    /// Rejects input larger than `max_payload_bytes`.
    [[nodiscard]] auto check_payload(size_t size) const -> std::optional<DecodeError>;

    /// Enters an object or array scope. Fails when the new depth would
    /// exceed `max_nesting_depth`; `path` names the scope being opened.
    [[nodiscard]] auto enter_scope(SourcePos pos, const std::string& path)
        -> std::optional<DecodeError>;

    /// Leaves the innermost scope.
    void exit_scope() {
        if (depth_ > 0) {
            --depth_;
        }
    }

    [[nodiscard]] auto depth() const -> size_t {
        return depth_;
    }

    /// Rejects an array once it holds more than `max_array_elements`.
    [[nodiscard]] auto check_array_count(size_t count, SourcePos pos, const std::string& path) const
        -> std::optional<DecodeError>;

    /// Rejects a decoded string once it is longer than `max_string_length` bytes.
    [[nodiscard]] auto check_string_length(size_t length, SourcePos pos) const
        -> std::optional<DecodeError>;

    /// Fast-path form of `check_string_length` for the tokenizer's inner loop.
    [[nodiscard]] auto string_fits(size_t length) const -> bool {
        return length <= config_.max_string_length;
    }

private:
    LimitConfig config_;
    size_t depth_ = 0;
};

} // namespace strictjson::json
