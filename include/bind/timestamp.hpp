//! # UTC Timestamps
//!
//! The only accepted textual date-time form is
//! `YYYY-MM-DDTHH:mm:ss(.fff)?Z`: an upper-case `T`, an optional fraction
//! of exactly three digits and the upper-case `Z` designator. Offsets,
//! date-only strings, epoch numbers and lower-case separators are rejected.
//! The value is interpreted as UTC; no local-time conversion ever happens.

#pragma once

#include "common.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace strictjson::bind {

/// A UTC instant with millisecond precision.
struct Timestamp {
    /// Milliseconds since 1970-01-01T00:00:00Z.
    int64_t epoch_millis = 0;

    /// Parses the canonical form. On failure the error describes what is
    /// wrong with `text`.
    [[nodiscard]] static auto parse(std::string_view text) -> Result<Timestamp, std::string>;

    [[nodiscard]] static auto from_millis(int64_t millis) -> Timestamp {
        return Timestamp{millis};
    }

    /// Renders `YYYY-MM-DDTHH:mm:ss.fffZ`.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator<=>(const Timestamp&) const = default;
};

/// The format reminder used in error hints.
constexpr const char* TIMESTAMP_FORMAT = "YYYY-MM-DDTHH:mm:ss(.fff)?Z";

} // namespace strictjson::bind
