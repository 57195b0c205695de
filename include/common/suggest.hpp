//! # "Did You Mean?" Suggestions
//!
//! Edit-distance helpers used when building remediation hints, for example
//! when an input object carries a key that is one typo away from a declared
//! field name.

#ifndef STRICTJSON_COMMON_SUGGEST_HPP
#define STRICTJSON_COMMON_SUGGEST_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace strictjson {

/// Computes the case-insensitive Levenshtein distance between two strings.
auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t;

/// Returns the candidate closest to `input` within `max_distance` edits,
/// or an empty string when nothing is close enough.
auto find_similar(std::string_view input, const std::vector<std::string>& candidates,
                  size_t max_distance = 2) -> std::string;

} // namespace strictjson

#endif // STRICTJSON_COMMON_SUGGEST_HPP
