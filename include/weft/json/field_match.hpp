//! # Field Matching
//!
//! Resolves JSON object keys to declared field names under identifier
//! normalization: comparison ignores ASCII case and the word separators `_`
//! and `-`, so `fooBar`, `foo_bar`, `FooBar` and `foo-bar` all name the same
//! field.
//!
//! Whether an unmatched key is an error or skipped is decided by the caller
//! from `DecodeOptions::strict_fields`; matching itself is a pure function.

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace weft::json {

/// Returns `name` lowercased with every `_` and `-` removed.
[[nodiscard]] auto normalize_identifier(std::string_view name) -> std::string;

/// Compares two identifiers under normalization without allocating.
[[nodiscard]] auto identifiers_match(std::string_view a, std::string_view b) -> bool;

/// Returns the index of the first name in `names` matching `key`.
[[nodiscard]] auto find_field(std::string_view key, std::span<const std::string_view> names)
    -> std::optional<size_t>;

} // namespace weft::json
