//! # JSON Options
//!
//! Configuration for decoding and encoding.
//!
//! | Option | Default | Effect |
//! |--------|---------|--------|
//! | `strict_fields` | `true` | Unknown object keys are errors (else skipped) |
//! | `duplicate_keys` | `Error` | Repeated record field or map key |
//! | `duplicate_elements` | `Error` | Repeated equal set element |
//! | `max_depth` | `1000` | Maximum nesting of arrays and objects |
//! | `indent` | `0` | Spaces per level when encoding, `0` = compact |
//!
//! Defining `WEFT_JSON_LENIENT` when building flips the default of
//! `strict_fields` to `false`.

#pragma once

#include <cstddef>
#include <cstdint>

namespace weft::json {

#ifdef WEFT_JSON_LENIENT
constexpr bool DEFAULT_STRICT_FIELDS = false;
#else
constexpr bool DEFAULT_STRICT_FIELDS = true;
#endif

/// What to do when a key or set element appears twice.
enum class DuplicatePolicy : uint8_t {
    Error,   ///< Fail with a `Parse` error
    LastWins ///< The later occurrence replaces the earlier one
};

struct DecodeOptions {
    /// Reject object keys that match no field (`UnknownField`) instead of
    /// skipping their values.
    bool strict_fields = DEFAULT_STRICT_FIELDS;

    DuplicatePolicy duplicate_keys = DuplicatePolicy::Error;

    DuplicatePolicy duplicate_elements = DuplicatePolicy::Error;

    /// Maximum nesting depth of arrays and objects.
    size_t max_depth = 1000;
};

struct EncodeOptions {
    /// Spaces per indentation level. `0` writes compact JSON.
    int indent = 0;
};

} // namespace weft::json
