//! # JSON Error Types
//!
//! This module provides the error type reported by every fallible weft
//! operation. Errors carry a kind, a message, the label of the input they
//! came from and the precise source location.
//!
//! ## Error Kinds
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `Lex` | Malformed token (bad escape, unterminated string, bad number) |
//! | `Parse` | Token of the wrong kind for the grammar position |
//! | `UnknownField` | Object key matches no field under strict matching |
//! | `TypeMismatch` | Token incompatible with the target type, or out of range |
//! | `Io` | Source could not be opened or sink failed to write |
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::make(JsonErrorKind::Parse, "expected ':'", "config.json", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "config.json:5:12: parse error: expected ':'"
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace weft::json {

/// Classification of a decode or encode failure.
enum class JsonErrorKind : uint8_t {
    Lex,          ///< Malformed token
    Parse,        ///< Unexpected token for the grammar position
    UnknownField, ///< Object key does not match any field (strict mode)
    TypeMismatch, ///< Token incompatible with the expected type
    Io            ///< Underlying source or sink failure
};

/// Returns the lowercase display name of an error kind (e.g. `"parse"`).
[[nodiscard]] inline auto error_kind_name(JsonErrorKind kind) -> const char* {
    switch (kind) {
    case JsonErrorKind::Lex:
        return "lex";
    case JsonErrorKind::Parse:
        return "parse";
    case JsonErrorKind::UnknownField:
        return "unknown field";
    case JsonErrorKind::TypeMismatch:
        return "type mismatch";
    case JsonErrorKind::Io:
        return "io";
    }
    return "unknown";
}

/// An error encountered while decoding or encoding JSON.
///
/// # Fields
///
/// - `kind`: What category of failure this is
/// - `message`: Description of what went wrong, including expected vs. found
/// - `source`: Label of the input (file name, `"<input>"`, ...)
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input
struct JsonError {
    JsonErrorKind kind = JsonErrorKind::Parse;

    /// Human-readable error description.
    std::string message;

    /// Label of the input the error refers to (may be empty).
    std::string source;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred.
    size_t offset = 0;

    /// Creates an error without location information.
    static auto make(JsonErrorKind kind, std::string msg) -> JsonError {
        return JsonError{kind, std::move(msg), {}, 0, 0, 0};
    }

    /// Creates an error with full location information.
    static auto make(JsonErrorKind kind, std::string msg, std::string source, size_t line,
                     size_t column, size_t offset = 0) -> JsonError {
        return JsonError{kind, std::move(msg), std::move(source), line, column, offset};
    }

    /// Formats the error as a human-readable string.
    ///
    /// The format depends on available location information:
    /// - With source and location: `"src:line:col: kind error: message"`
    /// - With location only: `"line X, column Y: kind error: message"`
    /// - Without location: `"kind error: message"`
    [[nodiscard]] auto to_string() const -> std::string {
        std::string body = std::string(error_kind_name(kind)) + " error: " + message;
        if (line > 0 && !source.empty()) {
            return source + ":" + std::to_string(line) + ":" + std::to_string(column) + ": " + body;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   body;
        }
        if (!source.empty()) {
            return source + ": " + body;
        }
        return body;
    }
};

} // namespace weft::json
