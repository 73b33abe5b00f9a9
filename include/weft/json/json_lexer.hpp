//! # JSON Lexer
//!
//! This module tokenizes a `JsonSource` one token at a time. Tokens are
//! produced lazily: the lexer never reads further into the source than the
//! token it is returning (plus one character of lookahead for numbers and
//! keywords).
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` | Left brace | `{` |
//! | `RBrace` | Right brace | `}` |
//! | `LBracket` | Left bracket | `[` |
//! | `RBracket` | Right bracket | `]` |
//! | `Colon` | Colon | `:` |
//! | `Comma` | Comma | `,` |
//! | `String` | Quoted string, unescaped | `"hello"` |
//! | `Number` | Number lexeme | `42`, `-1.5e3` |
//! | `True` | Boolean true | `true` |
//! | `False` | Boolean false | `false` |
//! | `Null` | Null value | `null` |
//! | `Eof` | End of input, returned forever once reached | |
//! | `Error` | Malformed input, see `JsonLexer::errors()` | |

#pragma once

#include "weft/json/json_error.hpp"
#include "weft/json/json_source.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace weft::json {

// ============================================================================
// Token Types
// ============================================================================

enum class JsonTokenKind : uint8_t {
    // Structural tokens
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    Colon,    ///< `:` - Key-value separator
    Comma,    ///< `,` - Element separator

    // Value tokens
    String, ///< `"..."` - String literal
    Number, ///< `123`, `-4.5e6` - Number literal
    True,   ///< `true`
    False,  ///< `false`
    Null,   ///< `null`

    // Special tokens
    Eof,  ///< End of input
    Error ///< Lexer error (check `JsonLexer::errors()`)
};

/// Returns a short description of a token kind for error messages.
[[nodiscard]] auto token_kind_name(JsonTokenKind kind) -> const char*;

/// A token produced by the JSON lexer.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;

    /// For `String`: the unescaped content. For `Number`: the lexeme.
    /// For `Error`: the lexer message.
    std::string text;

    /// For `Number`: `true` when the lexeme has neither fraction nor exponent.
    bool is_integer = false;

    /// Line number where this token starts (1-based).
    size_t line = 1;

    /// Column number where this token starts (1-based).
    size_t column = 1;

    /// Byte offset where this token starts.
    size_t offset = 0;
};

// ============================================================================
// Lexer
// ============================================================================

/// Streaming JSON lexer over a borrowed `JsonSource`.
///
/// # Example
///
/// ```cpp
/// StringSource source(R"({"key": 42})");
/// JsonLexer lexer(source);
/// while (true) {
///     JsonToken tok = lexer.next_token();
///     if (tok.kind == JsonTokenKind::Eof) break;
///     // Process token...
/// }
/// ```
class JsonLexer {
public:
    explicit JsonLexer(JsonSource& source);

    /// Returns the next token from the input.
    ///
    /// Returns `Eof` at the end of input, and keeps returning `Eof` on every
    /// later call. Malformed input yields an `Error` token and records a
    /// `Lex` error.
    auto next_token() -> JsonToken;

    /// Returns `true` if any errors occurred during lexing.
    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    /// Returns the list of errors encountered during lexing.
    [[nodiscard]] auto errors() const -> const std::vector<JsonError>& {
        return errors_;
    }

    /// Returns the label of the underlying source.
    [[nodiscard]] auto label() const -> std::string_view {
        return source_.label();
    }

private:
    JsonSource& source_;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t offset_ = 0;
    std::vector<JsonError> errors_;

    /// Returns the current character without advancing.
    [[nodiscard]] auto peek() -> int;

    /// Advances and returns the current character.
    auto advance() -> int;

    void skip_whitespace();

    auto make_token(JsonTokenKind kind, size_t start_line, size_t start_col, size_t start_offset)
        -> JsonToken;

    auto make_error(const std::string& msg, size_t start_line, size_t start_col,
                    size_t start_offset) -> JsonToken;

    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;

    /// Reads four hex digits of a `\u` escape.
    auto read_hex4(uint32_t& out) -> bool;
};

} // namespace weft::json
