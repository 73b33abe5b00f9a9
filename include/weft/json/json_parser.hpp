//! # JSON Parser State
//!
//! `JsonParser` is the token cursor the decode engine drives. It wraps a
//! `JsonLexer` with one token of lookahead and the grammar helpers shared by
//! every container decoder.
//!
//! ## Cursor Discipline
//!
//! - `advance()` discards the current token. The next token is pulled from
//!   the lexer only when it is first inspected, so once a complete top-level
//!   value has been consumed nothing past it has been read from the source.
//! - After a value has been decoded the cursor sits on the first token that
//!   follows it: a comma, a closing bracket or brace, or end of input.
//! - After a failure the parser must not be used again.
//!
//! ## Example
//!
//! ```cpp
//! StringSource source("[1, 2]");
//! JsonParser parser(source);
//! auto open = parser.expect(JsonTokenKind::LBracket);
//! while (is_ok(open) && parser.peek_kind() == JsonTokenKind::Number) {
//!     parser.advance();
//!     parser.match(JsonTokenKind::Comma);
//! }
//! ```

#pragma once

#include "weft/common.hpp"
#include "weft/json/json_error.hpp"
#include "weft/json/json_lexer.hpp"
#include "weft/json/json_options.hpp"
#include "weft/json/json_source.hpp"

#include <string>
#include <string_view>

namespace weft::json {

class JsonParser {
public:
    explicit JsonParser(JsonSource& source, DecodeOptions options = {});

    /// Returns the current token, pulling it from the lexer if needed.
    auto current() -> JsonToken&;

    /// Returns the kind of the current token without consuming it.
    auto peek_kind() -> JsonTokenKind;

    /// Discards the current token.
    void advance();

    /// Checks if the current token is of the given kind.
    auto check(JsonTokenKind kind) -> bool;

    /// Consumes the current token if it is of the given kind.
    auto match(JsonTokenKind kind) -> bool;

    /// Consumes the current token, failing if it is not of the given kind.
    [[nodiscard]] auto expect(JsonTokenKind kind) -> Result<bool, JsonError>;

    /// Reads an object key and the colon after it.
    [[nodiscard]] auto read_key() -> Result<std::string, JsonError>;

    /// Handles the separator after an array element or object member.
    ///
    /// Returns `true` after consuming a comma (another element follows) and
    /// `false` after consuming `close`. A comma directly followed by `close`
    /// is rejected as a trailing comma.
    [[nodiscard]] auto after_element(JsonTokenKind close) -> Result<bool, JsonError>;

    /// Consumes exactly one JSON value of any shape.
    [[nodiscard]] auto skip_value() -> Result<bool, JsonError>;

    /// Enters one nesting level, failing beyond `max_depth`.
    [[nodiscard]] auto enter() -> Result<bool, JsonError>;

    /// Leaves one nesting level.
    void leave();

    /// Requires that only whitespace remains in the input.
    [[nodiscard]] auto finish() -> Result<bool, JsonError>;

    /// Creates an error located at the current token.
    [[nodiscard]] auto make_error(JsonErrorKind kind, const std::string& msg) -> JsonError;

    /// Creates a `Parse` error "expected <what>, found <current>".
    ///
    /// When the current token is a lexer error the `Lex` error is returned
    /// instead.
    [[nodiscard]] auto unexpected(const std::string& what) -> JsonError;

    /// Creates a `TypeMismatch` error "expected <what>, found <current>".
    ///
    /// When the current token is a lexer error the `Lex` error is returned
    /// instead.
    [[nodiscard]] auto type_mismatch(const std::string& what) -> JsonError;

    [[nodiscard]] auto options() const -> const DecodeOptions& {
        return options_;
    }

    [[nodiscard]] auto label() const -> std::string_view {
        return lexer_.label();
    }

    [[nodiscard]] auto depth() const -> size_t {
        return depth_;
    }

private:
    JsonLexer lexer_;
    JsonToken current_;
    bool has_current_ = false;
    DecodeOptions options_;
    size_t depth_ = 0;

    /// Returns the lexer error for the current `Error` token.
    [[nodiscard]] auto lex_error() -> JsonError;

    /// Describes the current token for error messages.
    [[nodiscard]] auto describe_current() -> std::string;
};

} // namespace weft::json
