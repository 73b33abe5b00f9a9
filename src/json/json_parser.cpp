//! # JSON Parser State Implementation
//!
//! Token cursor with lazy one-token lookahead, the shared separator and key
//! helpers, and the value skipper used when unknown keys are ignored.

#include "weft/json/json_parser.hpp"

namespace weft::json {

JsonParser::JsonParser(JsonSource& source, DecodeOptions options)
    : lexer_(source), options_(options) {}

auto JsonParser::current() -> JsonToken& {
    if (!has_current_) {
        current_ = lexer_.next_token();
        has_current_ = true;
    }
    return current_;
}

auto JsonParser::peek_kind() -> JsonTokenKind {
    return current().kind;
}

void JsonParser::advance() {
    // Eof is sticky; there is nothing behind it to pull.
    if (has_current_ && current_.kind == JsonTokenKind::Eof) {
        return;
    }
    has_current_ = false;
}

auto JsonParser::check(JsonTokenKind kind) -> bool {
    return current().kind == kind;
}

auto JsonParser::match(JsonTokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto JsonParser::expect(JsonTokenKind kind) -> Result<bool, JsonError> {
    if (check(kind)) {
        advance();
        return true;
    }
    return unexpected(token_kind_name(kind));
}

auto JsonParser::read_key() -> Result<std::string, JsonError> {
    if (!check(JsonTokenKind::String)) {
        return unexpected("string key");
    }
    std::string key = std::move(current().text);
    advance();

    if (!match(JsonTokenKind::Colon)) {
        return unexpected("':' after object key");
    }
    return key;
}

auto JsonParser::after_element(JsonTokenKind close) -> Result<bool, JsonError> {
    if (match(JsonTokenKind::Comma)) {
        if (check(close)) {
            return make_error(JsonErrorKind::Parse, close == JsonTokenKind::RBracket
                                                        ? "trailing comma in array"
                                                        : "trailing comma in object");
        }
        return true;
    }
    if (match(close)) {
        return false;
    }
    return unexpected(std::string("',' or ") + token_kind_name(close));
}

auto JsonParser::skip_value() -> Result<bool, JsonError> {
    switch (peek_kind()) {
    case JsonTokenKind::String:
    case JsonTokenKind::Number:
    case JsonTokenKind::True:
    case JsonTokenKind::False:
    case JsonTokenKind::Null:
        advance();
        return true;

    case JsonTokenKind::LBrace: {
        auto entered = enter();
        if (is_err(entered)) {
            return entered;
        }
        advance();
        if (match(JsonTokenKind::RBrace)) {
            leave();
            return true;
        }
        while (true) {
            auto key = read_key();
            if (is_err(key)) {
                return unwrap_err(key);
            }
            auto skipped = skip_value();
            if (is_err(skipped)) {
                return skipped;
            }
            auto more = after_element(JsonTokenKind::RBrace);
            if (is_err(more)) {
                return more;
            }
            if (!unwrap(more)) {
                break;
            }
        }
        leave();
        return true;
    }

    case JsonTokenKind::LBracket: {
        auto entered = enter();
        if (is_err(entered)) {
            return entered;
        }
        advance();
        if (match(JsonTokenKind::RBracket)) {
            leave();
            return true;
        }
        while (true) {
            auto skipped = skip_value();
            if (is_err(skipped)) {
                return skipped;
            }
            auto more = after_element(JsonTokenKind::RBracket);
            if (is_err(more)) {
                return more;
            }
            if (!unwrap(more)) {
                break;
            }
        }
        leave();
        return true;
    }

    default:
        return unexpected("value");
    }
}

auto JsonParser::enter() -> Result<bool, JsonError> {
    if (depth_ >= options_.max_depth) {
        return make_error(JsonErrorKind::Parse, "maximum nesting depth exceeded");
    }
    ++depth_;
    return true;
}

void JsonParser::leave() {
    if (depth_ > 0) {
        --depth_;
    }
}

auto JsonParser::finish() -> Result<bool, JsonError> {
    if (check(JsonTokenKind::Eof)) {
        return true;
    }
    if (check(JsonTokenKind::Error)) {
        return lex_error();
    }
    return make_error(JsonErrorKind::Parse, "unexpected content after JSON value");
}

auto JsonParser::make_error(JsonErrorKind kind, const std::string& msg) -> JsonError {
    const auto& tok = current();
    return JsonError::make(kind, msg, std::string(lexer_.label()), tok.line, tok.column,
                           tok.offset);
}

auto JsonParser::unexpected(const std::string& what) -> JsonError {
    if (check(JsonTokenKind::Error)) {
        return lex_error();
    }
    return make_error(JsonErrorKind::Parse, "expected " + what + ", found " + describe_current());
}

auto JsonParser::type_mismatch(const std::string& what) -> JsonError {
    if (check(JsonTokenKind::Error)) {
        return lex_error();
    }
    return make_error(JsonErrorKind::TypeMismatch,
                      "expected " + what + ", found " + describe_current());
}

auto JsonParser::lex_error() -> JsonError {
    if (lexer_.has_errors()) {
        return lexer_.errors().back();
    }
    return make_error(JsonErrorKind::Lex, current().text);
}

auto JsonParser::describe_current() -> std::string {
    const auto& tok = current();
    switch (tok.kind) {
    case JsonTokenKind::String:
        return "string \"" + tok.text + "\"";
    case JsonTokenKind::Number:
        return "number " + tok.text;
    default:
        return token_kind_name(tok.kind);
    }
}

} // namespace weft::json
