//! # JSON Lexer Implementation
//!
//! Character-at-a-time tokenizer over a `JsonSource`.
//!
//! ## Lexer Details
//!
//! The lexer handles:
//! - Structural tokens: `{`, `}`, `[`, `]`, `:`, `,`
//! - String literals with escape sequences, including UTF-16 surrogate pairs
//! - Numbers following the RFC 8259 grammar
//! - Keywords: `true`, `false`, `null`
//! - Whitespace skipping
//!
//! Because sources are not seekable, every decision is made with at most one
//! character of lookahead.

#include "weft/json/json_lexer.hpp"

namespace weft::json {

namespace {

auto is_digit(int c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_alpha(int c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto hex_value(int c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

auto token_kind_name(JsonTokenKind kind) -> const char* {
    switch (kind) {
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::String:
        return "string";
    case JsonTokenKind::Number:
        return "number";
    case JsonTokenKind::True:
        return "'true'";
    case JsonTokenKind::False:
        return "'false'";
    case JsonTokenKind::Null:
        return "'null'";
    case JsonTokenKind::Eof:
        return "end of input";
    case JsonTokenKind::Error:
        return "invalid token";
    }
    return "token";
}

// ============================================================================
// JsonLexer Implementation
// ============================================================================

JsonLexer::JsonLexer(JsonSource& source) : source_(source) {}

auto JsonLexer::peek() -> int {
    return source_.peek();
}

/// Advances the position and returns the consumed character.
///
/// Updates line and column tracking for newlines.
auto JsonLexer::advance() -> int {
    int c = source_.get();
    if (c == END_OF_INPUT) {
        return c;
    }
    ++offset_;
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (true) {
        int c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_line, size_t start_col,
                           size_t start_offset) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_offset;
    return tok;
}

/// Records a `Lex` error and returns the matching `Error` token.
auto JsonLexer::make_error(const std::string& msg, size_t start_line, size_t start_col,
                           size_t start_offset) -> JsonToken {
    errors_.push_back(JsonError::make(JsonErrorKind::Lex, msg, std::string(source_.label()),
                                      start_line, start_col, start_offset));
    JsonToken tok = make_token(JsonTokenKind::Error, start_line, start_col, start_offset);
    tok.text = msg;
    return tok;
}

auto JsonLexer::read_hex4(uint32_t& out) -> bool {
    out = 0;
    for (int i = 0; i < 4; ++i) {
        int v = hex_value(peek());
        if (v < 0) {
            return false;
        }
        advance();
        out = (out << 4) | static_cast<uint32_t>(v);
    }
    return true;
}

/// Scans a string token starting at the opening quote.
///
/// Handles escape sequences according to RFC 8259:
/// - `\"`, `\\`, `\/`, `\b`, `\f`, `\n`, `\r`, `\t`
/// - `\uXXXX`, with surrogate pairs combined into one code point
auto JsonLexer::scan_string() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_offset = offset_;

    advance(); // Skip opening quote

    std::string value;
    while (true) {
        int c = peek();

        if (c == END_OF_INPUT) {
            return make_error("unterminated string", start_line, start_col, start_offset);
        }

        if (c == '"') {
            advance(); // Skip closing quote
            JsonToken tok = make_token(JsonTokenKind::String, start_line, start_col, start_offset);
            tok.text = std::move(value);
            return tok;
        }

        if (c == '\\') {
            advance(); // Skip backslash
            int escaped = advance();
            switch (escaped) {
            case '"':
                value += '"';
                break;
            case '\\':
                value += '\\';
                break;
            case '/':
                value += '/';
                break;
            case 'b':
                value += '\b';
                break;
            case 'f':
                value += '\f';
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case 'u': {
                uint32_t codepoint = 0;
                if (!read_hex4(codepoint)) {
                    return make_error("invalid unicode escape sequence", line_, column_, offset_);
                }
                if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                    return make_error("unpaired low surrogate in unicode escape", line_, column_,
                                      offset_);
                }
                if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                    uint32_t low = 0;
                    if (advance() != '\\' || advance() != 'u' || !read_hex4(low) || low < 0xDC00 ||
                        low > 0xDFFF) {
                        return make_error("unpaired high surrogate in unicode escape", line_,
                                          column_, offset_);
                    }
                    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                }
                append_utf8(value, codepoint);
                break;
            }
            case END_OF_INPUT:
                return make_error("unterminated string", start_line, start_col, start_offset);
            default:
                return make_error("invalid escape sequence: \\" +
                                      std::string(1, static_cast<char>(escaped)),
                                  line_, column_, offset_);
            }
        } else if (c < 0x20) {
            return make_error("control character in string", line_, column_, offset_);
        } else {
            value += static_cast<char>(c);
            advance();
        }
    }
}

/// Scans a number token.
///
/// Grammar: `-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?`
auto JsonLexer::scan_number() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_offset = offset_;

    std::string lexeme;
    bool is_integer = true;

    if (peek() == '-') {
        lexeme += static_cast<char>(advance());
    }

    // Integer part
    if (peek() == '0') {
        lexeme += static_cast<char>(advance());
        if (is_digit(peek())) {
            return make_error("leading zeros are not allowed in numbers", start_line, start_col,
                              start_offset);
        }
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            lexeme += static_cast<char>(advance());
        }
    } else {
        return make_error("invalid number", start_line, start_col, start_offset);
    }

    // Fractional part
    if (peek() == '.') {
        is_integer = false;
        lexeme += static_cast<char>(advance());
        if (!is_digit(peek())) {
            return make_error("expected digit after decimal point", start_line, start_col,
                              start_offset);
        }
        while (is_digit(peek())) {
            lexeme += static_cast<char>(advance());
        }
    }

    // Exponent part
    if (peek() == 'e' || peek() == 'E') {
        is_integer = false;
        lexeme += static_cast<char>(advance());
        if (peek() == '+' || peek() == '-') {
            lexeme += static_cast<char>(advance());
        }
        if (!is_digit(peek())) {
            return make_error("expected digit in exponent", start_line, start_col, start_offset);
        }
        while (is_digit(peek())) {
            lexeme += static_cast<char>(advance());
        }
    }

    JsonToken tok = make_token(JsonTokenKind::Number, start_line, start_col, start_offset);
    tok.text = std::move(lexeme);
    tok.is_integer = is_integer;
    return tok;
}

/// Scans a keyword token (`true`, `false`, `null`).
auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_offset = offset_;

    std::string word;
    while (is_alpha(peek())) {
        word += static_cast<char>(advance());
    }

    if (word == "true") {
        return make_token(JsonTokenKind::True, start_line, start_col, start_offset);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_line, start_col, start_offset);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_line, start_col, start_offset);
    }

    return make_error("unknown keyword: " + word, start_line, start_col, start_offset);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t start_line = line_;
    size_t start_col = column_;
    size_t start_offset = offset_;
    int c = peek();

    switch (c) {
    case END_OF_INPUT:
        return make_token(JsonTokenKind::Eof, start_line, start_col, start_offset);
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_line, start_col, start_offset);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_line, start_col, start_offset);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_line, start_col, start_offset);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_line, start_col, start_offset);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_line, start_col, start_offset);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_line, start_col, start_offset);
    case '"':
        return scan_string();
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return scan_number();
    default:
        if (is_alpha(c)) {
            return scan_keyword();
        }
        advance();
        return make_error("unexpected character: " + std::string(1, static_cast<char>(c)),
                          start_line, start_col, start_offset);
    }
}

} // namespace weft::json
