//! # JSON Lexer Tests
//!
//! - Structural tokens and keywords
//! - String escapes and surrogate pairs
//! - Number grammar and the integer flag
//! - Lexical errors and positions

#include "weft/json/json_lexer.hpp"
#include "weft/json/json_source.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace weft::json;

namespace {

auto lex_all(const std::string& text) -> std::vector<JsonToken> {
    StringSource source(text);
    JsonLexer lexer(source);
    std::vector<JsonToken> tokens;
    while (true) {
        JsonToken tok = lexer.next_token();
        tokens.push_back(tok);
        if (tok.kind == JsonTokenKind::Eof || tok.kind == JsonTokenKind::Error) {
            break;
        }
    }
    return tokens;
}

auto lex_one(const std::string& text) -> JsonToken {
    StringSource source(text);
    JsonLexer lexer(source);
    return lexer.next_token();
}

} // namespace

// ============================================================================
// Structure
// ============================================================================

TEST(JsonLexerTest, StructuralTokens) {
    auto tokens = lex_all("{ } [ ] : ,");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].kind, JsonTokenKind::LBrace);
    EXPECT_EQ(tokens[1].kind, JsonTokenKind::RBrace);
    EXPECT_EQ(tokens[2].kind, JsonTokenKind::LBracket);
    EXPECT_EQ(tokens[3].kind, JsonTokenKind::RBracket);
    EXPECT_EQ(tokens[4].kind, JsonTokenKind::Colon);
    EXPECT_EQ(tokens[5].kind, JsonTokenKind::Comma);
    EXPECT_EQ(tokens[6].kind, JsonTokenKind::Eof);
}

TEST(JsonLexerTest, Keywords) {
    auto tokens = lex_all("true false null");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, JsonTokenKind::True);
    EXPECT_EQ(tokens[1].kind, JsonTokenKind::False);
    EXPECT_EQ(tokens[2].kind, JsonTokenKind::Null);
}

TEST(JsonLexerTest, EofIsRepeated) {
    StringSource source("  ");
    JsonLexer lexer(source);
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::Eof);
    EXPECT_EQ(lexer.next_token().kind, JsonTokenKind::Eof);
    EXPECT_FALSE(lexer.has_errors());
}

TEST(JsonLexerTest, TracksLinesAndColumns) {
    auto tokens = lex_all("{\n  \"a\": 1\n}");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[0].column, 1u);
    EXPECT_EQ(tokens[1].line, 2u);
    EXPECT_EQ(tokens[1].column, 3u);
    EXPECT_EQ(tokens[3].line, 2u);
    EXPECT_EQ(tokens[3].column, 8u);
    EXPECT_EQ(tokens[4].line, 3u);
    EXPECT_EQ(tokens[4].column, 1u);
}

TEST(JsonLexerTest, StopsRightAfterToken) {
    StringSource source("42 rest");
    JsonLexer lexer(source);
    auto tok = lexer.next_token();
    EXPECT_EQ(tok.kind, JsonTokenKind::Number);
    EXPECT_EQ(source.remaining(), " rest");
}

// ============================================================================
// Strings
// ============================================================================

TEST(JsonLexerTest, SimpleString) {
    auto tok = lex_one(R"("hello")");
    EXPECT_EQ(tok.kind, JsonTokenKind::String);
    EXPECT_EQ(tok.text, "hello");
}

TEST(JsonLexerTest, StringEscapes) {
    auto tok = lex_one(R"("a\"b\\c\/d\b\f\n\r\t")");
    ASSERT_EQ(tok.kind, JsonTokenKind::String);
    EXPECT_EQ(tok.text, "a\"b\\c/d\b\f\n\r\t");
}

TEST(JsonLexerTest, UnicodeEscape) {
    auto tok = lex_one(R"("\u00e9\u4e2d")");
    ASSERT_EQ(tok.kind, JsonTokenKind::String);
    EXPECT_EQ(tok.text, "\xC3\xA9\xE4\xB8\xAD");
}

TEST(JsonLexerTest, SurrogatePairCombines) {
    auto tok = lex_one(R"("\ud83d\ude00")");
    ASSERT_EQ(tok.kind, JsonTokenKind::String);
    EXPECT_EQ(tok.text, "\xF0\x9F\x98\x80");
}

TEST(JsonLexerTest, LoneLowSurrogateIsError) {
    auto tok = lex_one(R"("\ude00")");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
}

TEST(JsonLexerTest, HighSurrogateWithoutLowIsError) {
    auto tok = lex_one(R"("\ud83dx")");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
}

TEST(JsonLexerTest, RawUtf8PassesThrough) {
    auto tok = lex_one("\"caf\xC3\xA9\"");
    ASSERT_EQ(tok.kind, JsonTokenKind::String);
    EXPECT_EQ(tok.text, "caf\xC3\xA9");
}

TEST(JsonLexerTest, UnterminatedString) {
    StringSource source("\"abc");
    JsonLexer lexer(source);
    auto tok = lexer.next_token();
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    ASSERT_TRUE(lexer.has_errors());
    EXPECT_EQ(lexer.errors().back().kind, JsonErrorKind::Lex);
    EXPECT_EQ(lexer.errors().back().message, "unterminated string");
}

TEST(JsonLexerTest, InvalidEscape) {
    auto tok = lex_one(R"("\x")");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    EXPECT_EQ(tok.text, "invalid escape sequence: \\x");
}

TEST(JsonLexerTest, ControlCharacterInString) {
    auto tok = lex_one("\"a\nb\"");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
}

// ============================================================================
// Numbers
// ============================================================================

TEST(JsonLexerTest, IntegerNumbers) {
    for (const char* text : {"0", "42", "-17", "123456789012345678901234567890"}) {
        auto tok = lex_one(text);
        ASSERT_EQ(tok.kind, JsonTokenKind::Number) << text;
        EXPECT_TRUE(tok.is_integer) << text;
        EXPECT_EQ(tok.text, text);
    }
}

TEST(JsonLexerTest, FloatNumbers) {
    for (const char* text : {"1.5", "-0.25", "1e10", "2E-3", "6.02e+23"}) {
        auto tok = lex_one(text);
        ASSERT_EQ(tok.kind, JsonTokenKind::Number) << text;
        EXPECT_FALSE(tok.is_integer) << text;
        EXPECT_EQ(tok.text, text);
    }
}

TEST(JsonLexerTest, LeadingZerosRejected) {
    auto tok = lex_one("012");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
}

TEST(JsonLexerTest, MissingFractionDigits) {
    auto tok = lex_one("1.");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    EXPECT_EQ(tok.text, "expected digit after decimal point");
}

TEST(JsonLexerTest, MissingExponentDigits) {
    auto tok = lex_one("1e+");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    EXPECT_EQ(tok.text, "expected digit in exponent");
}

TEST(JsonLexerTest, LoneMinus) {
    auto tok = lex_one("-x");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
}

// ============================================================================
// Other Errors
// ============================================================================

TEST(JsonLexerTest, UnknownKeyword) {
    auto tok = lex_one("nil");
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    EXPECT_EQ(tok.text, "unknown keyword: nil");
}

TEST(JsonLexerTest, UnexpectedCharacter) {
    StringSource source("  @", "doc.json");
    JsonLexer lexer(source);
    auto tok = lexer.next_token();
    EXPECT_EQ(tok.kind, JsonTokenKind::Error);
    ASSERT_TRUE(lexer.has_errors());
    const auto& err = lexer.errors().back();
    EXPECT_EQ(err.source, "doc.json");
    EXPECT_EQ(err.line, 1u);
    EXPECT_EQ(err.column, 3u);
    EXPECT_EQ(err.to_string(), "doc.json:1:3: lex error: unexpected character: @");
}
