//! # JSON Encode Tests
//!
//! - Primitive formatting and string escapes
//! - Records, tagged unions, enums and containers
//! - Pretty printing
//! - Sinks and write failures
//! - Decoding what was encoded

#include "weft/json/json.hpp"

#include <array>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <set>
#include <sstream>

using namespace weft;
using namespace weft::json;

namespace {

enum class Suit { Hearts, Spades };

enum class Rank : int16_t { Low = -1, High = 1 };

struct Card {
    Suit suit = Suit::Hearts;
    int value = 0;
    std::optional<std::string> nickname;
};

struct Deck {
    std::string owner_name;
    std::vector<Card> cards;
    std::map<std::string, int> scores;
};

struct Text {
    std::string body;
};

struct Picture {
    int width = 0;
    int height = 0;
};

enum class BlockKind { Text, Picture };

using Block = std::variant<Text, Picture>;

/// Sink that fails after a fixed number of characters.
class FailingSink : public JsonSink {
public:
    explicit FailingSink(size_t capacity) : capacity_(capacity) {}

    void write(char c) override {
        if (written_.size() >= capacity_) {
            failed_ = true;
            return;
        }
        written_ += c;
    }

    void write(std::string_view text) override {
        for (char c : text) {
            write(c);
        }
    }

    [[nodiscard]] auto ok() const -> bool override {
        return !failed_;
    }

    [[nodiscard]] auto label() const -> std::string_view override {
        return "failing";
    }

private:
    size_t capacity_;
    std::string written_;
    bool failed_ = false;
};

} // namespace

namespace weft::json {

template <> struct EnumTraits<Suit> {
    static constexpr std::array<std::pair<Suit, std::string_view>, 2> names{
        {{Suit::Hearts, "hearts"}, {Suit::Spades, "spades"}}};
};

template <> struct EnumTraits<BlockKind> {
    static constexpr std::array<std::pair<BlockKind, std::string_view>, 2> names{
        {{BlockKind::Text, "text"}, {BlockKind::Picture, "picture"}}};
};

template <> struct RecordTraits<Card> {
    static constexpr auto fields() {
        return std::make_tuple(WEFT_JSON_FIELD(Card, suit), WEFT_JSON_FIELD(Card, value),
                               WEFT_JSON_FIELD(Card, nickname));
    }
};

template <> struct RecordTraits<Deck> {
    static constexpr auto fields() {
        return std::make_tuple(WEFT_JSON_FIELD(Deck, owner_name), WEFT_JSON_FIELD(Deck, cards),
                               WEFT_JSON_FIELD(Deck, scores));
    }
};

template <> struct RecordTraits<Text> {
    static constexpr auto fields() {
        return std::make_tuple(WEFT_JSON_FIELD(Text, body));
    }
};

template <> struct RecordTraits<Picture> {
    static constexpr auto fields() {
        return std::make_tuple(WEFT_JSON_FIELD(Picture, width), WEFT_JSON_FIELD(Picture, height));
    }
};

template <> struct UnionTraits<Block> {
    using Tag = BlockKind;
    static constexpr std::string_view tag_field = "type";
    static constexpr std::array<BlockKind, 2> tags{BlockKind::Text, BlockKind::Picture};
};

} // namespace weft::json

// ============================================================================
// Primitives
// ============================================================================

TEST(JsonEncodeTest, Integers) {
    EXPECT_EQ(to_json(42), "42");
    EXPECT_EQ(to_json(-7), "-7");
    EXPECT_EQ(to_json(std::numeric_limits<int64_t>::min()), "-9223372036854775808");
    EXPECT_EQ(to_json(std::numeric_limits<uint64_t>::max()), "18446744073709551615");
    EXPECT_EQ(to_json(uint8_t{200}), "200");
}

TEST(JsonEncodeTest, Floats) {
    EXPECT_EQ(to_json(1.5), "1.5");
    EXPECT_EQ(to_json(2.0), "2.0");
    EXPECT_EQ(to_json(0.1), "0.1");
    EXPECT_EQ(to_json(1e300), "1e+300");
    EXPECT_EQ(to_json(0.5f), "0.5");
}

TEST(JsonEncodeTest, NonFiniteFloatsBecomeNull) {
    EXPECT_EQ(to_json(std::nan("")), "null");
    EXPECT_EQ(to_json(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(to_json(-std::numeric_limits<double>::infinity()), "null");
}

TEST(JsonEncodeTest, BooleansAndChars) {
    EXPECT_EQ(to_json(true), "true");
    EXPECT_EQ(to_json(false), "false");
    EXPECT_EQ(to_json('q'), R"("q")");
}

TEST(JsonEncodeTest, StringEscapes) {
    EXPECT_EQ(to_json(std::string("a\"b\\c\nd\te")), R"("a\"b\\c\nd\te")");
    EXPECT_EQ(to_json(std::string("\x01")), R"("\u0001")");
    EXPECT_EQ(to_json(std::string("caf\xC3\xA9")), "\"caf\xC3\xA9\"");
}

TEST(JsonEncodeTest, Enums) {
    EXPECT_EQ(to_json(Suit::Spades), R"("spades")");
    EXPECT_EQ(to_json(Rank::Low), "-1");
    EXPECT_EQ(to_json(Rank::High), "1");
}

// ============================================================================
// Composite Values
// ============================================================================

TEST(JsonEncodeTest, RecordFieldsInDeclarationOrder) {
    Card card{Suit::Hearts, 10, std::nullopt};
    EXPECT_EQ(to_json(card), R"({"suit":"hearts","value":10,"nickname":null})");
}

TEST(JsonEncodeTest, NestedRecord) {
    Deck deck;
    deck.owner_name = "ann";
    deck.cards.push_back(Card{Suit::Spades, 1, std::string("ace")});
    deck.scores["ann"] = 3;
    EXPECT_EQ(to_json(deck),
              R"({"owner_name":"ann","cards":[{"suit":"spades","value":1,"nickname":"ace"}],)"
              R"("scores":{"ann":3}})");
}

TEST(JsonEncodeTest, TaggedUnionWritesDiscriminantFirst) {
    Block text = Text{"hi"};
    Block picture = Picture{640, 480};
    EXPECT_EQ(to_json(text), R"({"type":"text","body":"hi"})");
    EXPECT_EQ(to_json(picture), R"({"type":"picture","width":640,"height":480})");
}

TEST(JsonEncodeTest, Containers) {
    EXPECT_EQ(to_json(std::vector<int>{}), "[]");
    EXPECT_EQ(to_json(std::vector<int>{1, 2, 3}), "[1,2,3]");
    EXPECT_EQ(to_json(std::array<int, 2>{4, 5}), "[4,5]");
    EXPECT_EQ(to_json(std::set<std::string>{"b", "a"}), R"(["a","b"])");
    EXPECT_EQ(to_json(std::make_pair(std::string("k"), 1)), R"(["k",1])");
    EXPECT_EQ(to_json(std::make_tuple(1, true, 2.5)), "[1,true,2.5]");
    EXPECT_EQ(to_json(std::map<std::string, int>{}), "{}");
    EXPECT_EQ(to_json(std::vector<bool>{true, false}), "[true,false]");
}

TEST(JsonEncodeTest, OptionalsAndPointers) {
    EXPECT_EQ(to_json(std::optional<int>{}), "null");
    EXPECT_EQ(to_json(std::optional<int>{3}), "3");
    EXPECT_EQ(to_json(std::unique_ptr<int>{}), "null");
    EXPECT_EQ(to_json(std::make_unique<int>(8)), "8");
    EXPECT_EQ(to_json(std::make_shared<std::string>("s")), R"("s")");
}

// ============================================================================
// Pretty Printing
// ============================================================================

TEST(JsonEncodeTest, PrettyPrinting) {
    Deck deck;
    deck.owner_name = "ann";
    deck.cards.push_back(Card{Suit::Hearts, 2, std::nullopt});

    EncodeOptions options;
    options.indent = 2;
    std::string expected = "{\n"
                           "  \"owner_name\": \"ann\",\n"
                           "  \"cards\": [\n"
                           "    {\n"
                           "      \"suit\": \"hearts\",\n"
                           "      \"value\": 2,\n"
                           "      \"nickname\": null\n"
                           "    }\n"
                           "  ],\n"
                           "  \"scores\": {}\n"
                           "}";
    EXPECT_EQ(to_json(deck, options), expected);
}

TEST(JsonEncodeTest, PrettyScalarHasNoWhitespace) {
    EncodeOptions options;
    options.indent = 4;
    EXPECT_EQ(to_json(5, options), "5");
    EXPECT_EQ(to_json(std::vector<int>{}, options), "[]");
}

// ============================================================================
// Sinks
// ============================================================================

TEST(JsonEncodeTest, EncodeToStream) {
    std::ostringstream out;
    StreamSink sink(out);
    auto result = encode(sink, std::vector<std::string>{"x"});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(out.str(), R"(["x"])");
}

TEST(JsonEncodeTest, SinkFailureIsIoError) {
    FailingSink sink(4);
    auto result = encode(sink, std::vector<int>{1, 2, 3, 4, 5});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, JsonErrorKind::Io);
    EXPECT_EQ(unwrap_err(result).source, "failing");
}

TEST(JsonEncodeTest, EncodeToFile) {
    auto path = (std::filesystem::temp_directory_path() / "weft_encode_test.json").string();
    {
        auto sink = FileSink::create(path);
        ASSERT_TRUE(is_ok(sink));
        auto result = encode(*unwrap(sink), Card{Suit::Spades, 3, std::nullopt});
        ASSERT_TRUE(is_ok(result));
    }
    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str(), R"({"suit":"spades","value":3,"nickname":null})");
    std::filesystem::remove(path);
}

TEST(JsonEncodeTest, FileSinkCreateFailure) {
    auto sink = FileSink::create("/nonexistent-dir/weft/out.json");
    ASSERT_TRUE(is_err(sink));
    EXPECT_EQ(unwrap_err(sink).kind, JsonErrorKind::Io);
}

// ============================================================================
// Decoding Encoded Output
// ============================================================================

TEST(JsonEncodeTest, DeckSurvivesEncodeDecode) {
    Deck deck;
    deck.owner_name = "zoe";
    deck.cards.push_back(Card{Suit::Hearts, 7, std::string("lucky")});
    deck.cards.push_back(Card{Suit::Spades, 12, std::nullopt});
    deck.scores["round1"] = 4;
    deck.scores["round2"] = -2;

    for (int indent : {0, 2}) {
        EncodeOptions options;
        options.indent = indent;
        auto decoded = from_json<Deck>(to_json(deck, options));
        ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded).to_string();
        const auto& copy = unwrap(decoded);
        EXPECT_EQ(copy.owner_name, deck.owner_name);
        ASSERT_EQ(copy.cards.size(), 2u);
        EXPECT_EQ(copy.cards[0].suit, Suit::Hearts);
        EXPECT_EQ(copy.cards[0].nickname, "lucky");
        EXPECT_EQ(copy.cards[1].value, 12);
        EXPECT_FALSE(copy.cards[1].nickname.has_value());
        EXPECT_EQ(copy.scores, deck.scores);
    }
}

TEST(JsonEncodeTest, UnionSurvivesEncodeDecode) {
    std::vector<Block> blocks{Text{"a"}, Picture{1, 2}};
    auto decoded = from_json<std::vector<Block>>(to_json(blocks));
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded).to_string();
    const auto& copy = unwrap(decoded);
    ASSERT_EQ(copy.size(), 2u);
    EXPECT_EQ(std::get<Text>(copy[0]).body, "a");
    EXPECT_EQ(std::get<Picture>(copy[1]).height, 2);
}

TEST(JsonEncodeTest, DoublesSurviveEncodeDecode) {
    for (double value : {0.1, -1234.5678, 1e-300, 6.02214076e23}) {
        auto decoded = from_json<double>(to_json(value));
        ASSERT_TRUE(is_ok(decoded));
        EXPECT_EQ(unwrap(decoded), value);
    }
}

TEST(JsonEncodeTest, LongDoubleKeepsItsPrecision) {
    const long double value = 1.0L + std::numeric_limits<long double>::epsilon();
    auto text = to_json(value);
    if (std::numeric_limits<long double>::digits > std::numeric_limits<double>::digits) {
        EXPECT_NE(text, to_json(static_cast<double>(value)));
    }
    auto decoded = from_json<long double>(text);
    ASSERT_TRUE(is_ok(decoded)) << unwrap_err(decoded).to_string();
    EXPECT_EQ(unwrap(decoded), value);
}
