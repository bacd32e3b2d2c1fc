#include <gtest/gtest.h>
#include "harmony/reassembly.h"

using namespace Harmony;

// Merge adjacent literals so token streams compare independent of where
// literal text happened to be cut
static std::vector<Token> normalize(const std::vector<Token>& tokens) {
    std::vector<Token> out;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::LITERAL && !out.empty() && out.back().kind == TokenKind::LITERAL) {
            out.back().text += token.text;
            out.back().raw += token.raw;
        } else {
            out.push_back(token);
        }
    }
    return out;
}

static std::vector<Token> feed_all(const MarkerTable& table, const std::vector<std::string>& chunks) {
    ReassemblyBuffer buffer(table);
    std::vector<Token> tokens;
    for (const auto& chunk : chunks) {
        auto got = buffer.feed(chunk);
        tokens.insert(tokens.end(), got.begin(), got.end());
    }
    auto rest = buffer.flush();
    tokens.insert(tokens.end(), rest.begin(), rest.end());
    return normalize(tokens);
}

static const char* BRACKET_STREAM =
    "<channel:analysis><message>need a file<end>"
    "<channel:commentary><to:write_file><message>{\"path\":\"a.py\",\"content\":\"x\"}<end>"
    "<channel:final><message>Done.<end>";

static const char* HARMONY_STREAM =
    "<|channel|>analysis<|message|>User wants a file.<|end|>"
    "<|start|>assistant<|channel|>commentary to=functions.write_file <|constrain|>json"
    "<|message|>{\"path\":\"a.py\"}<|call|>"
    "<|start|>assistant<|channel|>final<|message|>Done.<|return|>";

// =============================================================================
// Split invariance
// =============================================================================

TEST(ReassemblyTest, EverySplitPointBracket) {
    MarkerTable table = MarkerTable::bracket();
    std::string input = BRACKET_STREAM;
    auto expected = feed_all(table, {input});

    for (size_t i = 0; i <= input.size(); i++) {
        auto got = feed_all(table, {input.substr(0, i), input.substr(i)});
        ASSERT_EQ(got, expected) << "split at " << i;
    }
}

TEST(ReassemblyTest, EverySplitPointHarmony) {
    MarkerTable table = MarkerTable::harmony();
    std::string input = HARMONY_STREAM;
    auto expected = feed_all(table, {input});

    for (size_t i = 0; i <= input.size(); i++) {
        auto got = feed_all(table, {input.substr(0, i), input.substr(i)});
        ASSERT_EQ(got, expected) << "split at " << i;
    }
}

TEST(ReassemblyTest, OneByteAtATime) {
    MarkerTable table = MarkerTable::harmony();
    std::string input = HARMONY_STREAM;

    std::vector<std::string> chunks;
    for (char c : input) {
        chunks.push_back(std::string(1, c));
    }
    EXPECT_EQ(feed_all(table, chunks), feed_all(table, {input}));
}

TEST(ReassemblyTest, SplitInsideChannelName) {
    MarkerTable table = MarkerTable::bracket();
    ReassemblyBuffer buffer(table);

    auto first = buffer.feed("<chan");
    EXPECT_TRUE(first.empty());
    EXPECT_EQ(buffer.tail(), "<chan");

    auto second = buffer.feed("nel:analysis><message>hmm<end>");
    ASSERT_EQ(second.size(), 4u);
    EXPECT_EQ(second[0].kind, TokenKind::CHANNEL);
    EXPECT_EQ(second[0].text, "analysis");
    EXPECT_FALSE(buffer.has_tail());
}

// =============================================================================
// UTF-8 hold-back
// =============================================================================

TEST(ReassemblyTest, HoldsSplitMultibyteCharacter) {
    ReassemblyBuffer buffer(MarkerTable::bracket());

    // "café" with the two-byte é split across chunks
    auto first = buffer.feed("caf\xC3");
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].text, "caf");
    EXPECT_EQ(buffer.tail(), "\xC3");

    auto second = buffer.feed("\xA9");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].text, "\xC3\xA9");
    EXPECT_FALSE(buffer.has_tail());
}

TEST(ReassemblyTest, HoldsMarkerPrefixAndCharacter) {
    ReassemblyBuffer buffer(MarkerTable::bracket());

    auto first = buffer.feed("<channel:final><message>\xE2\x82");
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(buffer.tail(), "\xE2\x82");

    auto second = buffer.feed("\xAC<end>");
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(second[0].text, "\xE2\x82\xAC");
    EXPECT_EQ(second[1].kind, TokenKind::END);
}

// =============================================================================
// flush
// =============================================================================

TEST(ReassemblyTest, FlushEmitsTailAsLiteral) {
    ReassemblyBuffer buffer(MarkerTable::bracket());
    buffer.feed("text <chan");

    auto tokens = buffer.flush();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], Token::literal("<chan"));
    EXPECT_FALSE(buffer.has_tail());
}

TEST(ReassemblyTest, FlushTwiceIsEmpty) {
    ReassemblyBuffer buffer(MarkerTable::bracket());
    buffer.feed("<to:x");

    EXPECT_EQ(buffer.flush().size(), 1u);
    EXPECT_TRUE(buffer.flush().empty());
}

TEST(ReassemblyTest, ResetDropsTail) {
    ReassemblyBuffer buffer(MarkerTable::bracket());
    buffer.feed("<mess");
    EXPECT_TRUE(buffer.has_tail());

    buffer.reset();
    EXPECT_FALSE(buffer.has_tail());
    EXPECT_TRUE(buffer.flush().empty());
}
