#include <gtest/gtest.h>
#include "harmony/channel_machine.h"
#include "harmony/lexer.h"

using namespace Harmony;

// Test fixture that lexes whole strings and records machine events
class ChannelMachineTest : public ::testing::Test {
protected:
    struct Event {
        EventType type;
        std::string text;
        ChannelBlock block;
    };

    void run(ChannelStateMachine& machine, const MarkerTable& table, const std::string& input) {
        Lexer lexer(table);
        LexResult result = lexer.lex(input);
        auto cb = make_callback();
        machine.consume(result.tokens, cb);
        machine.consume(lexer.finish(result.tail), cb);
    }

    void run_bracket(const std::string& input) {
        run(machine, MarkerTable::bracket(), input);
    }

    void run_harmony(const std::string& input) {
        run(machine, MarkerTable::harmony(), input);
    }

    void finish() {
        machine.finish(make_callback());
    }

    EventCallback make_callback() {
        return [this](EventType type, const ChannelBlock* block, const std::string& text) {
            Event e{type, text, block ? *block : ChannelBlock{}};
            events.push_back(e);
        };
    }

    std::vector<ChannelBlock> blocks() const {
        std::vector<ChannelBlock> out;
        for (const auto& e : events) {
            if (e.type == EventType::BLOCK) out.push_back(e.block);
        }
        return out;
    }

    std::string text_events() const {
        std::string out;
        for (const auto& e : events) {
            if (e.type == EventType::TEXT) out += e.text;
        }
        return out;
    }

    ChannelStateMachine machine;
    std::vector<Event> events;
};

// =============================================================================
// Basic blocks
// =============================================================================

TEST_F(ChannelMachineTest, BracketCallBlock) {
    run_bracket("<channel:commentary><to:write_file><message>{\"path\":\"a.py\"}<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::COMMENTARY);
    EXPECT_EQ(b[0].channel_name, "commentary");
    EXPECT_EQ(b[0].recipient.value_or(""), "write_file");
    EXPECT_EQ(b[0].payload, "{\"path\":\"a.py\"}");
    EXPECT_TRUE(b[0].complete);
    EXPECT_EQ(b[0].close_reason, CloseReason::END_MARKER);
    EXPECT_EQ(machine.state(), ChannelStateMachine::State::IDLE);
}

TEST_F(ChannelMachineTest, StateTransitions) {
    Lexer lexer(MarkerTable::bracket());
    auto cb = make_callback();

    EXPECT_EQ(machine.state(), ChannelStateMachine::State::IDLE);
    machine.consume(lexer.lex("<channel:final>").tokens, cb);
    EXPECT_EQ(machine.state(), ChannelStateMachine::State::HEADER);
    machine.consume(lexer.lex("<message>").tokens, cb);
    EXPECT_EQ(machine.state(), ChannelStateMachine::State::ACCUMULATING);
    ASSERT_NE(machine.open_block(), nullptr);
    EXPECT_EQ(machine.open_block()->channel, Channel::FINAL);
    machine.consume(lexer.lex("<end>").tokens, cb);
    EXPECT_EQ(machine.state(), ChannelStateMachine::State::IDLE);
    EXPECT_EQ(machine.open_block(), nullptr);
}

TEST_F(ChannelMachineTest, DeltasConcatenateToPayload) {
    run_bracket("<channel:final><message>Hello world<end>");

    std::string deltas;
    for (const auto& e : events) {
        if (e.type == EventType::DELTA) {
            EXPECT_EQ(e.block.channel, Channel::FINAL);
            deltas += e.text;
        }
    }
    EXPECT_EQ(deltas, "Hello world");
    ASSERT_EQ(blocks().size(), 1u);
    EXPECT_EQ(blocks()[0].payload, deltas);
}

TEST_F(ChannelMachineTest, UnknownChannelKeepsName) {
    run_bracket("<channel:weird><message>x<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::UNKNOWN);
    EXPECT_EQ(b[0].channel_name, "weird");
}

TEST_F(ChannelMachineTest, MarkerInsidePayloadIsText) {
    run_bracket("<channel:final><message>use <to:x> here<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].payload, "use <to:x> here");
}

// =============================================================================
// Missing end markers and end of stream
// =============================================================================

TEST_F(ChannelMachineTest, NextChannelClosesOpenBlock) {
    run_bracket("<channel:analysis><message>a<channel:final><message>b<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].channel, Channel::ANALYSIS);
    EXPECT_EQ(b[0].payload, "a");
    EXPECT_EQ(b[0].close_reason, CloseReason::NEXT_CHANNEL);
    EXPECT_TRUE(b[0].complete);
    EXPECT_EQ(b[1].channel, Channel::FINAL);
    EXPECT_EQ(b[1].payload, "b");
}

TEST_F(ChannelMachineTest, EndOfStreamFlushesPartialBlock) {
    run_bracket("<channel:final><message>partial");
    EXPECT_TRUE(blocks().empty());

    finish();
    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].payload, "partial");
    EXPECT_EQ(b[0].close_reason, CloseReason::END_OF_STREAM);
    EXPECT_TRUE(b[0].complete);
}

TEST_F(ChannelMachineTest, EndOfStreamDropsEmptyBlock) {
    run_bracket("<channel:final><message>");
    finish();
    EXPECT_TRUE(blocks().empty());
}

TEST_F(ChannelMachineTest, EndOfStreamDropsPendingHeader) {
    run_bracket("<channel:commentary><to:f>");
    finish();
    EXPECT_TRUE(blocks().empty());
    EXPECT_EQ(machine.state(), ChannelStateMachine::State::IDLE);
}

TEST_F(ChannelMachineTest, FinishTwiceEmitsOnce) {
    run_bracket("<channel:final><message>x");
    finish();
    finish();
    EXPECT_EQ(blocks().size(), 1u);
}

// =============================================================================
// Text outside channels
// =============================================================================

TEST_F(ChannelMachineTest, TextBeforeFirstMarker) {
    run_bracket("hello <channel:final><message>x<end>");

    EXPECT_EQ(text_events(), "hello ");
    EXPECT_TRUE(machine.markers_seen());
    EXPECT_EQ(blocks().size(), 1u);
}

TEST_F(ChannelMachineTest, NoMarkersIsAllText) {
    run_bracket("just an answer");

    EXPECT_EQ(text_events(), "just an answer");
    EXPECT_FALSE(machine.markers_seen());
}

TEST_F(ChannelMachineTest, TextBetweenBlocksIsDropped) {
    run_bracket("<channel:final><message>a<end> between <channel:final><message>b<end>");

    EXPECT_EQ(text_events(), "");
    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_FALSE(b[1].has_recipient());
}

// =============================================================================
// Harmony headers
// =============================================================================

TEST_F(ChannelMachineTest, HarmonyHeaderWithRecipientAndConstrain) {
    run_harmony("<|start|>assistant<|channel|>commentary to=functions.write_file "
                "<|constrain|>json<|message|>{}<|call|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::COMMENTARY);
    EXPECT_EQ(b[0].recipient.value_or(""), "functions.write_file");
    EXPECT_EQ(b[0].content_type.value_or(""), "json");
    EXPECT_EQ(b[0].payload, "{}");
}

TEST_F(ChannelMachineTest, HarmonyRecipientInRoleHeader) {
    run_harmony("<|start|>assistant to=functions.run<|channel|>commentary<|message|>{}<|call|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::COMMENTARY);
    EXPECT_EQ(b[0].recipient.value_or(""), "functions.run");
}

TEST_F(ChannelMachineTest, HarmonyInlineContentType) {
    run_harmony("<|channel|>commentary to=functions.x json<|message|>{}<|call|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].content_type.value_or(""), "json");
}

TEST_F(ChannelMachineTest, HarmonyRecipientAfterConstrain) {
    run_harmony("<|channel|>commentary <|constrain|>json to=functions.ls<|message|>{\"a\":\"b\"}<|call|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].recipient.value_or(""), "functions.ls");
    EXPECT_EQ(b[0].content_type.value_or(""), "json");
}

TEST_F(ChannelMachineTest, HarmonyCommentaryWithoutRecipient) {
    run_harmony("<|channel|>commentary<|message|>Let me check.<|end|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::COMMENTARY);
    EXPECT_FALSE(b[0].has_recipient());
}

TEST_F(ChannelMachineTest, HarmonyMessageWithoutChannel) {
    run_harmony("<|message|>hi<|end|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].channel, Channel::UNKNOWN);
    EXPECT_EQ(b[0].payload, "hi");
}

TEST_F(ChannelMachineTest, HarmonyStartClosesOpenBlock) {
    run_harmony("<|channel|>analysis<|message|>thinking<|start|>assistant<|channel|>final<|message|>ok<|return|>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].close_reason, CloseReason::NEXT_CHANNEL);
    EXPECT_EQ(b[1].payload, "ok");
}

// =============================================================================
// Payload cap
// =============================================================================

TEST_F(ChannelMachineTest, OverflowSplitsAtCap) {
    ChannelStateMachine::Config cfg;
    cfg.max_block_bytes = 8;
    ChannelStateMachine capped(cfg);

    run(capped, MarkerTable::bracket(), "<channel:final><message>abcdefghijkl<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].payload, "abcdefgh");
    EXPECT_EQ(b[0].close_reason, CloseReason::OVERFLOW);
    EXPECT_FALSE(b[0].complete);
    EXPECT_FALSE(b[0].continuation);
    EXPECT_EQ(b[1].payload, "ijkl");
    EXPECT_TRUE(b[1].continuation);
    EXPECT_TRUE(b[1].complete);
    EXPECT_EQ(b[1].close_reason, CloseReason::END_MARKER);
}

TEST_F(ChannelMachineTest, OverflowKeepsHeader) {
    ChannelStateMachine::Config cfg;
    cfg.max_block_bytes = 4;
    ChannelStateMachine capped(cfg);

    run(capped, MarkerTable::bracket(), "<channel:commentary><to:f><message>123456<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[1].channel, Channel::COMMENTARY);
    EXPECT_EQ(b[1].recipient.value_or(""), "f");
    EXPECT_EQ(b[0].payload + b[1].payload, "123456");
}

TEST_F(ChannelMachineTest, OverflowCutsAtCharacterBoundary) {
    ChannelStateMachine::Config cfg;
    cfg.max_block_bytes = 8;
    ChannelStateMachine capped(cfg);

    // The cap falls inside the two-byte e-acute
    run(capped, MarkerTable::bracket(), "<channel:final><message>aaaaaaa\xC3\xA9" "bbb<end>");

    auto b = blocks();
    ASSERT_EQ(b.size(), 2u);
    EXPECT_EQ(b[0].payload, "aaaaaaa");
    EXPECT_EQ(b[0].close_reason, CloseReason::OVERFLOW);
    EXPECT_EQ(b[1].payload, "\xC3\xA9" "bbb");
}

TEST_F(ChannelMachineTest, OverflowBoundaryIndependentOfChunking) {
    ChannelStateMachine::Config cfg;
    cfg.max_block_bytes = 8;
    std::string payload = "aaaaaa\xE2\x82\xAC" "bb";

    ChannelStateMachine whole(cfg);
    run(whole, MarkerTable::bracket(), "<channel:final><message>" + payload + "<end>");
    auto expected = blocks();
    ASSERT_EQ(expected.size(), 2u);
    EXPECT_EQ(expected[0].payload, "aaaaaa");

    for (size_t i = 1; i < payload.size(); i++) {
        // Split only at character boundaries, as the reassembly buffer does
        if ((static_cast<unsigned char>(payload[i]) & 0xC0) == 0x80) continue;
        events.clear();
        ChannelStateMachine split(cfg);
        run(split, MarkerTable::bracket(), "<channel:final><message>" + payload.substr(0, i));
        run(split, MarkerTable::bracket(), payload.substr(i) + "<end>");

        auto b = blocks();
        ASSERT_EQ(b.size(), 2u) << "split at " << i;
        EXPECT_EQ(b[0].payload, expected[0].payload) << "split at " << i;
        EXPECT_EQ(b[1].payload, expected[1].payload) << "split at " << i;
    }
}

TEST_F(ChannelMachineTest, CapSmallerThanCharacterStillProgresses) {
    ChannelStateMachine::Config cfg;
    cfg.max_block_bytes = 1;
    ChannelStateMachine capped(cfg);

    run(capped, MarkerTable::bracket(), "<channel:final><message>\xC3\xA9<end>");

    std::string joined;
    for (const auto& b : blocks()) joined += b.payload;
    EXPECT_EQ(joined, "\xC3\xA9");
}

TEST_F(ChannelMachineTest, ChannelNames) {
    EXPECT_EQ(parse_channel("analysis"), Channel::ANALYSIS);
    EXPECT_EQ(parse_channel("commentary"), Channel::COMMENTARY);
    EXPECT_EQ(parse_channel("final"), Channel::FINAL);
    EXPECT_EQ(parse_channel("Final"), Channel::UNKNOWN);
    EXPECT_STREQ(channel_name(Channel::COMMENTARY), "commentary");
    EXPECT_STREQ(close_reason_name(CloseReason::OVERFLOW), "overflow");
}
