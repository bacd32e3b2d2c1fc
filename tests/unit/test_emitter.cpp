#include <gtest/gtest.h>
#include "harmony/emitter.h"
#include "test_helpers.h"

using namespace Harmony;
using test_helpers::frame_json;

static Call make_call(const std::string& name = "write_file") {
    Call call;
    call.name = name;
    call.arguments["path"] = "a.py";
    return call;
}

// Test fixture collecting client frames
class StreamingEmitterTest : public ::testing::Test {
protected:
    StreamingEmitter::FrameWriter writer() {
        return [this](const std::string& frame) {
            writes++;
            if (reject) return false;
            frames.push_back(frame);
            return true;
        };
    }

    std::vector<std::string> frames;
    int writes = 0;
    bool reject = false;
};

// =============================================================================
// StreamingEmitter
// =============================================================================

TEST_F(StreamingEmitterTest, TextFrame) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_text("Hi");

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].rfind("data: ", 0), 0u);
    EXPECT_EQ(frames[0].substr(frames[0].size() - 2), "\n\n");

    auto chunk = frame_json(frames[0]);
    EXPECT_EQ(chunk["object"], "chat.completion.chunk");
    EXPECT_EQ(chunk["choices"][0]["delta"]["content"], "Hi");
    EXPECT_TRUE(chunk["choices"][0]["finish_reason"].is_null());
}

TEST_F(StreamingEmitterTest, EmptyTextWritesNothing) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_text("");
    EXPECT_TRUE(frames.empty());
}

TEST_F(StreamingEmitterTest, XmlCallIsContent) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_call(make_call());
    emitter.on_finish("tool_calls");

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frame_json(frames[0])["choices"][0]["delta"]["content"],
              "<write_file><path>a.py</path></write_file>");
    EXPECT_EQ(frame_json(frames[1])["choices"][0]["finish_reason"], "stop");
    EXPECT_EQ(frames[2], "data: [DONE]\n\n");
}

TEST_F(StreamingEmitterTest, JsonCallIsToolCall) {
    StreamingEmitter emitter(OutputFormat::JSON, writer());
    emitter.on_call(make_call("a"));
    emitter.on_call(make_call("b"));
    emitter.on_finish("stop");

    ASSERT_EQ(frames.size(), 4u);
    auto first = frame_json(frames[0])["choices"][0]["delta"]["tool_calls"][0];
    EXPECT_EQ(first["index"], 0);
    EXPECT_EQ(first["function"]["name"], "a");
    auto second = frame_json(frames[1])["choices"][0]["delta"]["tool_calls"][0];
    EXPECT_EQ(second["index"], 1);
    EXPECT_EQ(frame_json(frames[2])["choices"][0]["finish_reason"], "tool_calls");
    EXPECT_EQ(emitter.calls_sent(), 2u);
}

TEST_F(StreamingEmitterTest, FinishReasonPassesThrough) {
    StreamingEmitter emitter(OutputFormat::JSON, writer());
    emitter.on_text("cut");
    emitter.on_finish("length");

    EXPECT_EQ(frame_json(frames[1])["choices"][0]["finish_reason"], "length");
}

TEST_F(StreamingEmitterTest, EmptyFinishReasonIsStop) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_finish("");

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frame_json(frames[0])["choices"][0]["finish_reason"], "stop");
}

TEST_F(StreamingEmitterTest, FinishIsIdempotent) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_finish("stop");
    size_t count = frames.size();

    emitter.on_finish("stop");
    emitter.on_text("late");
    EXPECT_EQ(frames.size(), count);
    EXPECT_TRUE(emitter.finished());
}

TEST_F(StreamingEmitterTest, EnvelopeIsCopied) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.set_envelope(nlohmann::ordered_json::parse(
        R"({"id":"chatcmpl-42","created":1700000000,"model":"gpt-oss-20b","system_fingerprint":"fp_1"})"));
    emitter.on_text("x");

    auto chunk = frame_json(frames[0]);
    EXPECT_EQ(chunk["id"], "chatcmpl-42");
    EXPECT_EQ(chunk["created"], 1700000000);
    EXPECT_EQ(chunk["model"], "gpt-oss-20b");
    EXPECT_EQ(chunk["system_fingerprint"], "fp_1");
}

TEST_F(StreamingEmitterTest, ForwardIsVerbatim) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    EXPECT_TRUE(emitter.forward(R"({"usage":{"total_tokens":3}})"));

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0], "data: {\"usage\":{\"total_tokens\":3}}\n\n");
}

TEST_F(StreamingEmitterTest, RejectedWriteDisconnects) {
    reject = true;
    StreamingEmitter emitter(OutputFormat::XML, writer());

    emitter.on_text("a");
    EXPECT_FALSE(emitter.is_connected());

    emitter.on_text("b");
    emitter.on_finish("stop");
    EXPECT_EQ(writes, 1);
}

TEST_F(StreamingEmitterTest, InvalidUtf8IsSanitized) {
    StreamingEmitter emitter(OutputFormat::XML, writer());
    emitter.on_text("ok\xFF");

    ASSERT_EQ(frames.size(), 1u);
    auto chunk = frame_json(frames[0]);
    ASSERT_TRUE(chunk.is_object());
    std::string content = chunk["choices"][0]["delta"]["content"].get<std::string>();
    EXPECT_EQ(content.rfind("ok", 0), 0u);
}

// =============================================================================
// BatchedEmitter
// =============================================================================

TEST(BatchedEmitterTest, XmlAccumulatesTextAndCalls) {
    BatchedEmitter emitter(OutputFormat::XML);
    emitter.on_text("Writing. ");
    emitter.on_call(make_call());
    emitter.on_finish("tool_calls");

    nlohmann::ordered_json choice = nlohmann::ordered_json::parse(
        R"({"index":0,"message":{"role":"assistant","content":"raw"},"finish_reason":"tool_calls"})");
    emitter.apply(choice);

    EXPECT_EQ(choice["message"]["content"], "Writing. <write_file><path>a.py</path></write_file>");
    EXPECT_FALSE(choice["message"].contains("tool_calls"));
    EXPECT_EQ(choice["message"]["role"], "assistant");
    EXPECT_EQ(choice["finish_reason"], "stop");
}

TEST(BatchedEmitterTest, JsonCallOnly) {
    BatchedEmitter emitter(OutputFormat::JSON);
    emitter.on_call(make_call());
    emitter.on_finish("stop");

    nlohmann::ordered_json choice = nlohmann::ordered_json::parse(
        R"({"index":0,"message":{"role":"assistant","content":"raw"},"finish_reason":"stop"})");
    emitter.apply(choice);

    EXPECT_TRUE(choice["message"]["content"].is_null());
    ASSERT_EQ(choice["message"]["tool_calls"].size(), 1u);
    EXPECT_EQ(choice["message"]["tool_calls"][0]["function"]["name"], "write_file");
    EXPECT_EQ(choice["finish_reason"], "tool_calls");
    EXPECT_EQ(emitter.finish_reason(), "tool_calls");
}

TEST(BatchedEmitterTest, JsonTextOnly) {
    BatchedEmitter emitter(OutputFormat::JSON);
    emitter.on_text("Done.");
    emitter.on_finish("stop");

    nlohmann::ordered_json choice = nlohmann::ordered_json::parse(
        R"({"index":0,"message":{"role":"assistant","content":"raw","tool_calls":[]},"finish_reason":"stop"})");
    emitter.apply(choice);

    EXPECT_EQ(choice["message"]["content"], "Done.");
    EXPECT_FALSE(choice["message"].contains("tool_calls"));
    EXPECT_EQ(choice["finish_reason"], "stop");
}

TEST(BatchedEmitterTest, MissingMessageIsCreated) {
    BatchedEmitter emitter(OutputFormat::XML);
    emitter.on_text("x");
    emitter.on_finish("");

    nlohmann::ordered_json choice = nlohmann::ordered_json::object();
    emitter.apply(choice);

    EXPECT_EQ(choice["message"]["role"], "assistant");
    EXPECT_EQ(choice["message"]["content"], "x");
    EXPECT_EQ(choice["finish_reason"], "stop");
}

TEST(OutputFormatTest, Parse) {
    EXPECT_EQ(parse_output_format("xml"), OutputFormat::XML);
    EXPECT_EQ(parse_output_format("json"), OutputFormat::JSON);
    EXPECT_THROW(parse_output_format("yaml"), std::invalid_argument);
    EXPECT_STREQ(output_format_name(OutputFormat::JSON), "json");
}
