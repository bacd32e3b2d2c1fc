#pragma once

#include "call_converter.h"
#include <string>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace Harmony {

// How calls are delivered downstream
enum class OutputFormat {
    XML,   // Tag tree inside the content stream
    JSON   // OpenAI tool_calls entries
};

// "xml" / "json", throws std::invalid_argument
OutputFormat parse_output_format(const std::string& name);
const char* output_format_name(OutputFormat format);

// Abstract sink for router output
// Text arrives incrementally, calls arrive whole
class Emitter {
public:
    virtual ~Emitter() = default;

    // Narration / final answer text
    virtual void on_text(const std::string& text) = 0;

    // A completed call
    virtual void on_call(const Call& call) = 0;

    // End of response. upstream_reason is the upstream finish_reason (may be empty).
    virtual void on_finish(const std::string& upstream_reason) = 0;

    virtual bool is_connected() const = 0;
};

// Writes OpenAI chat.completion.chunk SSE frames through a FrameWriter
// Used for streaming requests
class StreamingEmitter : public Emitter {
public:
    // Writes one complete SSE frame. Returns false if the client went away.
    using FrameWriter = std::function<bool(const std::string& frame)>;

    StreamingEmitter(OutputFormat format, FrameWriter writer);

    void on_text(const std::string& text) override;
    void on_call(const Call& call) override;
    void on_finish(const std::string& upstream_reason) override;
    bool is_connected() const override { return connected; }

    // Copy id / model / created from an upstream chunk into our frames
    void set_envelope(const nlohmann::ordered_json& upstream_chunk);

    // Forward an upstream data payload untouched
    bool forward(const std::string& data);

    size_t calls_sent() const { return call_count; }
    bool finished() const { return done; }

private:
    nlohmann::ordered_json make_chunk(const nlohmann::ordered_json& delta,
                                      const std::string& finish_reason = "") const;
    bool write_frame(const std::string& data);

    OutputFormat format;
    FrameWriter writer;
    bool connected = true;
    bool done = false;
    size_t call_count = 0;

    std::string id;
    std::string model;
    int64_t created;
    std::string system_fingerprint;
};

// Accumulates text and calls, then rewrites a non-streaming choice
// Used for non-streaming requests
class BatchedEmitter : public Emitter {
public:
    explicit BatchedEmitter(OutputFormat format);

    void on_text(const std::string& text) override;
    void on_call(const Call& call) override;
    void on_finish(const std::string& upstream_reason) override;
    bool is_connected() const override { return true; }

    // Replace choice.message content / tool_calls and choice.finish_reason
    void apply(nlohmann::ordered_json& choice) const;

    const std::string& content() const { return accumulated; }
    const nlohmann::ordered_json& tool_calls() const { return calls; }
    const std::string& finish_reason() const { return reason; }

private:
    OutputFormat format;
    std::string accumulated;
    nlohmann::ordered_json calls = nlohmann::ordered_json::array();
    std::string reason = "stop";
};

} // namespace Harmony
