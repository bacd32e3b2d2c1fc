#include "emitter.h"
#include "../bridge.h"
#include "../utf8_sanitizer.h"
#include <stdexcept>

namespace Harmony {

OutputFormat parse_output_format(const std::string& name) {
    if (name == "xml") return OutputFormat::XML;
    if (name == "json") return OutputFormat::JSON;
    throw std::invalid_argument("Invalid output format '" + name + "' (must be xml or json)");
}

const char* output_format_name(OutputFormat format) {
    switch (format) {
        case OutputFormat::XML:  return "xml";
        case OutputFormat::JSON: return "json";
    }
    return "xml";
}

static std::string resolve_finish_reason(OutputFormat format, size_t calls, const std::string& upstream) {
    if (format == OutputFormat::JSON && calls > 0) {
        return "tool_calls";
    }
    // Calls rendered as tag trees are plain content
    if (upstream.empty() || upstream == "tool_calls") {
        return "stop";
    }
    return upstream;
}

// ============================================================================
// StreamingEmitter
// ============================================================================

StreamingEmitter::StreamingEmitter(OutputFormat format, FrameWriter writer)
    : format(format), writer(std::move(writer)),
      id("chatcmpl-bridge-" + std::to_string(bridge::get_current_timestamp())),
      created(bridge::get_current_timestamp()) {
}

void StreamingEmitter::set_envelope(const nlohmann::ordered_json& upstream_chunk) {
    if (!upstream_chunk.is_object()) {
        return;
    }
    if (upstream_chunk.contains("id") && upstream_chunk["id"].is_string()) {
        id = upstream_chunk["id"].get<std::string>();
    }
    if (upstream_chunk.contains("model") && upstream_chunk["model"].is_string()) {
        model = upstream_chunk["model"].get<std::string>();
    }
    if (upstream_chunk.contains("created") && upstream_chunk["created"].is_number_integer()) {
        created = upstream_chunk["created"].get<int64_t>();
    }
    if (upstream_chunk.contains("system_fingerprint") && upstream_chunk["system_fingerprint"].is_string()) {
        system_fingerprint = upstream_chunk["system_fingerprint"].get<std::string>();
    }
}

nlohmann::ordered_json StreamingEmitter::make_chunk(const nlohmann::ordered_json& delta,
                                                    const std::string& finish_reason) const {
    nlohmann::ordered_json choice;
    choice["index"] = 0;
    choice["delta"] = delta;
    if (finish_reason.empty()) {
        choice["finish_reason"] = nullptr;
    } else {
        choice["finish_reason"] = finish_reason;
    }

    nlohmann::ordered_json chunk;
    chunk["id"] = id;
    chunk["object"] = "chat.completion.chunk";
    chunk["created"] = created;
    chunk["model"] = model;
    if (!system_fingerprint.empty()) {
        chunk["system_fingerprint"] = system_fingerprint;
    }
    chunk["choices"] = nlohmann::ordered_json::array({choice});
    return chunk;
}

bool StreamingEmitter::write_frame(const std::string& data) {
    if (!connected) return false;

    std::string frame = "data: " + data + "\n\n";
    if (!writer(frame)) {
        dout(1) << "StreamingEmitter: client rejected frame, marking disconnected" << std::endl;
        connected = false;
        return false;
    }
    return true;
}

bool StreamingEmitter::forward(const std::string& data) {
    if (done) return false;
    return write_frame(data);
}

void StreamingEmitter::on_text(const std::string& text) {
    if (text.empty() || done) return;
    nlohmann::ordered_json delta;
    delta["content"] = utf8_sanitizer::sanitize_utf8(text);
    write_frame(make_chunk(delta).dump());
}

void StreamingEmitter::on_call(const Call& call) {
    if (done) return;

    nlohmann::ordered_json delta;
    if (format == OutputFormat::XML) {
        delta["content"] = utf8_sanitizer::sanitize_utf8(CallConverter::to_tag_tree(call));
    } else {
        delta["tool_calls"] = nlohmann::ordered_json::array({CallConverter::to_openai(call, call_count)});
    }
    call_count++;
    write_frame(make_chunk(delta).dump());
}

void StreamingEmitter::on_finish(const std::string& upstream_reason) {
    if (done) return;
    done = true;

    std::string reason = resolve_finish_reason(format, call_count, upstream_reason);
    write_frame(make_chunk(nlohmann::ordered_json::object(), reason).dump());
    write_frame("[DONE]");
}

// ============================================================================
// BatchedEmitter
// ============================================================================

BatchedEmitter::BatchedEmitter(OutputFormat format)
    : format(format) {
}

void BatchedEmitter::on_text(const std::string& text) {
    accumulated += text;
}

void BatchedEmitter::on_call(const Call& call) {
    if (format == OutputFormat::XML) {
        accumulated += CallConverter::to_tag_tree(call);
    } else {
        calls.push_back(CallConverter::to_openai(call, calls.size()));
    }
}

void BatchedEmitter::on_finish(const std::string& upstream_reason) {
    reason = resolve_finish_reason(format, calls.size(), upstream_reason);
}

void BatchedEmitter::apply(nlohmann::ordered_json& choice) const {
    nlohmann::ordered_json& message = choice["message"];
    if (!message.is_object()) {
        message = nlohmann::ordered_json::object();
        message["role"] = "assistant";
    }

    std::string text = utf8_sanitizer::sanitize_utf8(accumulated);
    if (format == OutputFormat::JSON && text.empty()) {
        message["content"] = nullptr;
    } else {
        message["content"] = text;
    }

    if (!calls.empty()) {
        message["tool_calls"] = calls;
    } else if (message.contains("tool_calls")) {
        message.erase("tool_calls");
    }

    choice["finish_reason"] = reason;
}

} // namespace Harmony
