#include "../bridge.h"
#include "relay.h"

// Cap on a non-SSE upstream body kept for error reporting
static const size_t MAX_NON_SSE_BODY = 64 * 1024;

nlohmann::json make_error_body(const std::string& message, const std::string& type) {
    return {
        {"error", {
            {"message", message},
            {"type", type}
        }}
    };
}

// ============================================================================
// StreamRelay
// ============================================================================

StreamRelay::StreamRelay(const RelayOptions& options,
                         Harmony::StreamingEmitter::FrameWriter writer,
                         const std::string& log_prefix)
    : emitter(options.format, std::move(writer)),
      stream(options.session, emitter, log_prefix),
      prefix(log_prefix) {
    event_callback = [this](const std::string& event, const std::string& data, const std::string&) {
        return on_event(event, data);
    };
}

bool StreamRelay::on_upstream_bytes(const std::string& bytes) {
    if (finished) return false;

    // A JSON body instead of an event stream (upstream error response).
    // Decided once, on the first non-whitespace byte of the response.
    if (!body_checked) {
        size_t first = bytes.find_first_not_of(" \t\r\n");
        if (first != std::string::npos) {
            body_checked = true;
            non_sse = bytes[first] == '{';
        }
    }
    if (non_sse) {
        if (non_sse_body.size() < MAX_NON_SSE_BODY) {
            non_sse_body += bytes;
        }
        return true;
    }

    if (!parser.process_chunk(bytes, event_callback)) {
        return false;
    }
    return emitter.is_connected();
}

bool StreamRelay::on_event(const std::string& event, const std::string& data) {
    event_count++;
    if (saw_done) return true;

    if (bridge::trim(data) == "[DONE]") {
        saw_done = true;
        return true;
    }
    if (!event.empty() && event != "message") {
        dout(2) << prefix << "ignoring upstream event type [" << event << "]" << std::endl;
        return true;
    }

    handle_chunk(data);
    return emitter.is_connected();
}

void StreamRelay::handle_chunk(const std::string& data) {
    nlohmann::ordered_json chunk;
    try {
        chunk = nlohmann::ordered_json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        dout(1) << prefix << "skipping malformed upstream chunk: " << e.what() << std::endl;
        return;
    }
    if (!chunk.is_object()) return;

    // Upstream error object inside the stream
    if (chunk.contains("error")) {
        LOG_WARN(prefix + "Upstream reported an error: " + bridge::preview(data, 200));
        emitter.forward(data);
        return;
    }

    emitter.set_envelope(chunk);

    std::string content;
    bool has_choice = false;
    bool has_finish = false;
    if (chunk.contains("choices") && chunk["choices"].is_array() && !chunk["choices"].empty()) {
        const auto& choice = chunk["choices"][0];
        if (choice.is_object()) {
            has_choice = true;
            if (choice.contains("delta") && choice["delta"].is_object()) {
                const auto& delta = choice["delta"];
                if (delta.contains("content") && delta["content"].is_string()) {
                    content = delta["content"].get<std::string>();
                }
            }
            if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
                finish_reason = choice["finish_reason"].get<std::string>();
                has_finish = true;
            }
        }
    }

    if (!content.empty()) {
        stream.feed(content);
        return;
    }

    // The final chunk is generated by the emitter once the session is flushed
    if (has_finish) return;

    // Usage-only chunks and pre-marker chunks without content (role
    // announcements) go through untouched
    if (!has_choice || !stream.saw_markers()) {
        emitter.forward(data);
    }
}

void StreamRelay::finish(const std::string& transport_error) {
    if (finished) return;
    finished = true;

    parser.flush(event_callback);
    stream.finish();

    if (!non_sse_body.empty()) {
        LOG_WARN(prefix + "Upstream sent a non-stream body: " + bridge::preview(non_sse_body, 200));
        if (nlohmann::json::accept(non_sse_body)) {
            emitter.forward(bridge::trim(non_sse_body));
        } else {
            emitter.forward(make_error_body("Unexpected upstream response", "proxy_error").dump());
        }
    }

    if (!transport_error.empty()) {
        LOG_ERROR(prefix + "Upstream stream error: " + transport_error);
        emitter.forward(make_error_body(transport_error, "proxy_error").dump());
        emitter.on_finish("error");
    } else {
        emitter.on_finish(finish_reason);
    }

    LOG_INFO(prefix + "Stream complete: " + std::to_string(stream.calls_emitted()) + " calls, " +
             std::to_string(stream.blocks_suppressed()) + " analysis blocks suppressed" +
             (emitter.is_connected() ? "" : " (client disconnected)"));
}

// ============================================================================
// Non-streaming
// ============================================================================

std::optional<std::string> transform_completion(const std::string& body,
                                                const RelayOptions& options,
                                                const std::string& log_prefix) {
    nlohmann::ordered_json data;
    try {
        data = nlohmann::ordered_json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(log_prefix + "Non-stream JSON error: " + std::string(e.what()));
        return std::nullopt;
    }
    if (!data.is_object()) {
        return std::nullopt;
    }

    if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) {
        return body;
    }
    nlohmann::ordered_json& choice = data["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return body;
    }

    const nlohmann::ordered_json& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) {
        return body;
    }
    std::string raw = message["content"].get<std::string>();
    if (!options.session.markers.contains_marker(raw)) {
        return body;
    }

    Harmony::BatchedEmitter batch(options.format);
    Harmony::StreamSession session(options.session, batch, log_prefix);
    session.feed(raw);
    session.finish();

    std::string upstream_reason;
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        upstream_reason = choice["finish_reason"].get<std::string>();
    }
    batch.on_finish(upstream_reason);
    batch.apply(choice);

    LOG_INFO(log_prefix + "Transformed response: " + std::to_string(session.calls_emitted()) + " calls, " +
             std::to_string(session.blocks_suppressed()) + " analysis blocks suppressed");
    return data.dump();
}
