#pragma once

#include "../harmony/session.h"
#include "../sse_parser.h"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

/// @brief Settings shared by every request the bridge relays
struct RelayOptions {
    Harmony::StreamSession::Config session;
    Harmony::OutputFormat format = Harmony::OutputFormat::XML;
};

/// @brief Relays one upstream SSE response to the client
/// Upstream bytes -> SSEParser -> chat.completion.chunk deltas -> StreamSession
/// -> StreamingEmitter -> client frames. Independent of the HTTP server so it
/// can be driven directly.
class StreamRelay {
public:
    StreamRelay(const RelayOptions& options,
                Harmony::StreamingEmitter::FrameWriter writer,
                const std::string& log_prefix = "");

    /// @brief Feed raw upstream response bytes
    /// @return false when the client went away and the transfer should stop
    bool on_upstream_bytes(const std::string& bytes);

    /// @brief Upstream finished (or failed). Flushes everything and writes the
    /// final chunk and [DONE]. transport_error is empty on a clean finish.
    /// Safe to call more than once.
    void finish(const std::string& transport_error = "");

    bool client_connected() const { return emitter.is_connected(); }
    bool upstream_done() const { return saw_done; }
    size_t events_seen() const { return event_count; }
    const Harmony::StreamSession& session() const { return stream; }

private:
    bool on_event(const std::string& event, const std::string& data);
    void handle_chunk(const std::string& data);

    Harmony::StreamingEmitter emitter;
    Harmony::StreamSession stream;
    SSEParser parser;
    SSEParser::EventCallback event_callback;
    std::string prefix;

    std::string finish_reason;
    std::string non_sse_body;  // Upstream body that was not SSE (error responses)
    bool body_checked = false;
    bool non_sse = false;
    size_t event_count = 0;
    bool saw_done = false;
    bool finished = false;
};

/// @brief Rewrite a non-streaming chat.completion body.
/// Returns nullopt when the body is not a JSON object (caller forwards it
/// verbatim). Bodies without markers come back unchanged.
/// Throws nlohmann::json::exception on a structurally unexpected body.
std::optional<std::string> transform_completion(const std::string& body,
                                                const RelayOptions& options,
                                                const std::string& log_prefix = "");

/// @brief {"error": {"message", "type"}} body
nlohmann::json make_error_body(const std::string& message, const std::string& type);
