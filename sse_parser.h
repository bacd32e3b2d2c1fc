#pragma once

#include <string>
#include <functional>
#include <vector>

/// @brief Parser for Server-Sent Events (SSE) streams
/// Buffers incomplete lines across chunks and assembles multi-line events
class SSEParser {
public:
    /// @brief Callback invoked when a complete SSE event is received
    /// @param event The event type (or empty for data-only events)
    /// @param data The event data (data lines joined with '\n')
    /// @param id Optional event ID
    /// @return true to continue parsing, false to stop
    using EventCallback = std::function<bool(const std::string& event,
                                            const std::string& data,
                                            const std::string& id)>;

    SSEParser() = default;

    /// @brief Process a chunk of SSE data
    /// @return true if parsing should continue, false if callback requested stop
    bool process_chunk(const std::string& chunk, const EventCallback& callback);

    /// @brief End of stream: process a final unterminated line and dispatch
    /// any event that was not followed by a blank line
    bool flush(const EventCallback& callback);

    /// @brief Reset parser state (clears buffers)
    void reset();

    /// @brief Check if parser has incomplete data buffered
    bool has_buffered_data() const { return !buffer_.empty() || !data_lines_.empty(); }

private:
    bool process_line(const std::string& line, const EventCallback& callback);
    bool dispatch_event(const EventCallback& callback);

    std::string buffer_;                  ///< Incomplete line
    std::string event_type_;              ///< Current event type
    std::string event_id_;                ///< Current event ID
    std::vector<std::string> data_lines_; ///< Data lines of the current event
};
