// ChannelStateMachine - assembles lexer tokens into ChannelBlocks
//
//   IDLE --channel--> HEADER --message--> ACCUMULATING --end--> IDLE
//
// A channel or start marker while ACCUMULATING closes the open block first
// (producers are known to omit the end marker). At end of stream a
// non-empty open block is flushed, an empty one is dropped.

#pragma once

#include "markers.h"
#include "block.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace Harmony {

// Events emitted by the state machine
enum class EventType {
    TEXT,   // Literal text outside any channel, before any marker was seen
    DELTA,  // Text appended to the open block's payload
    BLOCK   // A block was finalized
};

// block is null for TEXT. text is empty for BLOCK.
using EventCallback = std::function<void(EventType type,
                                         const ChannelBlock* block,
                                         const std::string& text)>;

class ChannelStateMachine {
public:
    enum class State {
        IDLE,          // No channel open
        HEADER,        // Collecting channel name / recipient / content type
        ACCUMULATING   // Collecting payload
    };

    struct Config {
        size_t max_block_bytes = 1024 * 1024;  // 0 = unlimited
    };

    ChannelStateMachine();
    explicit ChannelStateMachine(const Config& config);

    void consume(const Token& token, const EventCallback& callback);
    void consume(const std::vector<Token>& tokens, const EventCallback& callback);

    // End of stream. Flushes or discards the open block. Safe to call twice.
    void finish(const EventCallback& callback);

    void reset();

    State state() const { return state_; }
    const ChannelBlock* open_block() const { return open_ ? &*open_ : nullptr; }

    // True once any marker token was consumed
    bool markers_seen() const { return markers_seen_; }

private:
    void open_block_from_marker(const Token& token);
    void enter_content();
    void apply_header();
    void append_payload(const std::string& text, const EventCallback& callback);
    void close_block(CloseReason reason, bool complete, const EventCallback& callback);
    void discard_pending(const char* why);

    Config cfg;
    State state_ = State::IDLE;
    std::optional<ChannelBlock> open_;
    bool markers_seen_ = false;

    std::string header_text;        // Header words (channel name, to=..., json)
    std::string content_type_text;  // Text following an argument-less content type marker
    bool content_type_next = false;
    std::string idle_text;          // Text between turns (role header, may carry to=...)
};

} // namespace Harmony
