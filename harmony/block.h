// ChannelBlock - one segment of one channel, as assembled by the state machine

#pragma once

#include <string>
#include <optional>

namespace Harmony {

enum class Channel {
    ANALYSIS,     // Chain of thought, never forwarded
    COMMENTARY,   // Tool calls (with recipient) or narration
    FINAL,        // User-facing answer
    UNKNOWN       // Any other name, forwarded as-is
};

// Why a block was finalized
enum class CloseReason {
    END_MARKER,     // Explicit <|end|> / <|call|> / <|return|>
    NEXT_CHANNEL,   // Producer opened a new channel without closing this one
    END_OF_STREAM,  // Stream ended with the block still open
    OVERFLOW        // Payload reached the size cap
};

Channel parse_channel(const std::string& name);
const char* channel_name(Channel channel);
const char* close_reason_name(CloseReason reason);

struct ChannelBlock {
    Channel channel = Channel::UNKNOWN;
    std::string channel_name;                 // Name as it appeared in the header
    std::optional<std::string> recipient;     // "to=" target, call-bearing blocks only
    std::optional<std::string> content_type;  // "json", "code", or absent for plain text
    std::string payload;
    bool complete = false;
    CloseReason close_reason = CloseReason::END_MARKER;
    bool continuation = false;                // Remainder of an overflowed block

    bool has_recipient() const { return recipient.has_value() && !recipient->empty(); }

    bool operator==(const ChannelBlock& other) const {
        return channel == other.channel && channel_name == other.channel_name &&
               recipient == other.recipient && content_type == other.content_type &&
               payload == other.payload && complete == other.complete &&
               close_reason == other.close_reason && continuation == other.continuation;
    }
};

} // namespace Harmony
