#include "channel_machine.h"
#include "../bridge.h"
#include "../utf8_sanitizer.h"
#include <algorithm>
#include <sstream>

namespace Harmony {

// Role header text kept between turns (e.g. "assistant to=functions.x")
static const size_t MAX_IDLE_TEXT = 1024;

Channel parse_channel(const std::string& name) {
    if (name == "analysis") return Channel::ANALYSIS;
    if (name == "commentary") return Channel::COMMENTARY;
    if (name == "final") return Channel::FINAL;
    return Channel::UNKNOWN;
}

const char* channel_name(Channel channel) {
    switch (channel) {
        case Channel::ANALYSIS:   return "analysis";
        case Channel::COMMENTARY: return "commentary";
        case Channel::FINAL:      return "final";
        case Channel::UNKNOWN:    return "unknown";
    }
    return "unknown";
}

const char* close_reason_name(CloseReason reason) {
    switch (reason) {
        case CloseReason::END_MARKER:    return "end_marker";
        case CloseReason::NEXT_CHANNEL:  return "next_channel";
        case CloseReason::END_OF_STREAM: return "end_of_stream";
        case CloseReason::OVERFLOW:      return "overflow";
    }
    return "unknown";
}

static std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

// "to=functions.write_file" -> "functions.write_file"
static std::optional<std::string> find_recipient(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        if (word.rfind("to=", 0) == 0 && word.length() > 3) {
            return word.substr(3);
        }
    }
    return std::nullopt;
}

ChannelStateMachine::ChannelStateMachine()
    : ChannelStateMachine(Config{}) {
}

ChannelStateMachine::ChannelStateMachine(const Config& config)
    : cfg(config) {
}

void ChannelStateMachine::reset() {
    state_ = State::IDLE;
    open_.reset();
    markers_seen_ = false;
    header_text.clear();
    content_type_text.clear();
    content_type_next = false;
    idle_text.clear();
}

void ChannelStateMachine::consume(const std::vector<Token>& tokens, const EventCallback& callback) {
    for (const auto& token : tokens) {
        consume(token, callback);
    }
}

void ChannelStateMachine::consume(const Token& token, const EventCallback& callback) {
    if (token.kind != TokenKind::LITERAL) {
        markers_seen_ = true;
    }

    switch (token.kind) {
        case TokenKind::CHANNEL:
            if (state_ == State::ACCUMULATING) {
                dout(1) << "ChannelStateMachine: channel opened without end marker, closing ["
                        << open_->channel_name << "]" << std::endl;
                close_block(CloseReason::NEXT_CHANNEL, true, callback);
            } else if (state_ == State::HEADER) {
                discard_pending("channel marker inside header");
            }
            open_block_from_marker(token);
            break;

        case TokenKind::START:
            if (state_ == State::ACCUMULATING) {
                close_block(CloseReason::NEXT_CHANNEL, true, callback);
            } else if (state_ == State::HEADER) {
                discard_pending("start marker inside header");
            }
            state_ = State::IDLE;
            idle_text.clear();
            break;

        case TokenKind::RECIPIENT:
            if (state_ == State::HEADER) {
                open_->recipient = token.text;
            } else if (state_ == State::IDLE) {
                idle_text += " to=" + token.text;
            } else {
                append_payload(token.raw, callback);
            }
            break;

        case TokenKind::CONTENT_TYPE:
            if (state_ == State::HEADER) {
                if (!token.text.empty()) {
                    open_->content_type = token.text;
                } else {
                    content_type_next = true;
                }
            } else if (state_ == State::ACCUMULATING) {
                append_payload(token.raw, callback);
            }
            break;

        case TokenKind::MESSAGE:
            if (state_ == State::HEADER) {
                apply_header();
                enter_content();
            } else if (state_ == State::IDLE) {
                // Message without a channel header
                open_block_from_marker(Token{TokenKind::CHANNEL, "", ""});
                apply_header();
                enter_content();
            } else {
                append_payload(token.raw, callback);
            }
            break;

        case TokenKind::END:
            if (state_ == State::ACCUMULATING) {
                close_block(CloseReason::END_MARKER, true, callback);
            } else if (state_ == State::HEADER) {
                discard_pending("end marker before message");
                state_ = State::IDLE;
            }
            break;

        case TokenKind::LITERAL:
            switch (state_) {
                case State::IDLE:
                    if (!markers_seen_) {
                        callback(EventType::TEXT, nullptr, token.text);
                    } else if (idle_text.size() < MAX_IDLE_TEXT) {
                        idle_text += token.text.substr(0, MAX_IDLE_TEXT - idle_text.size());
                    }
                    break;
                case State::HEADER:
                    if (content_type_next) {
                        content_type_text += token.text;
                    } else {
                        header_text += token.text;
                    }
                    break;
                case State::ACCUMULATING:
                    append_payload(token.text, callback);
                    break;
            }
            break;
    }
}

void ChannelStateMachine::open_block_from_marker(const Token& token) {
    ChannelBlock block;
    if (!token.text.empty()) {
        block.channel_name = token.text;
    }
    // Recipient may sit in the role header: <|start|>assistant to=functions.x<|channel|>...
    block.recipient = find_recipient(split_words(idle_text));
    idle_text.clear();

    open_ = std::move(block);
    header_text.clear();
    content_type_text.clear();
    content_type_next = false;
    state_ = State::HEADER;
}

void ChannelStateMachine::apply_header() {
    ChannelBlock& block = *open_;
    std::vector<std::string> words = split_words(header_text);

    size_t first = 0;
    if (block.channel_name.empty() && !words.empty() && words[0].rfind("to=", 0) != 0) {
        block.channel_name = words[0];
        first = 1;
    }

    for (size_t i = first; i < words.size(); i++) {
        const std::string& word = words[i];
        if (word.rfind("to=", 0) == 0 && word.length() > 3) {
            if (!block.has_recipient()) {
                block.recipient = word.substr(3);
            }
        } else if (word == "json" || word == "code") {
            if (!block.content_type) {
                block.content_type = word;
            }
        } else {
            dout(2) << "ChannelStateMachine: ignoring header word [" << word << "]" << std::endl;
        }
    }

    std::vector<std::string> type_words = split_words(content_type_text);
    if (!type_words.empty() && !block.content_type) {
        block.content_type = type_words[0];
    }
    // <|constrain|>json to=functions.x
    for (size_t i = 1; i < type_words.size(); i++) {
        const std::string& word = type_words[i];
        if (word.rfind("to=", 0) == 0 && word.length() > 3 && !block.has_recipient()) {
            block.recipient = word.substr(3);
        }
    }

    block.channel = parse_channel(block.channel_name);
    if (block.channel == Channel::UNKNOWN) {
        dout(1) << "ChannelStateMachine: unknown channel [" << block.channel_name
                << "], passing through" << std::endl;
    }

    dout(2) << "ChannelStateMachine: entering channel [" << channel_name(block.channel) << "]"
            << " recipient=[" << block.recipient.value_or("") << "]"
            << " content_type=[" << block.content_type.value_or("") << "]" << std::endl;
}

void ChannelStateMachine::enter_content() {
    header_text.clear();
    content_type_text.clear();
    content_type_next = false;
    state_ = State::ACCUMULATING;
}

void ChannelStateMachine::append_payload(const std::string& text, const EventCallback& callback) {
    size_t offset = 0;
    while (offset < text.size()) {
        size_t take = text.size() - offset;
        if (cfg.max_block_bytes > 0) {
            size_t room = cfg.max_block_bytes > open_->payload.size() ?
                          cfg.max_block_bytes - open_->payload.size() : 0;
            if (take > room) {
                // Cut at the last character boundary at or below the cap
                size_t tail = std::min<size_t>(room, 4);
                take = room - utf8_sanitizer::incomplete_suffix_length(text.substr(offset + room - tail, tail));
                if (take == 0 && open_->payload.empty()) {
                    // Cap smaller than a single character
                    take = room;
                }
            }
            if (take == 0) {
                LOG_WARN("Channel block exceeded " + std::to_string(cfg.max_block_bytes) +
                         " bytes without closing, flushing as text");
                ChannelBlock rest;
                rest.channel = open_->channel;
                rest.channel_name = open_->channel_name;
                rest.recipient = open_->recipient;
                rest.content_type = open_->content_type;
                rest.continuation = true;
                close_block(CloseReason::OVERFLOW, false, callback);
                open_ = std::move(rest);
                state_ = State::ACCUMULATING;
                continue;
            }
        }

        std::string piece = text.substr(offset, take);
        open_->payload += piece;
        callback(EventType::DELTA, &*open_, piece);
        offset += take;
    }
}

void ChannelStateMachine::close_block(CloseReason reason, bool complete, const EventCallback& callback) {
    ChannelBlock block = std::move(*open_);
    open_.reset();
    state_ = State::IDLE;

    block.complete = complete;
    block.close_reason = reason;

    dout(2) << "ChannelStateMachine: block closed [" << channel_name(block.channel) << "] reason="
            << close_reason_name(reason) << " payload=" << block.payload.size() << " bytes" << std::endl;

    callback(EventType::BLOCK, &block, "");
}

void ChannelStateMachine::discard_pending(const char* why) {
    dout(1) << "ChannelStateMachine: discarding pending block (" << why << ")" << std::endl;
    open_.reset();
    header_text.clear();
    content_type_text.clear();
    content_type_next = false;
}

void ChannelStateMachine::finish(const EventCallback& callback) {
    if (state_ == State::ACCUMULATING && open_) {
        if (!open_->payload.empty()) {
            dout(1) << "ChannelStateMachine: stream ended inside [" << open_->channel_name
                    << "], flushing partial block" << std::endl;
            close_block(CloseReason::END_OF_STREAM, true, callback);
        } else {
            discard_pending("empty block at end of stream");
        }
    } else if (state_ == State::HEADER) {
        discard_pending("header at end of stream");
    }
    state_ = State::IDLE;
}

} // namespace Harmony
