#include "session.h"
#include "../bridge.h"
#include <algorithm>

namespace Harmony {

static ChannelStateMachine::Config machine_config(const StreamSession::Config& config) {
    ChannelStateMachine::Config mc;
    mc.max_block_bytes = config.max_block_bytes;
    return mc;
}

static CallConverter::Config converter_config(const StreamSession::Config& config) {
    CallConverter::Config cc;
    cc.strip_namespace = config.strip_namespace;
    return cc;
}

StreamSession::StreamSession(const Config& config, Emitter& emitter, const std::string& log_prefix)
    : buffer(config.markers),
      machine(machine_config(config)),
      router(config.log_analysis),
      converter(converter_config(config)),
      emitter(emitter),
      prefix(log_prefix) {
    on_event = [this](EventType type, const ChannelBlock* block, const std::string& text) {
        handle_event(type, block, text);
    };
}

void StreamSession::feed(const std::string& chunk) {
    if (finished) {
        dout(1) << prefix << "StreamSession: chunk after finish ignored (" << chunk.size() << " bytes)" << std::endl;
        return;
    }
    if (chunk.empty()) return;

    try {
        run(buffer.feed(chunk));
    } catch (const std::exception& e) {
        LOG_ERROR(prefix + "Channel pipeline error: " + std::string(e.what()));
    }
}

void StreamSession::finish() {
    if (finished) return;
    finished = true;

    try {
        run(buffer.flush());
        machine.finish(on_event);
    } catch (const std::exception& e) {
        LOG_ERROR(prefix + "Channel pipeline error during flush: " + std::string(e.what()));
    }

    LOG_DEBUG(prefix + "Session finished: " + std::to_string(block_count) + " blocks, " +
              std::to_string(call_count) + " calls, " + std::to_string(suppressed_count) + " suppressed");
}

void StreamSession::run(const std::vector<Token>& tokens) {
    for (const auto& token : tokens) {
        dout(4) << prefix << "token " << token_kind_name(token.kind) << " [" << token.text << "]" << std::endl;
        machine.consume(token, on_event);
    }
}

void StreamSession::handle_event(EventType type, const ChannelBlock* block, const std::string& text) {
    switch (type) {
        case EventType::TEXT:
            emit_text(text);
            break;

        case EventType::DELTA:
            // Passthrough blocks stream live; their route is known from the header
            if (Router::classify(*block) == Route::PASSTHROUGH) {
                emit_text(text);
                streamed += text.size();
            }
            break;

        case EventType::BLOCK:
            handle_block(*block);
            streamed = 0;
            break;
    }
}

void StreamSession::handle_block(const ChannelBlock& block) {
    block_count++;
    Route route = router.route(block);

    if (block_observer) {
        block_observer(block, route);
    }

    switch (route) {
        case Route::SUPPRESS:
            suppressed_count++;
            break;

        case Route::CONVERT: {
            std::optional<Call> call = converter.convert(block);
            if (call) {
                emit_call(*call);
            } else {
                emit_text(block.payload.substr(std::min(streamed, block.payload.size())));
            }
            break;
        }

        case Route::PASSTHROUGH:
            emit_text(block.payload.substr(std::min(streamed, block.payload.size())));
            break;
    }
}

void StreamSession::emit_text(const std::string& text) {
    if (text.empty()) return;
    log.push_back({Fragment::Kind::TEXT, text, std::nullopt});
    emitter.on_text(text);
}

void StreamSession::emit_call(const Call& call) {
    call_count++;
    dout(1) << prefix << "StreamSession: call " << call.name << (call.fallback ? " (fallback)" : "") << std::endl;
    log.push_back({Fragment::Kind::CALL, "", call});
    emitter.on_call(call);
}

size_t StreamSession::replay(Emitter& target, size_t from) const {
    size_t count = 0;
    for (size_t i = from; i < log.size(); i++) {
        const Fragment& fragment = log[i];
        if (fragment.kind == Fragment::Kind::CALL) {
            target.on_call(*fragment.call);
        } else {
            target.on_text(fragment.text);
        }
        count++;
    }
    return count;
}

} // namespace Harmony
