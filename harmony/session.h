// StreamSession - one request's channel pipeline
//
//   chunk -> ReassemblyBuffer -> ChannelStateMachine -> Router -> CallConverter -> Emitter
//
// Owned by the request handler, never shared between requests. Passthrough
// text is emitted as it arrives; calls are emitted once their block closes.

#pragma once

#include "reassembly.h"
#include "channel_machine.h"
#include "router.h"
#include "call_converter.h"
#include "emitter.h"
#include <string>
#include <vector>
#include <optional>
#include <functional>

namespace Harmony {

class StreamSession {
public:
    struct Config {
        MarkerTable markers = MarkerTable::harmony();
        size_t max_block_bytes = 1024 * 1024;
        bool strip_namespace = true;
        bool log_analysis = false;
    };

    // One emitted output unit, in emission order
    struct Fragment {
        enum class Kind { TEXT, CALL };
        Kind kind;
        std::string text;
        std::optional<Call> call;
    };

    // Called for every finalized block with the route it took
    using BlockObserver = std::function<void(const ChannelBlock& block, Route route)>;

    StreamSession(const Config& config, Emitter& emitter, const std::string& log_prefix = "");

    // Push one upstream text chunk through the pipeline
    void feed(const std::string& chunk);

    // End of upstream: flush the held tail and the open block.
    // Safe to call more than once; later calls emit nothing.
    void finish();

    bool is_finished() const { return finished; }

    // True once any marker was recognized
    bool saw_markers() const { return machine.markers_seen(); }

    const std::vector<Fragment>& fragments() const { return log; }

    // Re-emit logged fragments [from, end) into another emitter.
    // Returns the number of fragments replayed.
    size_t replay(Emitter& target, size_t from = 0) const;

    void set_block_observer(BlockObserver observer) { block_observer = std::move(observer); }

    size_t calls_emitted() const { return call_count; }
    size_t blocks_suppressed() const { return suppressed_count; }

private:
    void run(const std::vector<Token>& tokens);
    void handle_event(EventType type, const ChannelBlock* block, const std::string& text);
    void handle_block(const ChannelBlock& block);
    void emit_text(const std::string& text);
    void emit_call(const Call& call);

    ReassemblyBuffer buffer;
    ChannelStateMachine machine;
    Router router;
    CallConverter converter;
    Emitter& emitter;
    std::string prefix;

    std::vector<Fragment> log;
    BlockObserver block_observer;
    EventCallback on_event;

    size_t streamed = 0;   // Bytes of the open block already emitted as text
    size_t call_count = 0;
    size_t block_count = 0;
    size_t suppressed_count = 0;
    bool finished = false;
};

} // namespace Harmony
