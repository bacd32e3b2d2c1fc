#include "router.h"
#include "../bridge.h"

namespace Harmony {

const char* route_name(Route route) {
    switch (route) {
        case Route::SUPPRESS:    return "suppress";
        case Route::CONVERT:     return "convert";
        case Route::PASSTHROUGH: return "passthrough";
    }
    return "unknown";
}

Route Router::classify(const ChannelBlock& block) {
    switch (block.channel) {
        case Channel::ANALYSIS:
            return Route::SUPPRESS;

        case Channel::COMMENTARY:
            // A cut block can't be a well-formed call
            if (block.continuation || block.close_reason == CloseReason::OVERFLOW) {
                return Route::PASSTHROUGH;
            }
            // Commentary without a target is preamble narration
            if (!block.has_recipient()) {
                return Route::PASSTHROUGH;
            }
            return Route::CONVERT;

        case Channel::FINAL:
        case Channel::UNKNOWN:
            return Route::PASSTHROUGH;
    }
    return Route::PASSTHROUGH;
}

Route Router::route(const ChannelBlock& block) const {
    Route r = classify(block);

    if (r == Route::SUPPRESS && log_analysis) {
        LOG_DEBUG("Analysis (" + std::to_string(block.payload.size()) + " bytes): " +
                  bridge::preview(block.payload, 200));
    }

    dout(2) << "Router: [" << block.channel_name << "] -> " << route_name(r) << std::endl;
    return r;
}

} // namespace Harmony
