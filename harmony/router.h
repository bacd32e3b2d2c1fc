// Block router - decides what happens to each completed ChannelBlock

#pragma once

#include "block.h"

namespace Harmony {

enum class Route {
    SUPPRESS,     // Chain of thought, dropped
    CONVERT,      // Tool call, sent to the CallConverter
    PASSTHROUGH   // Narration / final answer, forwarded as text
};

const char* route_name(Route route);

class Router {
public:
    explicit Router(bool log_analysis = false) : log_analysis(log_analysis) {}

    // Total mapping from block to route, no side effects
    static Route classify(const ChannelBlock& block);

    // classify() plus logging of suppressed analysis when enabled
    Route route(const ChannelBlock& block) const;

private:
    bool log_analysis;
};

} // namespace Harmony
