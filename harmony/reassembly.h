// ReassemblyBuffer - per-session carry-over between transport chunks
//
// Chunk boundaries from the upstream transport fall anywhere: inside a marker,
// inside a marker argument, or inside a multi-byte UTF-8 character. The
// buffer holds those bytes back so the lexer only sees text it can interpret,
// and the token stream is the same however the input was split.

#pragma once

#include "lexer.h"
#include <string>
#include <vector>

namespace Harmony {

class ReassemblyBuffer {
public:
    explicit ReassemblyBuffer(const MarkerTable& markers);

    // Prepend the held tail to chunk, lex, hold back the new tail
    std::vector<Token> feed(const std::string& chunk);

    // End of stream: remaining tail as literal text. Never throws.
    // A second call returns nothing.
    std::vector<Token> flush();

    const std::string& tail() const { return tail_; }
    bool has_tail() const { return !tail_.empty(); }

    void reset() { tail_.clear(); }

private:
    Lexer lexer;
    std::string tail_;
};

} // namespace Harmony
