// Channel lexer - splits raw text into marker and literal tokens
// Never speculates past visible data: a trailing strict prefix of any marker
// is returned as the tail instead of being emitted as literal text

#pragma once

#include "markers.h"
#include <string>
#include <vector>

namespace Harmony {

struct LexResult {
    std::vector<Token> tokens;
    std::string tail;  // Unconsumed suffix that may still become a marker
};

class Lexer {
public:
    // Longest argument an argument-bearing marker may carry
    static constexpr size_t MAX_ARGUMENT_LENGTH = 256;

    explicit Lexer(MarkerTable table);

    // Tokenize text. Any trailing partial marker is returned in tail.
    LexResult lex(const std::string& text) const;

    // End of input: whatever is left in a tail is literal text
    std::vector<Token> finish(const std::string& tail) const;

    const MarkerTable& table() const { return table_; }

private:
    enum class Match {
        NONE,     // Not a marker at this position
        PARTIAL,  // Data ends inside what could still be a marker
        FULL      // Complete marker
    };

    // Try every marker at pos. On FULL, fills token and length.
    Match match_at(const std::string& text, size_t pos, Token& token, size_t& length) const;

    Match match_spec(const MarkerSpec& spec, const std::string& text, size_t pos,
                     std::string& argument, size_t& length) const;

    MarkerTable table_;
};

} // namespace Harmony
