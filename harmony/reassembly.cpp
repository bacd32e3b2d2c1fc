#include "reassembly.h"
#include "../bridge.h"
#include "../utf8_sanitizer.h"

namespace Harmony {

ReassemblyBuffer::ReassemblyBuffer(const MarkerTable& markers)
    : lexer(markers) {
}

std::vector<Token> ReassemblyBuffer::feed(const std::string& chunk) {
    std::string text = tail_ + chunk;
    tail_.clear();

    // Hold back a split multi-byte character
    size_t partial_char = utf8_sanitizer::incomplete_suffix_length(text);
    std::string held;
    if (partial_char > 0) {
        held = text.substr(text.size() - partial_char);
        text.resize(text.size() - partial_char);
    }

    LexResult result = lexer.lex(text);
    tail_ = result.tail + held;

    if (!tail_.empty()) {
        dout(3) << "ReassemblyBuffer: holding " << tail_.size() << " bytes" << std::endl;
    }
    return std::move(result.tokens);
}

std::vector<Token> ReassemblyBuffer::flush() {
    std::string tail = std::move(tail_);
    tail_.clear();
    return lexer.finish(tail);
}

} // namespace Harmony
