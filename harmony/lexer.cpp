#include "lexer.h"
#include "../bridge.h"

namespace Harmony {

Lexer::Lexer(MarkerTable table)
    : table_(std::move(table)) {
}

Lexer::Match Lexer::match_spec(const MarkerSpec& spec, const std::string& text, size_t pos,
                               std::string& argument, size_t& length) const {
    size_t avail = text.size() - pos;

    // Data ends before the opening spelling does
    if (avail < spec.open.size()) {
        if (text.compare(pos, avail, spec.open, 0, avail) == 0) {
            return Match::PARTIAL;
        }
        return Match::NONE;
    }
    if (text.compare(pos, spec.open.size(), spec.open) != 0) {
        return Match::NONE;
    }

    if (!spec.has_argument()) {
        length = spec.open.size();
        return Match::FULL;
    }

    // Argument runs until the closing spelling
    size_t arg_start = pos + spec.open.size();
    for (size_t i = arg_start;; ++i) {
        if (i - arg_start > MAX_ARGUMENT_LENGTH) {
            return Match::NONE;
        }
        size_t rest = text.size() - i;
        if (rest == 0) {
            return Match::PARTIAL;
        }
        if (rest >= spec.close.size()) {
            if (text.compare(i, spec.close.size(), spec.close) == 0) {
                argument = text.substr(arg_start, i - arg_start);
                length = i + spec.close.size() - pos;
                return Match::FULL;
            }
        } else if (text.compare(i, rest, spec.close, 0, rest) == 0) {
            return Match::PARTIAL;
        }
        char c = text[i];
        if (c == '\n' || c == '\r' || table_.is_lead_char(c)) {
            return Match::NONE;
        }
    }
}

Lexer::Match Lexer::match_at(const std::string& text, size_t pos, Token& token, size_t& length) const {
    bool partial = false;
    const MarkerSpec* best = nullptr;
    std::string best_argument;
    size_t best_length = 0;

    for (const auto& spec : table_.specs()) {
        std::string argument;
        size_t spec_length = 0;
        Match m = match_spec(spec, text, pos, argument, spec_length);
        if (m == Match::PARTIAL) {
            partial = true;
        } else if (m == Match::FULL && spec_length > best_length) {
            best = &spec;
            best_argument = argument;
            best_length = spec_length;
        }
    }

    // A longer marker could still complete here; wait for more data so the
    // decision does not depend on where the chunk happened to end
    if (partial) {
        return Match::PARTIAL;
    }
    if (!best) {
        return Match::NONE;
    }

    token.kind = best->kind;
    token.text = best_argument;
    token.raw = text.substr(pos, best_length);
    length = best_length;
    return Match::FULL;
}

LexResult Lexer::lex(const std::string& text) const {
    LexResult result;
    size_t literal_start = 0;
    size_t pos = 0;

    while (true) {
        pos = text.find_first_of(table_.lead_chars(), pos);
        if (pos == std::string::npos) {
            break;
        }

        Token marker;
        size_t length = 0;
        Match m = match_at(text, pos, marker, length);

        if (m == Match::NONE) {
            pos++;
            continue;
        }

        if (pos > literal_start) {
            result.tokens.push_back(Token::literal(text.substr(literal_start, pos - literal_start)));
        }

        if (m == Match::PARTIAL) {
            result.tail = text.substr(pos);
            dout(3) << "Lexer: holding back partial marker [" << result.tail << "]" << std::endl;
            return result;
        }

        result.tokens.push_back(std::move(marker));
        pos += length;
        literal_start = pos;
    }

    if (literal_start < text.size()) {
        result.tokens.push_back(Token::literal(text.substr(literal_start)));
    }
    return result;
}

std::vector<Token> Lexer::finish(const std::string& tail) const {
    std::vector<Token> tokens;
    if (!tail.empty()) {
        dout(2) << "Lexer: flushing unfinished marker as text [" << tail << "]" << std::endl;
        tokens.push_back(Token::literal(tail));
    }
    return tokens;
}

} // namespace Harmony
