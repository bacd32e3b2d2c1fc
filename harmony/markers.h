// Marker vocabulary for the channel lexer
// The lexer never hardcodes delimiter spellings; it works from a MarkerTable

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Harmony {

// Token kinds produced by the lexer
enum class TokenKind {
    CHANNEL,       // Opens a channel header (<|channel|>, <channel:NAME>)
    RECIPIENT,     // Call target (<to:NAME>)
    CONTENT_TYPE,  // Payload type (<|constrain|>json, <type:json>)
    MESSAGE,       // End of header, start of payload
    END,           // End of payload (<|end|>, <|call|>, <|return|>)
    START,         // Turn start (<|start|>), followed by a role name
    LITERAL        // Plain text
};

const char* token_kind_name(TokenKind kind);

struct Token {
    TokenKind kind = TokenKind::LITERAL;
    std::string text;  // Marker argument, or the literal text
    std::string raw;   // Exact source spelling

    static Token literal(const std::string& s) { return {TokenKind::LITERAL, s, s}; }

    bool operator==(const Token& other) const {
        return kind == other.kind && text == other.text && raw == other.raw;
    }
};

// One recognized delimiter.
// Fixed markers have an empty close spelling. Argument-bearing markers read
// everything between open and close as the token argument.
struct MarkerSpec {
    TokenKind kind;
    std::string open;
    std::string close;

    bool has_argument() const { return !close.empty(); }
};

class MarkerTable {
public:
    MarkerTable() = default;
    explicit MarkerTable(std::vector<MarkerSpec> specs);

    // GPT-OSS Harmony spelling: <|channel|>final<|message|>...<|end|>
    static MarkerTable harmony();

    // Bracket spelling: <channel:final><message>...<end>
    static MarkerTable bracket();

    // Preset by name ("harmony" or "bracket"), throws std::invalid_argument
    static MarkerTable from_preset(const std::string& name);

    // Preset name, or array of {"kind", "open", "close"} objects.
    // Throws std::invalid_argument on a malformed table.
    static MarkerTable from_json(const nlohmann::json& j);

    const std::vector<MarkerSpec>& specs() const { return specs_; }
    bool empty() const { return specs_.empty(); }

    // Characters that can begin a marker
    const std::string& lead_chars() const { return lead_chars_; }
    bool is_lead_char(char c) const { return lead_chars_.find(c) != std::string::npos; }

    // True if the text contains the opening spelling of any marker
    bool contains_marker(const std::string& text) const;

private:
    std::vector<MarkerSpec> specs_;
    std::string lead_chars_;
};

} // namespace Harmony
