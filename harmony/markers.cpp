#include "markers.h"
#include <stdexcept>

namespace Harmony {

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
        case TokenKind::CHANNEL:      return "channel";
        case TokenKind::RECIPIENT:    return "recipient";
        case TokenKind::CONTENT_TYPE: return "content_type";
        case TokenKind::MESSAGE:      return "message";
        case TokenKind::END:          return "end";
        case TokenKind::START:        return "start";
        case TokenKind::LITERAL:      return "literal";
    }
    return "unknown";
}

static TokenKind parse_token_kind(const std::string& name) {
    if (name == "channel") return TokenKind::CHANNEL;
    if (name == "recipient") return TokenKind::RECIPIENT;
    if (name == "content_type") return TokenKind::CONTENT_TYPE;
    if (name == "message") return TokenKind::MESSAGE;
    if (name == "end") return TokenKind::END;
    if (name == "start") return TokenKind::START;
    throw std::invalid_argument("Unknown marker kind: " + name);
}

MarkerTable::MarkerTable(std::vector<MarkerSpec> specs)
    : specs_(std::move(specs)) {
    for (const auto& spec : specs_) {
        if (spec.open.empty()) {
            throw std::invalid_argument("Marker opening spelling cannot be empty");
        }
        if (spec.kind == TokenKind::LITERAL) {
            throw std::invalid_argument("Literal is not a marker kind");
        }
        if (lead_chars_.find(spec.open[0]) == std::string::npos) {
            lead_chars_ += spec.open[0];
        }
    }
}

MarkerTable MarkerTable::harmony() {
    return MarkerTable({
        {TokenKind::CHANNEL,      "<|channel|>",   ""},
        {TokenKind::MESSAGE,      "<|message|>",   ""},
        {TokenKind::END,          "<|end|>",       ""},
        {TokenKind::END,          "<|call|>",      ""},
        {TokenKind::END,          "<|return|>",    ""},
        {TokenKind::CONTENT_TYPE, "<|constrain|>", ""},
        {TokenKind::START,        "<|start|>",     ""},
    });
}

MarkerTable MarkerTable::bracket() {
    return MarkerTable({
        {TokenKind::CHANNEL,      "<channel:", ">"},
        {TokenKind::RECIPIENT,    "<to:",      ">"},
        {TokenKind::CONTENT_TYPE, "<type:",    ">"},
        {TokenKind::MESSAGE,      "<message>", ""},
        {TokenKind::END,          "<end>",     ""},
    });
}

MarkerTable MarkerTable::from_preset(const std::string& name) {
    if (name == "harmony") {
        return harmony();
    }
    if (name == "bracket") {
        return bracket();
    }
    throw std::invalid_argument("Unknown marker preset: " + name + " (use harmony or bracket)");
}

MarkerTable MarkerTable::from_json(const nlohmann::json& j) {
    if (j.is_string()) {
        return from_preset(j.get<std::string>());
    }
    if (!j.is_array() || j.empty()) {
        throw std::invalid_argument("markers must be a preset name or a non-empty array");
    }

    std::vector<MarkerSpec> specs;
    for (const auto& entry : j) {
        if (!entry.is_object() || !entry.contains("kind") || !entry.contains("open")) {
            throw std::invalid_argument("each marker needs \"kind\" and \"open\"");
        }
        if (!entry["kind"].is_string() || !entry["open"].is_string()) {
            throw std::invalid_argument("marker \"kind\" and \"open\" must be strings");
        }
        MarkerSpec spec;
        spec.kind = parse_token_kind(entry["kind"].get<std::string>());
        spec.open = entry["open"].get<std::string>();
        if (entry.contains("close")) {
            if (!entry["close"].is_string()) {
                throw std::invalid_argument("marker \"close\" must be a string");
            }
            spec.close = entry["close"].get<std::string>();
        }
        specs.push_back(spec);
    }
    return MarkerTable(std::move(specs));
}

bool MarkerTable::contains_marker(const std::string& text) const {
    for (const auto& spec : specs_) {
        if (text.find(spec.open) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace Harmony
