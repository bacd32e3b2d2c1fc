#include "call_converter.h"
#include "../bridge.h"
#include <functional>
#include <cctype>
#include <set>

namespace Harmony {

CallConverter::CallConverter()
    : CallConverter(Config{}) {
}

CallConverter::CallConverter(const Config& config)
    : cfg(config) {
}

std::string CallConverter::derive_name(const std::string& recipient) const {
    std::string name = bridge::trim(recipient);
    if (cfg.strip_namespace) {
        size_t sep = name.find_last_of("./:");
        if (sep != std::string::npos) {
            name = name.substr(sep + 1);
        }
    }
    return name;
}

std::optional<Call> CallConverter::convert(const ChannelBlock& block) const {
    if (!block.has_recipient()) {
        LOG_ERROR("Call block on channel [" + block.channel_name + "] has no recipient, passing through");
        return std::nullopt;
    }

    Call call;
    call.name = derive_name(*block.recipient);
    call.raw = block.payload;
    if (call.name.empty()) {
        LOG_ERROR("Cannot derive a call name from recipient [" + *block.recipient + "], passing through");
        return std::nullopt;
    }

    std::string body = bridge::trim(block.payload);
    if (body.empty()) {
        dout(1) << "CallConverter: " << call.name << " has an empty payload" << std::endl;
        return call;
    }

    std::string content_type = block.content_type.value_or("");
    bool structured = content_type.find("json") != std::string::npos ||
                      (content_type.empty() && body[0] == '{');

    if (!structured) {
        dout(1) << "CallConverter: " << call.name << " content type [" << content_type
                << "], passing payload as " << RAW_ARGUMENT << std::endl;
        call.arguments[RAW_ARGUMENT] = block.payload;
        return call;
    }

    try {
        nlohmann::ordered_json parsed = nlohmann::ordered_json::parse(body);
        if (parsed.is_object()) {
            call.arguments = std::move(parsed);
            return call;
        }
        LOG_WARN("Arguments for " + call.name + " are not a JSON object, using raw payload");
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("Malformed JSON arguments for " + call.name + ": " + std::string(e.what()));
    }

    call.arguments = nlohmann::ordered_json::object();
    call.arguments[RAW_ARGUMENT] = block.payload;
    call.fallback = true;
    return call;
}

std::string CallConverter::escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string CallConverter::unescape(const std::string& text) {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'},
        {"&quot;", '"'}, {"&apos;", '\''}, {"&#39;", '\''}
    };

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            bool matched = false;
            for (const auto& entity : entities) {
                std::string name(entity.first);
                if (text.compare(i, name.size(), name) == 0) {
                    out += entity.second;
                    i += name.size();
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

std::string CallConverter::sanitize_tag_name(const std::string& name) {
    if (name.empty()) {
        return "_";
    }
    std::string out = name;
    for (char& c : out) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
        if (!ok) {
            c = '_';
        }
    }
    return out;
}

// Sibling keys that sanitize to the same name get a numeric suffix
static std::string unique_tag(const std::string& key, std::set<std::string>& used) {
    std::string base = CallConverter::sanitize_tag_name(key);
    std::string name = base;
    for (int n = 2; !used.insert(name).second; n++) {
        name = base + "_" + std::to_string(n);
    }
    return name;
}

void CallConverter::render_value(std::string& out, const std::string& name, const nlohmann::ordered_json& value) {
    out += "<" + name + ">";

    if (value.is_string()) {
        out += escape(value.get<std::string>());
    } else if (value.is_object()) {
        std::set<std::string> used;
        for (auto& [key, child] : value.items()) {
            render_value(out, unique_tag(key, used), child);
        }
    } else if (value.is_array()) {
        for (const auto& child : value) {
            render_value(out, "item", child);
        }
    } else if (!value.is_null()) {
        // Numbers and booleans
        out += escape(value.dump());
    }

    out += "</" + name + ">";
}

std::string CallConverter::to_tag_tree(const Call& call) {
    std::string name = sanitize_tag_name(call.name);
    std::string out = "<" + name + ">";
    std::set<std::string> used;
    for (auto& [key, value] : call.arguments.items()) {
        render_value(out, unique_tag(key, used), value);
    }
    out += "</" + name + ">";
    return out;
}

nlohmann::ordered_json CallConverter::to_object(const Call& call) {
    nlohmann::ordered_json obj;
    obj["name"] = call.name;
    obj["arguments"] = call.arguments;
    return obj;
}

nlohmann::ordered_json CallConverter::to_openai(const Call& call, size_t index) {
    std::string arguments = call.arguments.dump();
    size_t hash = std::hash<std::string>{}(call.name + arguments);

    nlohmann::ordered_json entry;
    entry["index"] = index;
    entry["id"] = "call_" + std::to_string(index) + "_" + std::to_string(hash % 10000);
    entry["type"] = "function";
    entry["function"] = {{"name", call.name}, {"arguments", arguments}};
    return entry;
}

// Reads "<name>" at pos, returns the name and moves pos past it
static std::optional<std::string> read_open_tag(const std::string& text, size_t& pos) {
    if (pos >= text.size() || text[pos] != '<' || text.compare(pos, 2, "</") == 0) {
        return std::nullopt;
    }
    size_t close = text.find('>', pos);
    if (close == std::string::npos || close == pos + 1) {
        return std::nullopt;
    }
    std::string name = text.substr(pos + 1, close - pos - 1);
    pos = close + 1;
    return name;
}

std::optional<Call> CallConverter::parse_tag_tree(const std::string& text) {
    std::string s = bridge::trim(text);
    size_t pos = 0;

    auto name = read_open_tag(s, pos);
    if (!name) {
        return std::nullopt;
    }
    std::string outer_close = "</" + *name + ">";
    if (s.size() < pos + outer_close.size() ||
        s.compare(s.size() - outer_close.size(), outer_close.size(), outer_close) != 0) {
        return std::nullopt;
    }
    size_t body_end = s.size() - outer_close.size();

    Call call;
    call.name = *name;
    call.raw = s;

    while (true) {
        while (pos < body_end && isspace(static_cast<unsigned char>(s[pos]))) {
            pos++;
        }
        if (pos >= body_end) {
            break;
        }
        auto key = read_open_tag(s, pos);
        if (!key) {
            return std::nullopt;
        }
        std::string close = "</" + *key + ">";
        size_t end = s.find(close, pos);
        if (end == std::string::npos || end > body_end) {
            return std::nullopt;
        }
        call.arguments[*key] = unescape(s.substr(pos, end - pos));
        pos = end + close.size();
    }

    return call;
}

} // namespace Harmony
