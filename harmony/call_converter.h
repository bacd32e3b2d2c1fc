// CallConverter - turns a call-bearing commentary block into a Call and
// renders it as a tag tree (<name><arg>value</arg></name>) or as a
// structured object ({"name", "arguments"} / OpenAI tool_calls entry)

#pragma once

#include "block.h"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace Harmony {

struct Call {
    std::string name;
    nlohmann::ordered_json arguments = nlohmann::ordered_json::object();
    bool fallback = false;  // Payload was not a JSON object, arguments hold {"raw": payload}
    std::string raw;        // Payload as received
};

class CallConverter {
public:
    // Argument key used when the payload can't be parsed
    static constexpr const char* RAW_ARGUMENT = "raw";

    struct Config {
        bool strip_namespace = true;  // functions.write_file -> write_file
    };

    CallConverter();
    explicit CallConverter(const Config& config);

    // Parse a block into a Call. Returns nullopt (and logs) when the block
    // has no usable recipient. Malformed payloads never fail, they produce
    // a fallback Call.
    std::optional<Call> convert(const ChannelBlock& block) const;

    // Recipient -> call name
    std::string derive_name(const std::string& recipient) const;

    // <name><key>value</key>...</name>
    static std::string to_tag_tree(const Call& call);

    // {"name": ..., "arguments": {...}}
    static nlohmann::ordered_json to_object(const Call& call);

    // OpenAI tool_calls[] entry, arguments serialized as a JSON string
    static nlohmann::ordered_json to_openai(const Call& call, size_t index);

    // Reverse of to_tag_tree for flat calls. Values come back as strings.
    static std::optional<Call> parse_tag_tree(const std::string& text);

    static std::string escape(const std::string& text);
    static std::string unescape(const std::string& text);

    // Element names keep [A-Za-z0-9_.-], anything else becomes '_'.
    // to_tag_tree suffixes colliding sibling names ("a b" and "a_b" give a_b, a_b_2).
    static std::string sanitize_tag_name(const std::string& name);

private:
    static void render_value(std::string& out, const std::string& name, const nlohmann::ordered_json& value);

    Config cfg;
};

} // namespace Harmony
