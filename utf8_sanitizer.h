#pragma once
#include <string>
#include <cstddef>

namespace utf8_sanitizer {
    /**
     * Sanitize a string so it contains only valid UTF-8 sequences.
     * Invalid bytes are replaced with U+FFFD.
     *
     * @param input The input string that may contain invalid UTF-8
     * @return A string guaranteed to contain only valid UTF-8 sequences
     */
    std::string sanitize_utf8(const std::string& input);

    /**
     * Check if a string contains only valid UTF-8 sequences.
     */
    bool is_valid_utf8(const std::string& input);

    /**
     * Number of trailing bytes that form the start of a multi-byte sequence
     * whose continuation bytes have not arrived yet (0 if the string ends on
     * a sequence boundary or with bytes that can never become valid).
     */
    size_t incomplete_suffix_length(const std::string& input);
}
