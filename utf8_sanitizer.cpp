#include "utf8_sanitizer.h"

namespace utf8_sanitizer {

static const char REPLACEMENT[] = "\xEF\xBF\xBD";  // U+FFFD

// Expected sequence length from a lead byte, 0 if the byte cannot start a sequence
static int sequence_length(unsigned char byte) {
    if ((byte & 0x80) == 0) {
        return 1;
    }
    if ((byte & 0xE0) == 0xC0) {
        // 0xC0 and 0xC1 would only produce overlong encodings
        return (byte == 0xC0 || byte == 0xC1) ? 0 : 2;
    }
    if ((byte & 0xF0) == 0xE0) {
        return 3;
    }
    if ((byte & 0xF8) == 0xF0) {
        return byte >= 0xF5 ? 0 : 4;
    }
    return 0;
}

static bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Length of the valid sequence starting at i, 0 if the bytes there are invalid
static size_t valid_sequence_at(const unsigned char* bytes, size_t length, size_t i) {
    int num_bytes = sequence_length(bytes[i]);
    if (num_bytes == 0 || i + num_bytes > length) {
        return 0;
    }
    for (int j = 1; j < num_bytes; ++j) {
        if (!is_continuation(bytes[i + j])) {
            return 0;
        }
    }
    return static_cast<size_t>(num_bytes);
}

bool is_valid_utf8(const std::string& input) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t length = input.length();

    for (size_t i = 0; i < length;) {
        size_t n = valid_sequence_at(bytes, length, i);
        if (n == 0) {
            return false;
        }
        i += n;
    }
    return true;
}

std::string sanitize_utf8(const std::string& input) {
    if (is_valid_utf8(input)) {
        return input;
    }

    std::string result;
    result.reserve(input.length() + 8);
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t length = input.length();

    for (size_t i = 0; i < length;) {
        size_t n = valid_sequence_at(bytes, length, i);
        if (n == 0) {
            result += REPLACEMENT;
            i++;
            continue;
        }
        result.append(input, i, n);
        i += n;
    }

    return result;
}

size_t incomplete_suffix_length(const std::string& input) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t length = input.length();

    // A lead byte can be at most 3 bytes before the end of an unfinished sequence
    for (size_t back = 1; back <= 3 && back <= length; ++back) {
        unsigned char byte = bytes[length - back];
        if (is_continuation(byte)) {
            continue;
        }
        int expected = sequence_length(byte);
        if (expected > static_cast<int>(back)) {
            return back;
        }
        return 0;
    }
    return 0;
}

} // namespace utf8_sanitizer
