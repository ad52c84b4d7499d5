#include "utils/text_excerpt.hpp"

#include <cstdio>

namespace text_excerpt {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD
constexpr std::size_t kReplacementLength = 3;

// Byte length announced by a UTF-8 lead byte (1-4), or 0 if the byte cannot start a sequence.
std::size_t sequence_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

std::string escape_control(unsigned char byte) {
    switch (byte) {
    case '\n':
        return "\\n";
    case '\r':
        return "\\r";
    case '\t':
        return "\\t";
    default:
        break;
    }
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "\\x%02X", static_cast<unsigned int>(byte));
    return buffer;
}

} // namespace

std::string excerpt(const std::string &text, std::size_t max_bytes) {
    std::string result;
    result.reserve(text.size() < max_bytes ? text.size() : max_bytes);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();
    bool truncated = false;

    while (pointer < end) {
        std::string piece;
        std::size_t consumed = 1;
        std::size_t length = sequence_length(*pointer);

        if (length == 1) {
            if (*pointer < 0x20u || *pointer == 0x7Fu) {
                piece = escape_control(*pointer);
            } else {
                piece.assign(1, static_cast<char>(*pointer));
            }
        } else if (length == 0 || pointer + length > end) {
            piece.assign(kReplacementUtf8, kReplacementLength);
        } else {
            bool valid = true;
            for (std::size_t index = 1; index < length; ++index) {
                if (!is_continuation(pointer[index])) {
                    valid = false;
                    break;
                }
            }
            if (valid) {
                piece.assign(reinterpret_cast<const char *>(pointer), length);
                consumed = length;
            } else {
                piece.assign(kReplacementUtf8, kReplacementLength);
            }
        }

        if (result.size() + piece.size() > max_bytes) {
            truncated = true;
            break;
        }
        result += piece;
        pointer += consumed;
    }

    if (truncated) {
        result += "...";
    }
    return result;
}

} // namespace text_excerpt
