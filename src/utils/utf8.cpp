#include "utf8.h"
#include <cstdio>

namespace textexpander {
namespace utils {

namespace {

// Length of the sequence introduced by a lead byte, 1 for invalid bytes
size_t sequenceLength(uint8_t byte) {
    if (byte <= 0x7F) return 1;
    if ((byte & 0xE0) == 0xC0) return 2;
    if ((byte & 0xF0) == 0xE0) return 3;
    if ((byte & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

// Decode one UTF-8 character starting at offset
char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed) {
    bytesConsumed = 0;

    if (offset >= utf8.size()) {
        return 0;
    }

    const size_t remaining = utf8.size() - offset;
    uint8_t byte1 = static_cast<uint8_t>(utf8[offset]);

    if (byte1 <= 0x7F) {
        // 1-byte sequence
        bytesConsumed = 1;
        return byte1;
    }
    else if ((byte1 & 0xE0) == 0xC0 && remaining >= 2) {
        // 2-byte sequence
        uint8_t byte2 = static_cast<uint8_t>(utf8[offset + 1]);
        if ((byte2 & 0xC0) == 0x80) {
            bytesConsumed = 2;
            return ((byte1 & 0x1F) << 6) | (byte2 & 0x3F);
        }
    }
    else if ((byte1 & 0xF0) == 0xE0 && remaining >= 3) {
        // 3-byte sequence
        uint8_t byte2 = static_cast<uint8_t>(utf8[offset + 1]);
        uint8_t byte3 = static_cast<uint8_t>(utf8[offset + 2]);
        if ((byte2 & 0xC0) == 0x80 && (byte3 & 0xC0) == 0x80) {
            bytesConsumed = 3;
            return ((byte1 & 0x0F) << 12) | ((byte2 & 0x3F) << 6) | (byte3 & 0x3F);
        }
    }
    else if ((byte1 & 0xF8) == 0xF0 && remaining >= 4) {
        // 4-byte sequence
        uint8_t byte2 = static_cast<uint8_t>(utf8[offset + 1]);
        uint8_t byte3 = static_cast<uint8_t>(utf8[offset + 2]);
        uint8_t byte4 = static_cast<uint8_t>(utf8[offset + 3]);
        if ((byte2 & 0xC0) == 0x80 && (byte3 & 0xC0) == 0x80 && (byte4 & 0xC0) == 0x80) {
            bytesConsumed = 4;
            return ((byte1 & 0x07) << 18) | ((byte2 & 0x3F) << 12) |
                   ((byte3 & 0x3F) << 6) | (byte4 & 0x3F);
        }
    }

    // Invalid UTF-8 sequence
    bytesConsumed = 1;  // Skip the invalid byte
    return 0xFFFD;
}

std::u32string utf8ToUtf32(const std::string& utf8) {
    std::u32string result;
    result.reserve(utf8.size());

    size_t offset = 0;
    while (offset < utf8.size()) {
        size_t consumed = 0;
        result.push_back(utf8ToChar32(utf8, offset, consumed));
        offset += consumed;
    }

    return result;
}

std::string utf32ToUtf8(char32_t codepoint) {
    std::string result;

    if (codepoint <= 0x7F) {
        result.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint <= 0x7FF) {
        result.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0xFFFF) {
        result.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0x10FFFF) {
        result.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }

    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32) {
    std::string result;
    result.reserve(utf32.size());
    for (char32_t ch : utf32) {
        result += utf32ToUtf8(ch);
    }
    return result;
}

// Count UTF-8 characters (code points)
size_t utf8CharCount(const std::string& utf8) {
    size_t count = 0;
    size_t i = 0;

    while (i < utf8.size()) {
        i += sequenceLength(static_cast<uint8_t>(utf8[i]));
        count++;
    }

    return count;
}

bool isValidUtf8(const std::string& utf8) {
    size_t i = 0;

    while (i < utf8.size()) {
        uint8_t byte = static_cast<uint8_t>(utf8[i]);
        size_t length = sequenceLength(byte);

        if (length == 1 && byte > 0x7F) {
            return false;  // Invalid first byte
        }

        if (i + length > utf8.size()) {
            return false;
        }

        for (size_t j = 1; j < length; j++) {
            uint8_t contByte = static_cast<uint8_t>(utf8[i + j]);
            if ((contByte & 0xC0) != 0x80) {
                return false;  // Invalid continuation byte
            }
        }

        i += length;
    }

    return true;
}

std::string escapeForDisplay(const std::string& text) {
    std::string result;
    result.reserve(text.size() + 2);

    for (char c : text) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(c));
                    result += buffer;
                } else {
                    result.push_back(c);
                }
        }
    }

    return result;
}

} // namespace utils
} // namespace textexpander
