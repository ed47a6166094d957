#ifndef TEXTEXPANDER_UTF8_H
#define TEXTEXPANDER_UTF8_H

#include <string>
#include <cstdint>

namespace textexpander {
namespace utils {

// UTF-8 <-> UTF-32 conversions
std::u32string utf8ToUtf32(const std::string& utf8);
std::string utf32ToUtf8(const std::u32string& utf32);
std::string utf32ToUtf8(char32_t codepoint);
char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed);

// UTF-8 string utilities
size_t utf8CharCount(const std::string& utf8);
bool isValidUtf8(const std::string& utf8);

// JSON-style escaping for log lines and the stdin frontend
std::string escapeForDisplay(const std::string& text);

inline bool isAsciiPrintable(char32_t ch) {
    return ch >= 0x20 && ch <= 0x7E;
}

} // namespace utils
} // namespace textexpander

#endif // TEXTEXPANDER_UTF8_H
