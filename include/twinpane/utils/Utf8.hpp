// include/twinpane/utils/Utf8.hpp
#ifndef TWINPANE_UTF8_HPP
#define TWINPANE_UTF8_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace twinpane {
namespace utils {

class Utf8 {
public:
    static constexpr uint32_t REPLACEMENT = 0xFFFD;

    // Decodes the character starting at byte pos. Malformed or truncated
    // sequences decode as REPLACEMENT with length 1, so every byte of any
    // input belongs to exactly one decoded unit. Returns the unit length.
    static size_t decode(const std::string& text, size_t pos, uint32_t& codepoint);

    // Start of the unit ending at byte pos (pos > 0).
    static size_t previous(const std::string& text, size_t pos);

    static bool isContinuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

    // Simple one-to-one case folding for Latin, Greek, Cyrillic and fullwidth forms.
    static uint32_t foldCase(uint32_t codepoint);
};

} // namespace utils
} // namespace twinpane

#endif
