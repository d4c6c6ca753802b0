// src/utils/Utf8.cpp
#include "twinpane/utils/Utf8.hpp"

namespace twinpane {
namespace utils {

size_t Utf8::decode(const std::string& text, size_t pos, uint32_t& codepoint) {
    if (pos >= text.size()) {
        codepoint = 0;
        return 0;
    }

    unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        codepoint = lead;
        return 1;
    }

    size_t length;
    uint32_t value;
    uint32_t minimum;
    if ((lead & 0xE0) == 0xC0) {
        length = 2; value = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; value = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; value = lead & 0x07; minimum = 0x10000;
    } else {
        codepoint = REPLACEMENT;
        return 1;
    }

    if (pos + length > text.size()) {
        codepoint = REPLACEMENT;
        return 1;
    }

    for (size_t i = 1; i < length; ++i) {
        unsigned char byte = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(byte)) {
            codepoint = REPLACEMENT;
            return 1;
        }
        value = (value << 6) | (byte & 0x3F);
    }

    if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        codepoint = REPLACEMENT;
        return 1;
    }

    codepoint = value;
    return length;
}

size_t Utf8::previous(const std::string& text, size_t pos) {
    if (pos == 0) {
        return 0;
    }
    if (pos > text.size()) {
        pos = text.size();
    }

    size_t start = pos - 1;
    size_t limit = pos >= 4 ? pos - 4 : 0;
    while (start > limit && isContinuation(static_cast<unsigned char>(text[start]))) {
        --start;
    }

    uint32_t codepoint;
    if (decode(text, start, codepoint) == pos - start) {
        return start;
    }
    return pos - 1;
}

uint32_t Utf8::foldCase(uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
    }
    // Latin-1 Supplement
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }
    // Latin Extended-A: upper/lower pairs alternate
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) {
        return 0xFF;
    }
    // Greek
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) {
        return cp + 0x20;
    }
    // Cyrillic
    if (cp >= 0x410 && cp <= 0x42F) {
        return cp + 0x20;
    }
    if (cp >= 0x400 && cp <= 0x40F) {
        return cp + 0x50;
    }
    // Fullwidth Latin
    if (cp >= 0xFF21 && cp <= 0xFF3A) {
        return cp + 0x20;
    }
    return cp;
}

} // namespace utils
} // namespace twinpane
