// src/utils/DisplayText.cpp
#include "twinpane/utils/DisplayText.hpp"
#include "twinpane/utils/Utf8.hpp"
#include "twinpane/common/Constants.hpp"

#include <algorithm>

namespace twinpane {
namespace utils {

namespace {

struct Range {
    uint32_t first;
    uint32_t last;
};

const Range kZeroWidth[] = {
    {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
    {0x064B, 0x065F}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x0E47, 0x0E4E},
    {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200F}, {0x20D0, 0x20FF},
    {0x302A, 0x302F}, {0x3099, 0x309A}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
    {0xE0100, 0xE01EF},
};

const Range kWide[] = {
    {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC},
    {0x25FD, 0x25FE}, {0x2614, 0x2615}, {0x2648, 0x2653}, {0x26AA, 0x26AB},
    {0x26BD, 0x26BE}, {0x26C4, 0x26C5}, {0x26F2, 0x26F5}, {0x2705, 0x2705},
    {0x270A, 0x270B}, {0x2728, 0x2728}, {0x274C, 0x274C}, {0x2753, 0x2755},
    {0x2795, 0x2797}, {0x2B1B, 0x2B1C}, {0x2E80, 0x303E}, {0x3041, 0x33FF},
    {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xA960, 0xA97F},
    {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19}, {0xFE30, 0xFE6F},
    {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF},
    {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A}, {0x1F200, 0x1F251}, {0x1F300, 0x1F64F},
    {0x1F680, 0x1F6FF}, {0x1F7E0, 0x1F7EB}, {0x1F90C, 0x1F9FF}, {0x1FA70, 0x1FAFF},
    {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template<size_t N>
bool inRanges(const Range (&ranges)[N], uint32_t cp) {
    auto it = std::upper_bound(std::begin(ranges), std::end(ranges), cp,
                               [](uint32_t value, const Range& r) { return value < r.first; });
    if (it == std::begin(ranges)) {
        return false;
    }
    --it;
    return cp <= it->last;
}

} // namespace

bool DisplayText::isCharBoundary(const std::string& text, size_t index) {
    if (index == 0 || index >= text.size()) {
        return true;
    }

    size_t start = index;
    size_t limit = index >= 3 ? index - 3 : 0;
    while (start > limit && Utf8::isContinuation(static_cast<unsigned char>(text[start]))) {
        --start;
    }
    if (start == index) {
        return true;
    }

    uint32_t cp;
    size_t length = Utf8::decode(text, start, cp);
    return start + length <= index;
}

size_t DisplayText::floorCharBoundary(const std::string& text, size_t index) {
    if (index >= text.size()) {
        return text.size();
    }
    while (index > 0 && !isCharBoundary(text, index)) {
        --index;
    }
    return index;
}

size_t DisplayText::ceilCharBoundary(const std::string& text, size_t index) {
    if (index >= text.size()) {
        return text.size();
    }
    while (index < text.size() && !isCharBoundary(text, index)) {
        ++index;
    }
    return index;
}

std::string DisplayText::safePrefix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    return text.substr(0, floorCharBoundary(text, maxBytes));
}

std::string DisplayText::safeSuffix(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    return text.substr(ceilCharBoundary(text, text.size() - maxBytes));
}

int DisplayText::codepointWidth(uint32_t codepoint) {
    if (codepoint == 0) {
        return 0;
    }
    if (inRanges(kZeroWidth, codepoint)) {
        return 0;
    }
    if (inRanges(kWide, codepoint)) {
        return 2;
    }
    return 1;
}

size_t DisplayText::displayWidth(const std::string& text) {
    size_t width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp;
        pos += Utf8::decode(text, pos, cp);
        width += static_cast<size_t>(codepointWidth(cp));
    }
    return width;
}

size_t DisplayText::prefixWithin(const std::string& text, size_t budget, size_t& used) {
    used = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp;
        size_t length = Utf8::decode(text, pos, cp);
        size_t width = static_cast<size_t>(codepointWidth(cp));
        if (used + width > budget) {
            break;
        }
        used += width;
        pos += length;
    }
    return pos;
}

size_t DisplayText::suffixWithin(const std::string& text, size_t budget, size_t& used) {
    used = 0;
    size_t pos = text.size();
    // Trailing combining marks are only kept together with their base character.
    size_t cut = text.size();
    while (pos > 0) {
        size_t start = Utf8::previous(text, pos);
        uint32_t cp;
        Utf8::decode(text, start, cp);
        size_t width = static_cast<size_t>(codepointWidth(cp));
        if (used + width > budget) {
            break;
        }
        used += width;
        pos = start;
        if (width > 0 || pos == 0) {
            cut = pos;
        }
    }
    return cut;
}

std::string DisplayText::truncateEnd(const std::string& text, size_t maxWidth) {
    if (displayWidth(text) <= maxWidth) {
        return text;
    }
    if (maxWidth == 0) {
        return std::string();
    }

    size_t used;
    size_t end = prefixWithin(text, maxWidth - 1, used);
    return text.substr(0, end) + common::Constants::ELLIPSIS;
}

std::string DisplayText::truncateStart(const std::string& text, size_t maxWidth) {
    if (displayWidth(text) <= maxWidth) {
        return text;
    }
    if (maxWidth == 0) {
        return std::string();
    }

    size_t used;
    size_t start = suffixWithin(text, maxWidth - 1, used);
    return common::Constants::ELLIPSIS + text.substr(start);
}

std::string DisplayText::truncateMiddle(const std::string& text, size_t maxWidth) {
    if (displayWidth(text) <= maxWidth) {
        return text;
    }
    if (maxWidth == 0) {
        return std::string();
    }

    size_t budget = maxWidth - 1;
    size_t headBudget = budget - budget / 2;

    size_t headUsed;
    size_t headEnd = prefixWithin(text, headBudget, headUsed);
    size_t tailUsed;
    size_t tailStart = suffixWithin(text, budget - headUsed, tailUsed);
    tailStart = std::max(tailStart, headEnd);

    return text.substr(0, headEnd) + common::Constants::ELLIPSIS + text.substr(tailStart);
}

} // namespace utils
} // namespace twinpane
