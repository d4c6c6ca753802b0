// include/twinpane/utils/DisplayText.hpp
#ifndef TWINPANE_DISPLAYTEXT_HPP
#define TWINPANE_DISPLAYTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace twinpane {
namespace utils {

// Character-boundary-safe shortening of paths and names for display.
// Every function is total: any byte string and any width are accepted,
// and results are always cut between whole characters.
class DisplayText {
public:
    static bool isCharBoundary(const std::string& text, size_t index);
    static size_t floorCharBoundary(const std::string& text, size_t index);
    static size_t ceilCharBoundary(const std::string& text, size_t index);

    // Longest prefix / suffix of at most maxBytes bytes.
    static std::string safePrefix(const std::string& text, size_t maxBytes);
    static std::string safeSuffix(const std::string& text, size_t maxBytes);

    // Terminal cells: 2 for East Asian wide and emoji, 0 for combining marks.
    static int codepointWidth(uint32_t codepoint);
    static size_t displayWidth(const std::string& text);

    // Keep the head and append an ellipsis.
    static std::string truncateEnd(const std::string& text, size_t maxWidth);
    // Keep the tail (the file name of a path) after a leading ellipsis.
    static std::string truncateStart(const std::string& text, size_t maxWidth);
    static std::string truncateMiddle(const std::string& text, size_t maxWidth);

private:
    static size_t prefixWithin(const std::string& text, size_t budget, size_t& used);
    static size_t suffixWithin(const std::string& text, size_t budget, size_t& used);
};

} // namespace utils
} // namespace twinpane

#endif
