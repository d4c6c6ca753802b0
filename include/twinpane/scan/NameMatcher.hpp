// include/twinpane/scan/NameMatcher.hpp
#ifndef TWINPANE_NAMEMATCHER_HPP
#define TWINPANE_NAMEMATCHER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace twinpane {
namespace scan {

enum class MatchMode {
    SUBSTRING,
    SUBSEQUENCE,
    GLOB
};

// Byte range [begin, end) inside the name that was matched, always on
// character boundaries of that same name.
struct MatchRange {
    size_t begin;
    size_t end;

    MatchRange() : begin(0), end(0) {}
    MatchRange(size_t b, size_t e) : begin(b), end(e) {}
};

// Matches entry names against a pattern. Case-insensitive matching runs on
// case-folded code points; every folded position keeps the byte offset of
// the character it came from, so reported ranges always refer to the raw
// name and never to the folded copy.
class NameMatcher {
public:
    NameMatcher(const std::string& pattern, MatchMode mode, bool caseSensitive);

    bool match(const std::string& name, MatchRange& range) const;
    bool matches(const std::string& name) const;

    MatchMode mode() const { return mode_; }

private:
    struct FoldedText {
        std::vector<uint32_t> codepoints;
        // offsets[i] is the byte offset of codepoints[i] in the raw text;
        // offsets.back() is the raw length.
        std::vector<size_t> offsets;
    };

    FoldedText fold(const std::string& text) const;
    bool matchSubstring(const FoldedText& name, MatchRange& range) const;
    bool matchSubsequence(const FoldedText& name, MatchRange& range) const;
    bool matchGlob(const std::string& name, MatchRange& range) const;

    std::string pattern_;
    MatchMode mode_;
    bool caseSensitive_;
    FoldedText foldedPattern_;
};

} // namespace scan
} // namespace twinpane

#endif
