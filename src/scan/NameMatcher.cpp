// src/scan/NameMatcher.cpp
#include "twinpane/scan/NameMatcher.hpp"
#include "twinpane/utils/Utf8.hpp"

#include <algorithm>
#include <fnmatch.h>

namespace twinpane {
namespace scan {

NameMatcher::NameMatcher(const std::string& pattern, MatchMode mode, bool caseSensitive)
    : pattern_(pattern)
    , mode_(mode)
    , caseSensitive_(caseSensitive) {
    foldedPattern_ = fold(pattern_);
}

NameMatcher::FoldedText NameMatcher::fold(const std::string& text) const {
    FoldedText folded;
    folded.codepoints.reserve(text.size());
    folded.offsets.reserve(text.size() + 1);

    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp;
        size_t length = utils::Utf8::decode(text, pos, cp);
        folded.codepoints.push_back(caseSensitive_ ? cp : utils::Utf8::foldCase(cp));
        folded.offsets.push_back(pos);
        pos += length;
    }
    folded.offsets.push_back(text.size());

    return folded;
}

bool NameMatcher::match(const std::string& name, MatchRange& range) const {
    if (mode_ == MatchMode::GLOB) {
        return matchGlob(name, range);
    }

    FoldedText folded = fold(name);
    if (mode_ == MatchMode::SUBSEQUENCE) {
        return matchSubsequence(folded, range);
    }
    return matchSubstring(folded, range);
}

bool NameMatcher::matches(const std::string& name) const {
    MatchRange range;
    return match(name, range);
}

bool NameMatcher::matchSubstring(const FoldedText& name, MatchRange& range) const {
    const auto& needle = foldedPattern_.codepoints;
    const auto& hay = name.codepoints;

    auto it = std::search(hay.begin(), hay.end(), needle.begin(), needle.end());
    if (it == hay.end() && !needle.empty()) {
        return false;
    }

    size_t first = static_cast<size_t>(it - hay.begin());
    range = MatchRange(name.offsets[first], name.offsets[first + needle.size()]);
    return true;
}

bool NameMatcher::matchSubsequence(const FoldedText& name, MatchRange& range) const {
    const auto& needle = foldedPattern_.codepoints;
    const auto& hay = name.codepoints;

    if (needle.empty()) {
        range = MatchRange(0, 0);
        return true;
    }

    size_t matched = 0;
    size_t first = 0;
    size_t last = 0;
    for (size_t i = 0; i < hay.size() && matched < needle.size(); ++i) {
        if (hay[i] == needle[matched]) {
            if (matched == 0) {
                first = i;
            }
            last = i;
            ++matched;
        }
    }

    if (matched < needle.size()) {
        return false;
    }

    range = MatchRange(name.offsets[first], name.offsets[last + 1]);
    return true;
}

bool NameMatcher::matchGlob(const std::string& name, MatchRange& range) const {
    int flags = caseSensitive_ ? 0 : FNM_CASEFOLD;
    if (fnmatch(pattern_.c_str(), name.c_str(), flags) != 0) {
        return false;
    }
    range = MatchRange(0, name.size());
    return true;
}

} // namespace scan
} // namespace twinpane
