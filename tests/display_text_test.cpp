// tests/display_text_test.cpp
#include "twinpane/utils/DisplayText.hpp"
#include "twinpane/utils/Utf8.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using twinpane::utils::DisplayText;

namespace {

const std::string kEllipsis = "\xE2\x80\xA6";

bool cutsOnBoundaries(const std::string& original, const std::string& piece) {
    // The piece, minus any ellipsis, must decode without replacement characters
    // wherever the original did.
    size_t pos = 0;
    while (pos < piece.size()) {
        uint32_t cp;
        size_t length = twinpane::utils::Utf8::decode(piece, pos, cp);
        if (cp == 0xFFFD && original.find("\xEF\xBF\xBD") == std::string::npos &&
            original.find('\xFF') == std::string::npos) {
            return false;
        }
        pos += length;
    }
    return true;
}

} // namespace

TEST(DisplayTextTest, BoundariesInsideMultiByteCharacters) {
    const std::string text = "a\xEA\xB0\x80" "b";  // "a가b"

    EXPECT_TRUE(DisplayText::isCharBoundary(text, 0));
    EXPECT_TRUE(DisplayText::isCharBoundary(text, 1));
    EXPECT_FALSE(DisplayText::isCharBoundary(text, 2));
    EXPECT_FALSE(DisplayText::isCharBoundary(text, 3));
    EXPECT_TRUE(DisplayText::isCharBoundary(text, 4));
    EXPECT_TRUE(DisplayText::isCharBoundary(text, 5));
    EXPECT_TRUE(DisplayText::isCharBoundary(text, 99));

    EXPECT_EQ(DisplayText::floorCharBoundary(text, 3), 1u);
    EXPECT_EQ(DisplayText::ceilCharBoundary(text, 2), 4u);
    EXPECT_EQ(DisplayText::floorCharBoundary(text, 42), text.size());
}

TEST(DisplayTextTest, SafePrefixAndSuffixNeverSplitCharacters) {
    const std::string text = "a\xEA\xB0\x80" "b";

    EXPECT_EQ(DisplayText::safePrefix(text, 2), "a");
    EXPECT_EQ(DisplayText::safePrefix(text, 4), "a\xEA\xB0\x80");
    EXPECT_EQ(DisplayText::safeSuffix(text, 2), "b");
    EXPECT_EQ(DisplayText::safeSuffix(text, 4), "\xEA\xB0\x80" "b");
    EXPECT_EQ(DisplayText::safePrefix(text, 100), text);
    EXPECT_EQ(DisplayText::safeSuffix("", 3), "");
}

TEST(DisplayTextTest, DisplayWidthCountsCells) {
    EXPECT_EQ(DisplayText::displayWidth("hello"), 5u);
    EXPECT_EQ(DisplayText::displayWidth("\xEA\xB0\x80\xEB\x82\x98"), 4u);          // "가나"
    EXPECT_EQ(DisplayText::displayWidth("\xF0\x9F\x98\x80"), 2u);                  // grinning face
    EXPECT_EQ(DisplayText::displayWidth("e\xCC\x81"), 1u);                         // e + combining acute
    EXPECT_EQ(DisplayText::displayWidth("\xE6\x96\x87\xE4\xBB\xB6.txt"), 8u);      // "文件.txt"
    EXPECT_EQ(DisplayText::displayWidth(""), 0u);
}

TEST(DisplayTextTest, TextWithinWidthIsReturnedUnchanged) {
    EXPECT_EQ(DisplayText::truncateEnd("short", 5), "short");
    EXPECT_EQ(DisplayText::truncateStart("short", 10), "short");
    EXPECT_EQ(DisplayText::truncateMiddle("short", 5), "short");
}

TEST(DisplayTextTest, ZeroWidthYieldsEmptyString) {
    EXPECT_EQ(DisplayText::truncateEnd("hello", 0), "");
    EXPECT_EQ(DisplayText::truncateStart("hello", 0), "");
    EXPECT_EQ(DisplayText::truncateMiddle("hello", 0), "");
}

TEST(DisplayTextTest, TruncateEndKeepsHead) {
    EXPECT_EQ(DisplayText::truncateEnd("hello world", 8), "hello w" + kEllipsis);
    EXPECT_EQ(DisplayText::truncateEnd("hello", 1), kEllipsis);
}

TEST(DisplayTextTest, TruncateStartKeepsFileName) {
    std::string result = DisplayText::truncateStart("/home/user/documents/file.txt", 12);
    EXPECT_EQ(result, kEllipsis + "ts/file.txt");
    EXPECT_EQ(DisplayText::displayWidth(result), 12u);
}

TEST(DisplayTextTest, TruncateMiddleKeepsBothEnds) {
    EXPECT_EQ(DisplayText::truncateMiddle("abcdefghij", 5), "ab" + kEllipsis + "ij");
}

TEST(DisplayTextTest, WideCharactersAreNotSplitAcrossTheLimit) {
    const std::string korean = "\xEA\xB0\x80\xEB\x82\x98\xEB\x8B\xA4\xEB\x9D\xBC\xEB\xA7\x88";  // 가나다라마

    EXPECT_EQ(DisplayText::truncateEnd(korean, 5), "\xEA\xB0\x80\xEB\x82\x98" + kEllipsis);
    // Only one cell is left after the first character; the second one does not fit.
    EXPECT_EQ(DisplayText::truncateEnd(korean, 4), "\xEA\xB0\x80" + kEllipsis);
    EXPECT_EQ(DisplayText::truncateStart(korean, 4), kEllipsis + "\xEB\xA7\x88");
}

TEST(DisplayTextTest, CombiningMarksStayWithTheirBase) {
    const std::string text = "abcde\xCC\x81";

    EXPECT_EQ(DisplayText::truncateStart(text, 2), kEllipsis + "e\xCC\x81");
    EXPECT_EQ(DisplayText::truncateEnd(text, 5), text);

    const std::string accentFirst = "e\xCC\x81" "fgh";
    EXPECT_EQ(DisplayText::truncateEnd(accentFirst, 3), "e\xCC\x81" "f" + kEllipsis);
}

TEST(DisplayTextTest, InvalidUtf8IsHandledWithoutSplitting) {
    const std::string broken = "ab\xFF\xFE" "cd\xE2\x82";

    EXPECT_EQ(DisplayText::displayWidth(broken), 8u);
    std::string truncated = DisplayText::truncateEnd(broken, 4);
    EXPECT_LE(DisplayText::displayWidth(truncated), 4u);
    EXPECT_EQ(truncated.substr(0, 2), "ab");
}

TEST(DisplayTextTest, ResultsNeverExceedRequestedWidth) {
    const std::vector<std::string> samples = {
        "/home/user/\xEB\xB0\x94\xED\x83\x95\xED\x99\x94\xEB\xA9\xB4/\xE6\x96\x87\xE4\xBB\xB6.txt",
        "\xF0\x9F\x98\x80\xF0\x9F\x98\x81\xF0\x9F\x98\x82 party.mp4",
        "e\xCC\x81" "e\xCC\x81" "e\xCC\x81" "e\xCC\x81",
        "plain-ascii-name.tar.gz",
    };

    for (const auto& sample : samples) {
        for (size_t width = 0; width <= 16; ++width) {
            std::string end = DisplayText::truncateEnd(sample, width);
            std::string start = DisplayText::truncateStart(sample, width);
            std::string middle = DisplayText::truncateMiddle(sample, width);

            EXPECT_LE(DisplayText::displayWidth(end), width) << sample << " @" << width;
            EXPECT_LE(DisplayText::displayWidth(start), width) << sample << " @" << width;
            EXPECT_LE(DisplayText::displayWidth(middle), width) << sample << " @" << width;

            EXPECT_TRUE(cutsOnBoundaries(sample, end));
            EXPECT_TRUE(cutsOnBoundaries(sample, start));
            EXPECT_TRUE(cutsOnBoundaries(sample, middle));
        }
    }
}
