// tests/search_engine_test.cpp
#include "twinpane/scan/SearchEngine.hpp"
#include "twinpane/scan/NameMatcher.hpp"
#include "twinpane/io/PosixFileSystem.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include <unistd.h>

using namespace twinpane;
using twinpane::test::TempDir;

namespace {

scan::SearchQuery makeQuery(const std::string& pattern,
                            scan::MatchMode mode = scan::MatchMode::SUBSTRING) {
    scan::SearchQuery query;
    query.pattern = pattern;
    query.mode = mode;
    return query;
}

std::set<std::string> relativePaths(const scan::SearchResult& result) {
    std::set<std::string> paths;
    for (const auto& match : result.matches) {
        paths.insert(match.relativePath);
    }
    return paths;
}

} // namespace

TEST(NameMatcherTest, SubstringIgnoresCaseByDefault) {
    scan::NameMatcher matcher("report", scan::MatchMode::SUBSTRING, false);
    scan::MatchRange range;

    ASSERT_TRUE(matcher.match("Annual-REPORT.pdf", range));
    EXPECT_EQ(range.begin, 7u);
    EXPECT_EQ(range.end, 13u);
    EXPECT_FALSE(matcher.matches("repo.pdf"));

    scan::NameMatcher strict("report", scan::MatchMode::SUBSTRING, true);
    EXPECT_FALSE(strict.matches("Annual-REPORT.pdf"));
    EXPECT_TRUE(strict.matches("report.pdf"));
}

TEST(NameMatcherTest, RangesReferToRawBytesAfterFolding) {
    // "ÄÖ-Datei": each umlaut is two bytes, folded to the lowercase form.
    const std::string name = "\xC3\x84\xC3\x96-Datei";
    scan::NameMatcher matcher("\xC3\xB6-d", scan::MatchMode::SUBSTRING, false);
    scan::MatchRange range;

    ASSERT_TRUE(matcher.match(name, range));
    EXPECT_EQ(range.begin, 2u);
    EXPECT_EQ(range.end, 6u);
    EXPECT_EQ(name.substr(range.begin, range.end - range.begin), "\xC3\x96-D");
}

TEST(NameMatcherTest, WideCharactersMatchWhole) {
    const std::string name = "\xEC\x82\xAC\xEC\xA7\x84_\xEA\xB0\x80\xEC\xA1\xB1.jpg";  // 사진_가족.jpg
    scan::NameMatcher matcher("\xEA\xB0\x80", scan::MatchMode::SUBSTRING, false);       // 가
    scan::MatchRange range;

    ASSERT_TRUE(matcher.match(name, range));
    EXPECT_EQ(range.begin, 7u);
    EXPECT_EQ(range.end, 10u);
}

TEST(NameMatcherTest, SubsequenceSpansFirstToLastMatchedCharacter) {
    scan::NameMatcher matcher("mnr", scan::MatchMode::SUBSEQUENCE, false);
    scan::MatchRange range;

    ASSERT_TRUE(matcher.match("my_notes_draft.md", range));
    EXPECT_EQ(range.begin, 0u);
    EXPECT_EQ(range.end, 11u);
    EXPECT_FALSE(matcher.matches("random"));
}

TEST(NameMatcherTest, GlobMatchesWholeName) {
    scan::NameMatcher matcher("*.TXT", scan::MatchMode::GLOB, false);
    scan::MatchRange range;

    ASSERT_TRUE(matcher.match("notes.txt", range));
    EXPECT_EQ(range.begin, 0u);
    EXPECT_EQ(range.end, 9u);
    EXPECT_FALSE(matcher.matches("notes.txt.bak"));

    scan::NameMatcher strict("*.TXT", scan::MatchMode::GLOB, true);
    EXPECT_FALSE(strict.matches("notes.txt"));

    scan::NameMatcher single("file?.log", scan::MatchMode::GLOB, true);
    EXPECT_TRUE(single.matches("file1.log"));
    EXPECT_FALSE(single.matches("file10.log"));
}

class SearchEngineTest : public ::testing::Test {
protected:
    TempDir dir_;
    io::PosixFileSystem fs_;
};

TEST_F(SearchEngineTest, FindsFilesAndDirectoriesButNeverTheRoot) {
    test::writeFile(dir_ / "alpha.txt", "a");
    test::writeFile(dir_ / "nested/Alpha-2.txt", "b");
    test::makeDirs(dir_ / "alphabet");
    test::writeFile(dir_ / "beta.txt", "c");

    scan::SearchEngine engine(fs_, traversal::WalkOptions());
    scan::SearchResult result = engine.search(dir_ / "alphabet", makeQuery("alpha"),
                                              utils::CancelToken());
    EXPECT_TRUE(result.matches.empty());

    result = engine.search(dir_.path(), makeQuery("alpha"), utils::CancelToken());

    EXPECT_EQ(relativePaths(result),
              (std::set<std::string>{"alpha.txt", "nested/Alpha-2.txt", "alphabet"}));
    EXPECT_FALSE(result.partial);
    EXPECT_FALSE(result.capReached);
    EXPECT_TRUE(result.errors.empty());

    for (const auto& match : result.matches) {
        if (match.relativePath == "alphabet") {
            EXPECT_EQ(match.kind, common::EntryKind::DIRECTORY);
        }
        if (match.relativePath == "alpha.txt") {
            EXPECT_EQ(match.kind, common::EntryKind::FILE);
            EXPECT_EQ(match.size, 1u);
            EXPECT_EQ(match.path, dir_ / "alpha.txt");
        }
    }
}

TEST_F(SearchEngineTest, FiltersByKind) {
    test::writeFile(dir_ / "log/log.txt", "x");

    scan::SearchEngine engine(fs_, traversal::WalkOptions());

    scan::SearchQuery query = makeQuery("log");
    query.filter = scan::SearchFilter::FILES_ONLY;
    scan::SearchResult result = engine.search(dir_.path(), query, utils::CancelToken());
    EXPECT_EQ(relativePaths(result), (std::set<std::string>{"log/log.txt"}));

    query.filter = scan::SearchFilter::DIRECTORIES_ONLY;
    result = engine.search(dir_.path(), query, utils::CancelToken());
    EXPECT_EQ(relativePaths(result), (std::set<std::string>{"log"}));
}

TEST_F(SearchEngineTest, CapStopsTheWalk) {
    for (int i = 0; i < 10; ++i) {
        test::writeFile(dir_ / ("dir" + std::to_string(i) + "/match" + std::to_string(i)), "x");
    }

    scan::SearchEngine engine(fs_, traversal::WalkOptions());
    scan::SearchQuery query = makeQuery("match");
    query.cap = 3;
    scan::SearchResult result = engine.search(dir_.path(), query, utils::CancelToken());

    EXPECT_EQ(result.matches.size(), 3u);
    EXPECT_TRUE(result.capReached);
    EXPECT_TRUE(result.partial);
    EXPECT_FALSE(result.cancelled);
    // Root, ten directories and ten files would be 20 visits without the cap.
    EXPECT_LT(result.entriesVisited, 20u);
}

TEST_F(SearchEngineTest, ZeroCapIsUnlimited) {
    for (int i = 0; i < 5; ++i) {
        test::writeFile(dir_ / ("match" + std::to_string(i)), "x");
    }

    scan::SearchEngine engine(fs_, traversal::WalkOptions());
    scan::SearchQuery query = makeQuery("match");
    query.cap = 0;
    scan::SearchResult result = engine.search(dir_.path(), query, utils::CancelToken());

    EXPECT_EQ(result.matches.size(), 5u);
    EXPECT_FALSE(result.capReached);
}

TEST_F(SearchEngineTest, KoreanNameUnderSymlinkLoopIsFoundOnce) {
    const std::string name = "\xEA\xB0\x80\xEB\x82\x98.txt";  // 가나.txt
    test::writeFile(dir_ / ("docs/a/" + name), "hello");
    test::makeSymlink("..", dir_ / "docs/a/loop");

    traversal::WalkOptions options;
    options.symlinkPolicy = common::SymlinkPolicy::FOLLOW;
    scan::SearchEngine engine(fs_, options);
    scan::SearchResult result = engine.search(dir_ / "docs", makeQuery("\xEA\xB0\x80"),
                                              utils::CancelToken());

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].relativePath, "a/" + name);
    EXPECT_EQ(result.matches[0].nameRange.begin, 0u);
    EXPECT_EQ(result.matches[0].nameRange.end, 3u);

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, common::ErrorCode::CYCLIC_SYMLINK);
    EXPECT_TRUE(result.partial);
}

TEST_F(SearchEngineTest, KoreanNameUnderSymlinkLoopWithCapOfOne) {
    const std::string name = "\xEA\xB0\x80\xEB\x82\x98.txt";  // 가나.txt
    test::writeFile(dir_ / ("docs/a/" + name), "hello");
    test::makeSymlink("..", dir_ / "docs/a/loop");

    traversal::WalkOptions options;
    options.symlinkPolicy = common::SymlinkPolicy::FOLLOW;
    scan::SearchEngine engine(fs_, options);
    scan::SearchQuery query = makeQuery("\xEA\xB0\x80");
    query.cap = 1;
    scan::SearchResult result = engine.search(dir_ / "docs", query, utils::CancelToken());

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].relativePath, "a/" + name);
    EXPECT_TRUE(result.capReached);
    EXPECT_TRUE(result.partial);
    // The loop is either cut off by the cap or reported once.
    EXPECT_LE(result.errors.size(), 1u);
    for (const auto& error : result.errors) {
        EXPECT_EQ(error.kind, common::ErrorCode::CYCLIC_SYMLINK);
    }
}

TEST_F(SearchEngineTest, UnreadableDirectoryStillMatchesByName) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    test::writeFile(dir_ / "secret-stuff/secret.txt", "s");
    ASSERT_EQ(::chmod((dir_ / "secret-stuff").c_str(), 0), 0);

    scan::SearchEngine engine(fs_, traversal::WalkOptions());
    scan::SearchResult result = engine.search(dir_.path(), makeQuery("secret"),
                                              utils::CancelToken());

    EXPECT_EQ(relativePaths(result), (std::set<std::string>{"secret-stuff"}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, common::ErrorCode::PERMISSION_DENIED);
    EXPECT_TRUE(result.partial);
}

TEST_F(SearchEngineTest, CancelledSearchIsPartial) {
    test::writeFile(dir_ / "match.txt", "x");

    utils::CancelToken cancel;
    cancel.cancel();

    scan::SearchEngine engine(fs_, traversal::WalkOptions());
    scan::SearchResult result = engine.search(dir_.path(), makeQuery("match"), cancel);

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.partial);
    EXPECT_TRUE(result.matches.empty());
}
