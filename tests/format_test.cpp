// tests/format_test.cpp
#include "twinpane/utils/DisplayText.hpp"
#include "twinpane/utils/FilenameValidator.hpp"
#include "twinpane/utils/Format.hpp"
#include "twinpane/utils/PathUtils.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

#include <sys/stat.h>

using twinpane::utils::DisplayText;
using twinpane::utils::FilenameValidator;
using twinpane::utils::Format;
using twinpane::utils::PathUtils;

TEST(FormatTest, FormatSize) {
    EXPECT_EQ(Format::formatSize(0), "0 B");
    EXPECT_EQ(Format::formatSize(512), "512 B");
    EXPECT_EQ(Format::formatSize(1536), "1.5 KB");
    EXPECT_EQ(Format::formatSize(1048576), "1.0 MB");
    EXPECT_EQ(Format::formatSize(1073741824ULL), "1.0 GB");
}

TEST(FormatTest, FormatPermissions) {
    EXPECT_EQ(Format::formatPermissionsShort(0644), "rw-r--r--");
    EXPECT_EQ(Format::formatPermissions(S_IFDIR | 0755), "drwxr-xr-x (755)");
    EXPECT_EQ(Format::formatPermissions(S_IFREG | 0600), "-rw------- (600)");
    EXPECT_EQ(Format::formatPermissions(S_IFLNK | 0777), "lrwxrwxrwx (777)");
}

TEST(FormatTest, DescribeProgressTruncatesPathFromTheStart) {
    twinpane::utils::OperationProgress progress;
    progress.currentPath = "/very/long/path/to/some/file.txt";
    progress.entriesDone = 3;
    progress.entriesTotal = 10;
    progress.bytesDone = 1536;
    progress.bytesTotal = 4096;

    twinpane::utils::ProgressLines lines = Format::describeProgress(progress, 20);
    EXPECT_EQ(lines.fileLine, "File: \xE2\x80\xA6some/file.txt");
    EXPECT_LE(DisplayText::displayWidth(lines.fileLine), 20u);
    EXPECT_LE(DisplayText::displayWidth(lines.countLine), 20u);

    lines = Format::describeProgress(progress, 80);
    EXPECT_EQ(lines.fileLine, "File: /very/long/path/to/some/file.txt");
    EXPECT_EQ(lines.countLine, "3/10 files (1.5 KB/4.0 KB)");
}

TEST(FormatTest, DescribeProgressWithMultiByteNames) {
    twinpane::utils::OperationProgress progress;
    progress.currentPath = "/data/\xEC\x82\xAC\xEC\xA7\x84/\xEC\x97\xAC\xED\x96\x89\xEC\x82\xAC\xEC\xA7\x84.jpg";

    for (size_t width = 0; width < 30; ++width) {
        twinpane::utils::ProgressLines lines = Format::describeProgress(progress, width);
        EXPECT_LE(DisplayText::displayWidth(lines.fileLine), width);
        EXPECT_LE(DisplayText::displayWidth(lines.countLine), width);
    }
}

TEST(FormatTest, FitPathKeepsPrefixAndSuffix) {
    EXPECT_EQ(Format::fitPath("Exists: ", "/dst/a.txt", "", 80), "Exists: /dst/a.txt");
    EXPECT_EQ(Format::fitPath("Exists: ", "/dst/deep/tree/a.txt", "", 20),
              "Exists: \xE2\x80\xA6/tree/a.txt");
    EXPECT_EQ(Format::fitPath("", "src/build/out", "/", 10), "\xE2\x80\xA6uild/out/");
    // Nothing is left for the path; the line itself is cut.
    EXPECT_EQ(Format::fitPath("Aborted: IOFailure ", "/x", "", 8), "Aborted\xE2\x80\xA6");
}

TEST(FormatTest, DescribeEntryErrorFitsTheTerminal) {
    twinpane::common::EntryError error("/home/user/projects/archive/2024/report.pdf",
                                       twinpane::common::ErrorCode::PERMISSION_DENIED,
                                       {}, "locked");
    std::string full = Format::describeEntryError(error, std::numeric_limits<size_t>::max());
    EXPECT_EQ(full, "  PermissionDenied: /home/user/projects/archive/2024/report.pdf (locked)");

    for (size_t width = 0; width < 80; ++width) {
        std::string line = Format::describeEntryError(error, width);
        EXPECT_LE(DisplayText::displayWidth(line), width);
    }
    EXPECT_EQ(Format::describeEntryError(error, 50),
              "  PermissionDenied: \xE2\x80\xA6hive/2024/report.pdf (locked)");
}

TEST(FilenameValidatorTest, AcceptsOrdinaryNames) {
    EXPECT_TRUE(FilenameValidator::isValid("report.txt"));
    EXPECT_TRUE(FilenameValidator::isValid("report (1).txt"));
    EXPECT_TRUE(FilenameValidator::isValid(".bashrc"));
    EXPECT_TRUE(FilenameValidator::isValid("\xEA\xB0\x80\xEB\x82\x98.txt"));
    EXPECT_TRUE(FilenameValidator::isValid(std::string(255, 'a')));
}

TEST(FilenameValidatorTest, RejectsInvalidNames) {
    std::string reason;

    EXPECT_EQ(FilenameValidator::validate("", reason), twinpane::common::ErrorCode::INVALID_FILENAME);
    EXPECT_EQ(reason, "Filename cannot be empty");

    EXPECT_TRUE(FilenameValidator::validate("   ", reason));
    EXPECT_EQ(reason, "Filename cannot be empty");

    EXPECT_TRUE(FilenameValidator::validate("a/b", reason));
    EXPECT_EQ(reason, "Filename cannot contain path separators");

    EXPECT_TRUE(FilenameValidator::validate("a\\b", reason));
    EXPECT_EQ(reason, "Filename cannot contain path separators");

    EXPECT_TRUE(FilenameValidator::validate(std::string("a\0b", 3), reason));
    EXPECT_EQ(reason, "Filename cannot contain null bytes");

    EXPECT_TRUE(FilenameValidator::validate("..", reason));
    EXPECT_EQ(reason, "Invalid filename");

    EXPECT_TRUE(FilenameValidator::validate(std::string(256, 'a'), reason));
    EXPECT_EQ(reason, "Filename too long (max 255 bytes)");

    EXPECT_TRUE(FilenameValidator::validate("tab\there", reason));
    EXPECT_EQ(reason, "Filename cannot contain control characters");

    EXPECT_TRUE(FilenameValidator::validate(" padded", reason));
    EXPECT_EQ(reason, "Filename cannot start or end with whitespace");

    EXPECT_TRUE(FilenameValidator::validate("-rf", reason));
    EXPECT_EQ(reason, "Filename cannot start with hyphen");
}

TEST(PathUtilsTest, ComponentWiseContainment) {
    EXPECT_TRUE(PathUtils::isWithin("/a/b", "/a/b"));
    EXPECT_TRUE(PathUtils::isWithin("/a/b", "/a/b/c"));
    EXPECT_FALSE(PathUtils::isWithin("/a/b", "/a/bc"));
    EXPECT_TRUE(PathUtils::isWithin("/", "/etc"));
}

TEST(PathUtilsTest, SplitExtension) {
    std::string stem;
    std::string extension;

    PathUtils::splitExtension("report.tar.gz", stem, extension);
    EXPECT_EQ(stem, "report.tar");
    EXPECT_EQ(extension, ".gz");

    PathUtils::splitExtension(".bashrc", stem, extension);
    EXPECT_EQ(stem, ".bashrc");
    EXPECT_EQ(extension, "");

    PathUtils::splitExtension("README", stem, extension);
    EXPECT_EQ(stem, "README");
    EXPECT_EQ(extension, "");
}
