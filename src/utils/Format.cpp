// src/utils/Format.cpp
#include "twinpane/utils/Format.hpp"
#include "twinpane/utils/DisplayText.hpp"

#include <iomanip>
#include <sstream>
#include <sys/stat.h>

namespace twinpane {
namespace utils {

namespace {

const char* const kPerms[8] = {"---", "--x", "-w-", "-wx", "r--", "r-x", "rw-", "rwx"};

} // namespace

std::string Format::formatSize(uint64_t bytes) {
    const uint64_t KB = 1024;
    const uint64_t MB = KB * 1024;
    const uint64_t GB = MB * 1024;

    std::stringstream ss;
    if (bytes < KB) {
        ss << bytes << " B";
        return ss.str();
    }

    ss << std::fixed << std::setprecision(1);
    if (bytes < MB) {
        ss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else if (bytes < GB) {
        ss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else {
        ss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    }
    return ss.str();
}

std::string Format::formatPermissionsShort(uint32_t mode) {
    std::string result;
    result += kPerms[(mode >> 6) & 7];
    result += kPerms[(mode >> 3) & 7];
    result += kPerms[mode & 7];
    return result;
}

std::string Format::formatPermissions(uint32_t mode) {
    char type = '-';
    if ((mode & S_IFMT) == S_IFDIR) {
        type = 'd';
    } else if ((mode & S_IFMT) == S_IFLNK) {
        type = 'l';
    }

    std::stringstream ss;
    ss << type << formatPermissionsShort(mode) << " (" << std::oct << (mode & 0777) << ")";
    return ss.str();
}

ProgressLines Format::describeProgress(const OperationProgress& progress, size_t width) {
    const std::string label = "File: ";
    ProgressLines lines;

    lines.fileLine = fitPath(label, progress.currentPath, std::string(), width);

    std::stringstream ss;
    ss << progress.entriesDone << "/" << progress.entriesTotal << " files ("
       << formatSize(progress.bytesDone) << "/" << formatSize(progress.bytesTotal) << ")";
    lines.countLine = DisplayText::truncateEnd(ss.str(), width);

    return lines;
}

std::string Format::fitPath(const std::string& prefix, const std::string& path,
                            const std::string& suffix, size_t width) {
    const size_t fixed = DisplayText::displayWidth(prefix) + DisplayText::displayWidth(suffix);
    if (width > fixed) {
        return prefix + DisplayText::truncateStart(path, width - fixed) + suffix;
    }
    return DisplayText::truncateEnd(prefix + path + suffix, width);
}

std::string Format::describeEntryError(const common::EntryError& error, size_t width) {
    std::string suffix;
    if (!error.detail.empty()) {
        suffix += " (" + error.detail + ")";
    }
    if (error.cause) {
        suffix += " - " + error.cause.message();
    }
    return fitPath(std::string("  ") + common::errorName(error.kind) + ": ", error.path, suffix, width);
}

} // namespace utils
} // namespace twinpane
