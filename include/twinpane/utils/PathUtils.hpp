// include/twinpane/utils/PathUtils.hpp
#ifndef TWINPANE_PATHUTILS_HPP
#define TWINPANE_PATHUTILS_HPP

#include <string>

namespace twinpane {
namespace utils {

class PathUtils {
public:
    static std::string combinePaths(const std::string& path1, const std::string& path2);
    static std::string getParentPath(const std::string& path);
    static std::string getFileName(const std::string& path);
    // Collapses repeated separators and drops a trailing one ("/" stays "/").
    static std::string normalizePath(const std::string& path);
    // True when child equals parent or lies somewhere below it. Both paths
    // are compared component-wise, so "/a/bc" is not within "/a/b".
    static bool isWithin(const std::string& parent, const std::string& child);
    // "report.tar.gz" -> ("report.tar", ".gz"); dotfiles have no extension.
    static void splitExtension(const std::string& name, std::string& stem, std::string& extension);

    // "/d/a.txt" + "3f9c01" -> "/d/.a.txt.twinpane-3f9c01"
    static std::string partialFilePath(const std::string& destination, const std::string& token);
    static bool isPartialFilePath(const std::string& path);
};

} // namespace utils
} // namespace twinpane

#endif
