// src/utils/PathUtils.cpp
#include "twinpane/utils/PathUtils.hpp"
#include "twinpane/common/Constants.hpp"

#include <cctype>

std::string twinpane::utils::PathUtils::combinePaths(const std::string& path1, const std::string& path2) {
    if (path1.empty()) return path2;
    if (path2.empty()) return path1;

    if (path1.back() == '/') {
        if (path2.front() == '/') return path1 + path2.substr(1);
        return path1 + path2;
    }
    if (path2.front() == '/') return path1 + path2;
    return path1 + "/" + path2;
}

std::string twinpane::utils::PathUtils::getParentPath(const std::string& path) {
    std::string normalized = normalizePath(path);
    if (normalized.empty() || normalized == "/") return "";
    size_t last_slash = normalized.find_last_of('/');
    if (last_slash == 0) return "/";
    if (last_slash == std::string::npos) return "";
    return normalized.substr(0, last_slash);
}

std::string twinpane::utils::PathUtils::getFileName(const std::string& path) {
    std::string normalized = normalizePath(path);
    if (normalized == "/") return normalized;
    size_t last_slash = normalized.find_last_of('/');
    if (last_slash == std::string::npos) return normalized;
    return normalized.substr(last_slash + 1);
}

std::string twinpane::utils::PathUtils::normalizePath(const std::string& path) {
    std::string result = path;
    size_t pos;
    while ((pos = result.find("//")) != std::string::npos) result.replace(pos, 2, "/");
    if (result.length() > 1 && result.back() == '/') result.pop_back();
    return result;
}

bool twinpane::utils::PathUtils::isWithin(const std::string& parent, const std::string& child) {
    std::string p = normalizePath(parent);
    std::string c = normalizePath(child);

    if (p == c) return true;
    if (p == "/") return !c.empty() && c.front() == '/';
    if (c.size() <= p.size()) return false;
    return c.compare(0, p.size(), p) == 0 && c[p.size()] == '/';
}

void twinpane::utils::PathUtils::splitExtension(const std::string& name, std::string& stem, std::string& extension) {
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        stem = name;
        extension.clear();
        return;
    }
    stem = name.substr(0, dot);
    extension = name.substr(dot);
}

std::string twinpane::utils::PathUtils::partialFilePath(const std::string& destination, const std::string& token) {
    std::string name = "." + getFileName(destination) + common::Constants::PARTIAL_MARKER + token;
    return combinePaths(getParentPath(destination), name);
}

bool twinpane::utils::PathUtils::isPartialFilePath(const std::string& path) {
    std::string name = getFileName(path);
    const std::string marker = common::Constants::PARTIAL_MARKER;
    const size_t tokenLength = common::Constants::PARTIAL_TOKEN_LENGTH;

    if (name.size() < 2 + marker.size() + tokenLength || name.front() != '.') return false;
    size_t markerPos = name.size() - tokenLength - marker.size();
    if (name.compare(markerPos, marker.size(), marker) != 0) return false;
    for (size_t i = name.size() - tokenLength; i < name.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(name[i]))) return false;
    }
    return true;
}
