#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace PathUtils {
    // Convert backslashes to forward slashes and collapse duplicate separators
    std::string normalizePath(const std::string& path);

    // Join two path components with a single separator
    std::string joinPath(const std::string& base, const std::string& part);

    // Last path component ("a/b/c.mp3" -> "c.mp3")
    std::string fileName(const std::string& path);

    // Lower-case extension including the dot (".mp3"), empty if none
    std::string extensionLower(const std::string& path);

    bool fileExists(const std::string& path);
    bool isDirectory(const std::string& path);
    bool isExecutable(const std::string& path);

    // mkdir -p; true if the directory exists afterwards
    bool createDirectories(const std::string& path);

    // Names (not paths) of the regular files directly inside dir.
    // Returns false if the directory cannot be opened.
    bool listFiles(const std::string& dir, std::vector<std::string>& names);

    bool renameFile(const std::string& from, const std::string& to);
    bool removeFile(const std::string& path);

    // Free space available to unprivileged users, in MiB. -1 on error.
    int64_t freeSpaceMb(const std::string& path);

    // Resolve an executable name against $PATH, empty if not found
    std::string findInPath(const std::string& name);
}
