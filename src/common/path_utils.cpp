#include "path_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>

namespace PathUtils {

std::string normalizePath(const std::string& path) {
    if (path.empty()) return path;
    std::string normalized = path;

    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    std::string result;
    for (size_t i = 0; i < normalized.length(); i++) {
        if (normalized[i] != '/' || result.empty() || result.back() != '/') {
            result += normalized[i];
        }
    }
    return result;
}

std::string joinPath(const std::string& base, const std::string& part) {
    if (base.empty()) return normalizePath(part);
    std::string normalized_base = normalizePath(base);
    std::string normalized_part = normalizePath(part);

    if (normalized_base.back() == '/') {
        return normalized_base + normalized_part;
    }
    return normalized_base + "/" + normalized_part;
}

std::string fileName(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash == std::string::npos) return path;
    return path.substr(last_slash + 1);
}

std::string extensionLower(const std::string& path) {
    std::string name = fileName(path);
    size_t last_dot = name.find_last_of('.');
    if (last_dot == std::string::npos || last_dot == 0) return "";
    std::string ext = name.substr(last_dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool isExecutable(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

bool createDirectories(const std::string& path) {
    if (path.empty()) return false;
    if (isDirectory(path)) return true;

    std::string normalized = normalizePath(path);
    std::string current;
    size_t pos = 0;
    if (normalized[0] == '/') {
        current = "/";
        pos = 1;
    }
    while (pos <= normalized.size()) {
        size_t next = normalized.find('/', pos);
        if (next == std::string::npos) next = normalized.size();
        std::string component = normalized.substr(pos, next - pos);
        if (!component.empty()) {
            if (!current.empty() && current.back() != '/') current += "/";
            current += component;
            if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                return false;
            }
        }
        pos = next + 1;
    }
    return isDirectory(path);
}

bool listFiles(const std::string& dir, std::vector<std::string>& names) {
    DIR* handle = opendir(dir.c_str());
    if (!handle) {
        return false;
    }
    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        struct stat st;
        std::string full = joinPath(dir, name);
        if (stat(full.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            names.push_back(name);
        }
    }
    closedir(handle);
    std::sort(names.begin(), names.end());
    return true;
}

bool renameFile(const std::string& from, const std::string& to) {
    return std::rename(from.c_str(), to.c_str()) == 0;
}

bool removeFile(const std::string& path) {
    return std::remove(path.c_str()) == 0;
}

int64_t freeSpaceMb(const std::string& path) {
    struct statvfs vfs;
    if (statvfs(path.c_str(), &vfs) != 0) {
        return -1;
    }
    uint64_t free_bytes = static_cast<uint64_t>(vfs.f_bavail) * static_cast<uint64_t>(vfs.f_frsize);
    return static_cast<int64_t>(free_bytes / (1024 * 1024));
}

std::string findInPath(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return isExecutable(name) ? name : "";
    }
    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";

    std::istringstream stream(path_env);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = joinPath(dir, name);
        if (isExecutable(candidate)) {
            return candidate;
        }
    }
    return "";
}

} // namespace PathUtils
