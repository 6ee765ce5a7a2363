#include "utils/PathUtils.h"
#include <algorithm>
#include <regex>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace landmark_eval {

namespace {

// Folder naming conventions of the annotation tree
const std::regex kUserScalePattern(R"(user-(.\S+)_scale-(\d+)pc)");
const std::regex kScalePattern(R"(\S*scale-(\d+)pc)");

} // namespace

std::string baseName(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string joinPath(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

std::pair<std::string, int> parseUserScale(const std::string& path) {
    std::string name = baseName(path);
    std::smatch match;
    // Prefix match: the name has to start with the pattern
    if (!std::regex_search(name, match, kUserScalePattern, std::regex_constants::match_continuous)) {
        return {"", -1};
    }
    return {match[1].str(), std::stoi(match[2].str())};
}

int parseScale(const std::string& path) {
    std::string name = baseName(path);
    std::smatch match;
    if (!std::regex_search(name, match, kScalePattern, std::regex_constants::match_continuous)) {
        return -1;
    }
    return std::stoi(match[1].str());
}

bool pathExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string updatePath(const std::string& path, int max_depth) {
    if (!path.empty() && path[0] == '/') {
        return path;
    }

    std::string candidate = path;
    for (int i = 0; i < max_depth; ++i) {
        if (pathExists(candidate)) {
            return candidate;
        }
        candidate = joinPath("..", candidate);
    }
    return pathExists(candidate) ? candidate : path;
}

bool createDirectory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }
    return mkdir(path.c_str(), 0755) == 0;
}

std::vector<std::string> listDirectory(const std::string& path, bool dirs_only) {
    std::vector<std::string> entries;
    DIR* dir = opendir(path.c_str());
    if (dir == nullptr) {
        return entries;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        std::string full = joinPath(path, name);
        if (dirs_only && !isDirectory(full)) continue;
        entries.push_back(full);
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace landmark_eval
