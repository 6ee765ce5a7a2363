#pragma once

#include <string>
#include <utility>
#include <vector>

namespace landmark_eval {

/**
 * Parse annotator name and scale from a folder named user-<name>_scale-<N>pc
 * @param path Path to the user folder (only the last component is parsed)
 * @return (user, scale), or ("", -1) if the name does not follow the convention
 */
std::pair<std::string, int> parseUserScale(const std::string& path);

/**
 * Parse scale from a folder name ending in scale-<N>pc
 * @return scale in percent, or -1 if the name does not follow the convention
 */
int parseScale(const std::string& path);

/**
 * Look for a relative path in the parent folders, up to max_depth levels up.
 * Absolute paths are returned unchanged.
 * @return Found path, or the input path if it does not exist at any level
 */
std::string updatePath(const std::string& path, int max_depth = 5);

/**
 * Join two path components with a single separator
 */
std::string joinPath(const std::string& base, const std::string& name);

/**
 * Last path component (empty for a path ending in '/')
 */
std::string baseName(const std::string& path);

bool pathExists(const std::string& path);

bool isDirectory(const std::string& path);

/**
 * Create directory if it does not exist yet
 * @return true if the directory exists afterwards
 */
bool createDirectory(const std::string& path);

/**
 * Sorted paths of the entries of a directory, without "." and ".."
 * @param dirs_only Skip everything that is not a directory
 */
std::vector<std::string> listDirectory(const std::string& path, bool dirs_only = false);

} // namespace landmark_eval
