#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

namespace githooker {

/**
 * @brief Glob matching for hook definition file names
 *
 * Discovery selects candidate files by name ("*.json" inside search
 * directories, "*_hook.json" at the project root). Patterns are matched against a
 * single path component.
 *
 * Supported patterns:
 *   * -> any run of characters except '/'
 *   ? -> one character except '/'
 *
 * Examples:
 *   *.json        -> pre_commit.json, lint.json
 *   *_hook.json   -> format_hook.json
 *   commit?.json  -> commit1.json
 */
namespace PatternMatcher {

/**
 * @brief Convert glob pattern to std::regex
 *
 * Everything other than '*' and '?' is matched literally.
 *
 * Example: "*.json" -> "^[^/]*\.json$"
 */
std::regex globToRegex(const std::string& pattern);

/// True if the string contains '*', '?' or '['
bool isPattern(const std::string& path);

/// True if the file name matches any of the glob patterns
bool matchesAny(const std::string& fileName, const std::vector<std::string>& patterns);

/**
 * @brief List regular files directly inside a directory whose name matches a pattern
 *
 * Not recursive. Results are sorted by file name so callers see a stable
 * order. A missing or unreadable directory yields an empty list.
 *
 * @param dir Directory to scan
 * @param patterns Glob patterns; a file matching any of them is returned
 * @return Absolute paths of matching files
 */
std::vector<std::filesystem::path> matchFilesInDirectory(
    const std::filesystem::path& dir,
    const std::vector<std::string>& patterns
);

}  // namespace PatternMatcher

}  // namespace githooker
