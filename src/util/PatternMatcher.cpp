#include "util/PatternMatcher.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace githooker {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (char c : pattern) {
        if (c == '*') {
            regexStr += "[^/]*";
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.') {
            regexStr += "\\.";
        } else if (c == '+' || c == '[' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool isPattern(const std::string& path) {
    return path.find('*') != std::string::npos ||
           path.find('?') != std::string::npos ||
           path.find('[') != std::string::npos;
}

bool matchesAny(const std::string& fileName, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (pattern.empty()) continue;
        if (!isPattern(pattern)) {
            if (fileName == pattern) return true;
            continue;
        }
        if (std::regex_match(fileName, globToRegex(pattern))) return true;
    }
    return false;
}

std::vector<fs::path> matchFilesInDirectory(
    const fs::path& dir,
    const std::vector<std::string>& patterns
) {
    std::vector<fs::path> matches;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return matches;
    }

    for (auto it = fs::directory_iterator(dir, ec);
         !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        const auto& entry = *it;
        std::error_code fileEc;
        if (!entry.is_regular_file(fileEc)) continue;
        if (matchesAny(entry.path().filename().string(), patterns)) {
            matches.push_back(fs::absolute(entry.path()));
        }
    }

    std::sort(matches.begin(), matches.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return matches;
}

}  // namespace PatternMatcher
}  // namespace githooker
