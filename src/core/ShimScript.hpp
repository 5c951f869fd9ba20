#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace githooker {

/// Values baked into a shim at install time
struct ShimConfig {
    std::string hookName;
    std::filesystem::path projectRoot;   // absolute
    std::filesystem::path executable;    // absolute path of the githooker binary
    std::vector<std::string> searchPaths;
};

/**
 * @brief Generator and detector for .git/hooks shims
 *
 * A shim is a POSIX sh script. Git runs it from wherever it likes; the shim
 * changes into the project root recorded at install time and execs
 * `githooker ... run <hook> -- "$@"`, so Git's arguments and stdin reach the
 * runner untouched. The sentinel line marks the file as ours.
 */
namespace ShimScript {

std::string render(const ShimConfig& config);

/// True if the text carries the sentinel line
bool isManaged(const std::string& content);

/// Reads the file; unreadable or missing files are not managed
bool isManagedFile(const std::filesystem::path& file);

/// Single-quote a value for sh ('it'"'"'s')
std::string shellQuote(const std::string& value);

}

}
