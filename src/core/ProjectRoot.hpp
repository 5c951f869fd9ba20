#pragma once

#include <filesystem>

#include "util/Expected.hpp"

namespace githooker {

/**
 * @brief Locates the project root (the directory holding .git)
 *
 * Layout used by the installer:
 *   <root>/
 *     .git/
 *       hooks/
 *         pre-commit    - shim written by `githooker install pre-commit`
 *     githooks/
 *       pre_commit.json - hook definition found by discovery
 */
class ProjectRoot {
public:
    /**
     * @brief Find the project root by searching upwards for .git
     * @param start Starting directory (usually current working directory)
     * @return Absolute path to the project root, or NotARepository
     *
     * Walks up the directory tree until a .git directory is found or the
     * filesystem root is reached.
     */
    static Expected<std::filesystem::path> discover(const std::filesystem::path& start);

    /**
     * @brief Resolve the root for a command
     * @param explicitRoot Value of --project-root, empty when not given
     * @return explicitRoot (made absolute) if it contains .git, else discover(cwd)
     */
    static Expected<std::filesystem::path> resolve(const std::filesystem::path& explicitRoot);

    static std::filesystem::path gitDir(const std::filesystem::path& root) { return root / ".git"; }
    static std::filesystem::path hooksDir(const std::filesystem::path& root) { return root / ".git" / "hooks"; }
};

}
