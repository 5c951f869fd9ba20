#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/HookDefinition.hpp"
#include "util/Expected.hpp"

namespace githooker {

/// One file found in .git/hooks
struct InstalledHook {
    std::string name;
    std::filesystem::path path;
    bool managed{false};    // carries the githooker sentinel
};

/**
 * @brief Writes and removes shims in <root>/.git/hooks
 *
 * Never overwrites or deletes a file that lacks the sentinel, so hand-written
 * hooks survive every install/uninstall.
 */
class ShimInstaller {
public:
    /**
     * @param projectRoot Absolute project root, baked into every shim
     * @param executable  githooker binary the shim will exec
     * @param searchPaths Discovery paths the shim passes back (one --hook-path each)
     */
    ShimInstaller(std::filesystem::path projectRoot,
                  std::filesystem::path executable,
                  std::vector<std::string> searchPaths = {});

    /**
     * @brief Write (or rewrite) the shim for a hook
     * @return HooksDirMissing if .git/hooks is absent, ForeignHook if a file
     *         without the sentinel is in the way, IoError / PermissionDenied
     *         on write or chmod failure
     */
    Expected<void> install(const HookDefinition& hook) const;

    /**
     * @brief Remove the shim for a hook
     * @return true if removed, false if nothing was installed, ForeignHook
     *         (file left untouched) if the file is not ours
     */
    Expected<bool> uninstall(const std::string& hookName) const;

    /// Files in .git/hooks except *.sample, sorted by name
    Expected<std::vector<InstalledHook>> installedHooks() const;

    std::filesystem::path shimPath(const std::string& hookName) const;

private:
    std::filesystem::path root;
    std::filesystem::path executable;
    std::vector<std::string> searchPaths;
};

}
