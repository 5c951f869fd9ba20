#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/HookRegistry.hpp"
#include "util/Expected.hpp"

namespace githooker {

/**
 * @brief Finds hook definition files under a project and loads them
 *
 * Scan order:
 *   1. each search directory (default "githooks"), files matching *.json
 *   2. the project root itself, legacy files matching *_hook.json
 *
 * Relative search paths are resolved against the project root. Missing
 * directories are skipped. JSON files without a "hook" key are ignored. Two
 * definitions with the same name, wherever they live, fail discovery.
 */
class HookDiscovery {
public:
    /// Empty searchPaths selects the default ("githooks")
    HookDiscovery(std::filesystem::path projectRoot, std::vector<std::string> searchPaths = {});

    /**
     * @brief Build a fresh registry
     * @return Registry, or DuplicateHook / MalformedDefinition / IoError
     */
    Expected<HookRegistry> discover() const;

    /**
     * @brief discover(), then require that hookName is registered
     * @return Registry containing hookName, or HookNotFound carrying notFoundMessage()
     */
    Expected<HookRegistry> discoverWith(const std::string& hookName) const;

    /// Candidate files in scan order, each listed once
    std::vector<std::filesystem::path> candidateFiles() const;

    /// Absolute search directories in configured order
    std::vector<std::filesystem::path> searchDirectories() const;

    /// Multi-line "hook not found" diagnostic listing every searched location
    std::string notFoundMessage(const std::string& hookName) const;

    const std::filesystem::path& projectRoot() const { return root; }
    const std::vector<std::string>& searchPaths() const { return paths; }

private:
    std::filesystem::path root;
    std::vector<std::string> paths;
};

}
