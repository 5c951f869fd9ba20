#include "core/HookDiscovery.hpp"

#include <set>

#include "core/Constants.hpp"
#include "core/ScriptHook.hpp"
#include "util/Logger.hpp"
#include "util/PatternMatcher.hpp"

namespace fs = std::filesystem;

namespace githooker {

namespace {

const std::vector<std::string>& directoryPatterns() {
    static const std::vector<std::string> p{Constants::HOOK_FILE_PATTERN};
    return p;
}

const std::vector<std::string>& rootPatterns() {
    static const std::vector<std::string> p{Constants::ROOT_HOOK_FILE_PATTERN};
    return p;
}

std::string canonicalKey(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    return (ec ? p.lexically_normal() : c).string();
}

}

HookDiscovery::HookDiscovery(fs::path projectRoot, std::vector<std::string> searchPaths)
    : root(std::move(projectRoot)), paths(std::move(searchPaths)) {
    if (paths.empty()) {
        paths.push_back(Constants::DEFAULT_HOOK_SEARCH_DIR);
    }
}

std::vector<fs::path> HookDiscovery::searchDirectories() const {
    std::vector<fs::path> dirs;
    dirs.reserve(paths.size());
    for (const auto& p : paths) {
        fs::path sp(p);
        dirs.push_back(sp.is_absolute() ? sp.lexically_normal() : (root / sp).lexically_normal());
    }
    return dirs;
}

std::vector<fs::path> HookDiscovery::candidateFiles() const {
    std::vector<fs::path> files;
    std::set<std::string> seen;
    auto collect = [&](const std::vector<fs::path>& found) {
        for (const auto& f : found) {
            if (seen.insert(canonicalKey(f)).second) files.push_back(f);
        }
    };

    for (const auto& dir : searchDirectories()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            Logger::instance().debug("Hook search directory does not exist, skipping: " + dir.string());
            continue;
        }
        collect(PatternMatcher::matchFilesInDirectory(dir, directoryPatterns()));
    }
    collect(PatternMatcher::matchFilesInDirectory(root, rootPatterns()));
    return files;
}

Expected<HookRegistry> HookDiscovery::discover() const {
    HookRegistry registry;
    for (const auto& file : candidateFiles()) {
        auto loaded = ScriptHook::fromFile(file);
        if (!loaded) {
            return loaded.error();
        }
        if (!loaded.value()) {
            Logger::instance().debug("No hook declared in " + file.string() + ", skipping");
            continue;
        }
        Logger::instance().debug("Found hook '" + loaded.value()->name() + "' in " + file.string());
        auto added = registry.add(std::move(loaded.value()));
        if (!added) {
            return added.error();
        }
    }
    return registry;
}

Expected<HookRegistry> HookDiscovery::discoverWith(const std::string& hookName) const {
    auto registry = discover();
    if (!registry) return registry.error();
    if (!registry.value().contains(hookName)) {
        return Error{ErrorCode::HookNotFound, notFoundMessage(hookName)};
    }
    return registry;
}

std::string HookDiscovery::notFoundMessage(const std::string& hookName) const {
    std::string msg = "Hook '" + hookName + "' not found\nCould not find hooks under:";
    for (const auto& dir : searchDirectories()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            msg += "\n  - " + dir.string() + " (directory does not exist)";
            continue;
        }
        size_t n = PatternMatcher::matchFilesInDirectory(dir, directoryPatterns()).size();
        msg += "\n  - " + dir.string() +
               (n ? " (found " + std::to_string(n) + " " + Constants::HOOK_FILE_PATTERN + " files)"
                  : std::string(" (no ") + Constants::HOOK_FILE_PATTERN + " files found)");
    }
    size_t legacy = PatternMatcher::matchFilesInDirectory(root, rootPatterns()).size();
    msg += "\n  - " + root.string() +
           (legacy ? " (found " + std::to_string(legacy) + " " + Constants::ROOT_HOOK_FILE_PATTERN + " files)"
                   : std::string(" (no ") + Constants::ROOT_HOOK_FILE_PATTERN + " files found)");
    return msg;
}

}
