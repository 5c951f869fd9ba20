#include "core/ShimInstaller.hpp"

#include <algorithm>
#include <fstream>

#include "core/Constants.hpp"
#include "core/HookFile.hpp"
#include "core/ProjectRoot.hpp"
#include "core/ShimScript.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace githooker {

ShimInstaller::ShimInstaller(fs::path projectRoot, fs::path exe, std::vector<std::string> paths)
    : root(std::move(projectRoot)), executable(std::move(exe)), searchPaths(std::move(paths)) {}

fs::path ShimInstaller::shimPath(const std::string& hookName) const {
    return ProjectRoot::hooksDir(root) / hookName;
}

Expected<void> ShimInstaller::install(const HookDefinition& hook) const {
    const std::string& name = hook.name();
    if (!HookFile::isValidHookName(name)) {
        return Error{ErrorCode::InvalidArgs, "Invalid hook name: '" + name + "'"};
    }

    fs::path hooksDir = ProjectRoot::hooksDir(root);
    std::error_code ec;
    if (!fs::is_directory(hooksDir, ec)) {
        return Error{ErrorCode::HooksDirMissing, "Hooks directory not found: " + hooksDir.string()};
    }

    fs::path target = shimPath(name);
    if (fs::exists(fs::symlink_status(target, ec))) {
        if (!fs::is_regular_file(target, ec) || !ShimScript::isManagedFile(target)) {
            return Error{ErrorCode::ForeignHook,
                         "Refusing to overwrite " + target.string() + ": not installed by githooker"};
        }
        Logger::instance().debug("Replacing existing githooker shim " + target.string());
    }

    ShimConfig config{name, root, executable, searchPaths};
    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to write hook script: " + target.string()};
        }
        out << ShimScript::render(config);
        out.flush();
        if (!out || !out.good()) {
            return Error{ErrorCode::IoError, "Failed to write hook script: " + target.string()};
        }
    }

    fs::permissions(target, static_cast<fs::perms>(Constants::MODE_SHIM), fs::perm_options::replace, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, "Failed to make hook executable: " + ec.message()};
    }

    Logger::instance().success("Installed hook: " + name);
    return {};
}

Expected<bool> ShimInstaller::uninstall(const std::string& hookName) const {
    if (!HookFile::isValidHookName(hookName)) {
        return Error{ErrorCode::InvalidArgs, "Invalid hook name: '" + hookName + "'"};
    }

    fs::path target = shimPath(hookName);
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(target, ec))) {
        Logger::instance().warn("Hook script not found: " + target.string());
        return false;
    }
    if (!fs::is_regular_file(target, ec) || !ShimScript::isManagedFile(target)) {
        return Error{ErrorCode::ForeignHook,
                     "Refusing to remove " + target.string() + ": not installed by githooker"};
    }

    fs::remove(target, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to uninstall hook: " + ec.message()};
    }
    Logger::instance().success("Uninstalled hook: " + hookName);
    return true;
}

Expected<std::vector<InstalledHook>> ShimInstaller::installedHooks() const {
    std::vector<InstalledHook> hooks;
    fs::path hooksDir = ProjectRoot::hooksDir(root);
    std::error_code ec;
    if (!fs::is_directory(hooksDir, ec)) {
        return hooks;
    }

    const std::string sample = Constants::SAMPLE_SUFFIX;
    for (auto it = fs::directory_iterator(hooksDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code fileEc;
        if (!it->is_regular_file(fileEc)) continue;
        std::string name = it->path().filename().string();
        if (name.size() >= sample.size() && name.compare(name.size() - sample.size(), sample.size(), sample) == 0) {
            continue;
        }
        hooks.push_back(InstalledHook{name, it->path(), ShimScript::isManagedFile(it->path())});
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to read hooks directory: " + ec.message()};
    }

    std::sort(hooks.begin(), hooks.end(), [](const InstalledHook& a, const InstalledHook& b) {
        return a.name < b.name;
    });
    return hooks;
}

}
