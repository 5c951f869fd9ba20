#include "cli/commands/InstallCommand.hpp"

#include "core/HookDiscovery.hpp"
#include "core/ProjectRoot.hpp"
#include "core/ShimInstaller.hpp"

namespace githooker {

/**
 * @brief Execute 'githooker install <hook-name>'
 *
 * The hook must be discoverable; the shim records the project root, the
 * githooker binary and the search paths in effect so that it runs the same
 * definition when git calls it from any directory.
 */
Expected<int> InstallCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: githooker install <hook-name>"};
    }
    const std::string& hookName = args.front();

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();

    HookDiscovery discovery(rootRes.value(), ctx.hookSearchPaths);
    auto registry = discovery.discoverWith(hookName);
    if (!registry) return registry.error();

    if (ctx.executablePath.empty()) {
        return Error{ErrorCode::InternalError, "Cannot determine the path of the githooker executable"};
    }

    ShimInstaller installer(rootRes.value(), ctx.executablePath, discovery.searchPaths());
    auto res = installer.install(*registry.value().find(hookName));
    if (!res) return res.error();
    return 0;
}

}
