#include "cli/commands/UninstallCommand.hpp"

#include <ostream>

#include "core/HookDiscovery.hpp"
#include "core/ProjectRoot.hpp"
#include "core/ShimInstaller.hpp"

namespace githooker {

Expected<int> UninstallCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: githooker uninstall <hook-name>"};
    }
    const std::string& hookName = args.front();

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();

    HookDiscovery discovery(rootRes.value(), ctx.hookSearchPaths);
    auto registry = discovery.discoverWith(hookName);
    if (!registry) return registry.error();

    ShimInstaller installer(rootRes.value(), ctx.executablePath, discovery.searchPaths());
    auto removed = installer.uninstall(hookName);
    if (!removed) return removed.error();
    if (!removed.value()) {
        outStream(ctx) << "Hook '" << hookName << "' is not installed\n";
    }
    return 0;
}

}
