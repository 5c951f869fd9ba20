#include "cli/commands/ShowCommand.hpp"

#include <ostream>

#include "core/ProjectRoot.hpp"
#include "core/ShimInstaller.hpp"

namespace githooker {

namespace fs = std::filesystem;

Expected<int> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "show takes no arguments"};
    }

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();
    const fs::path& root = rootRes.value();

    std::ostream& out = outStream(ctx);
    std::error_code ec;
    if (!fs::is_directory(ProjectRoot::hooksDir(root), ec)) {
        out << "No hooks directory found\n";
        return 0;
    }

    ShimInstaller installer(root, ctx.executablePath, ctx.hookSearchPaths);
    auto installed = installer.installedHooks();
    if (!installed) return installed.error();
    if (installed.value().empty()) {
        out << "No hooks installed\n";
        return 0;
    }

    out << "Installed hooks:\n";
    for (const auto& hook : installed.value()) {
        out << "  - " << hook.name << (hook.managed ? " (managed)" : " (external)") << "\n";
    }
    return 0;
}

}
