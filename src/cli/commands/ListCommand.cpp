#include "cli/commands/ListCommand.hpp"

#include <ostream>

#include "core/HookDiscovery.hpp"
#include "core/ProjectRoot.hpp"

namespace githooker {

namespace fs = std::filesystem;

Expected<int> ListCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        return Error{ErrorCode::InvalidArgs, "list takes no arguments"};
    }

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();
    const fs::path& root = rootRes.value();

    HookDiscovery discovery(root, ctx.hookSearchPaths);
    auto registry = discovery.discover();
    if (!registry) return registry.error();

    std::ostream& out = outStream(ctx);
    if (registry.value().empty()) {
        out << "No hooks found\n";
        return 0;
    }

    out << "Available hooks:\n";
    for (const auto& [name, hook] : registry.value().all()) {
        out << "  - " << name;
        if (!hook->description().empty()) {
            out << ": " << hook->description();
        }
        out << " (" << hook->source().lexically_relative(root).generic_string() << ")\n";
    }
    return 0;
}

}
