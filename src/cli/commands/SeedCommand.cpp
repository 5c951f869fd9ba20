#include "cli/commands/SeedCommand.hpp"

#include <ostream>

#include "core/HookExamples.hpp"
#include "core/ProjectRoot.hpp"

namespace githooker {

Expected<int> SeedCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::ostream& out = outStream(ctx);
    if (args.empty()) {
        out << "Available example hooks:\n";
        for (const auto& ex : HookExamples::all()) {
            out << "  - " << ex.name << ": " << ex.description << "\n";
        }
        return 0;
    }
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: githooker seed [<example>]"};
    }

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();

    auto seeded = HookExamples::seed(rootRes.value(), args.front());
    if (!seeded) return seeded.error();
    out << "Successfully seeded example '" << args.front() << "' to "
        << seeded.value().lexically_relative(rootRes.value()).generic_string() << "\n";
    return 0;
}

}
