#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InstallCommand.hpp"
#include "cli/commands/ListCommand.hpp"
#include "cli/commands/RunCommand.hpp"
#include "cli/commands/SeedCommand.hpp"
#include "cli/commands/ShowCommand.hpp"
#include "cli/commands/UninstallCommand.hpp"

namespace githooker {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerBuiltinCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("list", [] { return std::make_unique<ListCommand>(); });
    f.registerCreator("show", [] { return std::make_unique<ShowCommand>(); });
    f.registerCreator("install", [] { return std::make_unique<InstallCommand>(); });
    f.registerCreator("uninstall", [] { return std::make_unique<UninstallCommand>(); });
    f.registerCreator("run", [] { return std::make_unique<RunCommand>(); });
    f.registerCreator("seed", [] { return std::make_unique<SeedCommand>(); });
}

}
