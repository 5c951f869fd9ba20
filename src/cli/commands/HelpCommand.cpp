#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace githooker {

namespace {

void printCommandDetail(std::ostream& out, const ICommand& cmd) {
    out << "Name:\n" << cmd.helpNameLine() << "\n\n";
    out << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    out << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        out << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            out << opt << " :  " << desc << "\n\n";
        }
    }
}

}

Expected<int> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::ostream& out = outStream(ctx);
    if (!args.empty()) {
        std::string topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(out, *cmd);
            return 0;
        }
        errStream(ctx) << "Unknown help topic: " << topic << "\n\n";
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    out << "usage: githooker [--project-root <dir>] [--hook-paths <path>... | --hook-path <path>] [--debug] <command> [<args>]\n\n";
    out << "These are the githooker commands:\n\n";
    for (const auto& c : cmds) {
        out << "  " << c->name() << "\t" << c->description() << "\n";
    }
    out << "\nGlobal options:\n";
    out << "  --project-root <dir>     Use <dir> (must contain .git) instead of searching upwards\n";
    out << "  --hook-paths <path>...   Directories to search for *.json hook files (default: githooks);\n";
    out << "                           stops at the next option or command name (write ./list for a\n";
    out << "                           directory called list)\n";
    out << "  --hook-path <path>       Add one search directory; may be repeated\n";
    out << "  --debug                  Enable debug logging\n";
    return 0;
}

}
