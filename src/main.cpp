// CLI entry using Command Pattern: global options, then one subcommand.

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

using namespace githooker;

namespace fs = std::filesystem;

// The shim must exec this exact binary later, so prefer the kernel's view of it
static fs::path selfExecutable(const char* argv0) {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe;
    std::string a = argv0 ? argv0 : "";
    if (a.find('/') != std::string::npos) return fs::absolute(a, ec);
    return fs::path();
}

static bool isFlag(const std::string& token) { return token.rfind("--", 0) == 0; }

int main(int argc, char** argv) {
    registerBuiltinCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    ctx.executablePath = selfExecutable(argc > 0 ? argv[0] : nullptr);
    CommandInvoker invoker;
    auto& factory = CommandFactory::instance();

    // Global options come before the command name
    size_t i = 0;
    while (i < args.size() && isFlag(args[i])) {
        const std::string& opt = args[i];
        if (opt == "--project-root") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --project-root requires a directory\n";
                return Constants::EXIT_USAGE;
            }
            ctx.projectRoot = args[i + 1];
            i += 2;
        } else if (opt == "--hook-paths") {
            // Greedy: a directory named like a command must be written as ./<name>
            ++i;
            size_t taken = 0;
            while (i < args.size() && !isFlag(args[i]) && !factory.has(args[i])) {
                ctx.hookSearchPaths.push_back(args[i]);
                ++i;
                ++taken;
            }
            if (taken == 0) {
                std::cerr << "Error: --hook-paths requires at least one path\n";
                return Constants::EXIT_USAGE;
            }
        } else if (opt == "--hook-path") {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: --hook-path requires a directory\n";
                return Constants::EXIT_USAGE;
            }
            ctx.hookSearchPaths.push_back(args[i + 1]);
            i += 2;
        } else if (opt == "--debug") {
            ctx.debug = true;
            Logger::instance().setLevel(LogLevel::Debug);
            ++i;
        } else if (opt == "--help") {
            auto help = factory.create("help");
            return invoker.invoke(*help, ctx, {});
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            auto help = factory.create("help");
            invoker.invoke(*help, ctx, {});
            return Constants::EXIT_USAGE;
        }
    }

    if (i >= args.size()) {
        auto cmd = factory.create("help");
        invoker.invoke(*cmd, ctx, {});
        return Constants::EXIT_OK;
    }

    std::string cmdName = args[i];
    std::vector<std::string> cmdArgs(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "Unknown command: " << cmdName << "\n";
        auto help = factory.create("help");
        invoker.invoke(*help, ctx, {});
        return Constants::EXIT_USAGE;
    }
    return invoker.invoke(*cmd, ctx, cmdArgs);
}
