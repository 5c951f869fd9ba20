#include "cli/commands/RunCommand.hpp"

#include <iostream>
#include <iterator>
#include <string>

#include <unistd.h>

#include "core/HookDiscovery.hpp"
#include "core/HookRunner.hpp"
#include "core/ProjectRoot.hpp"
#include "util/Logger.hpp"

namespace githooker {

namespace {

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Git hooks without input inherit the terminal (or /dev/null); a terminal is never read
std::string readHookStdin(const AppContext& ctx) {
    if (ctx.input) return readAll(*ctx.input);
    if (isatty(STDIN_FILENO)) return std::string();
    return readAll(std::cin);
}

}

/**
 * @brief Execute 'githooker run <hook-name> [--debug] [-- <hook-args>...]'
 *
 * This is the entry point installed shims exec into. Everything after "--"
 * is handed to the hook untouched; other tokens after the hook name are hook
 * arguments as well, except --debug.
 */
Expected<int> RunCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "usage: githooker run <hook-name> [--debug] [-- <hook-args>...]"};
    }
    const std::string& hookName = args.front();

    std::vector<std::string> hookArgs;
    bool passthrough = false;
    for (size_t i = 1; i < args.size(); ++i) {
        if (passthrough) {
            hookArgs.push_back(args[i]);
        } else if (args[i] == "--") {
            passthrough = true;
        } else if (args[i] == "--debug") {
            Logger::instance().setLevel(LogLevel::Debug);
        } else {
            hookArgs.push_back(args[i]);
        }
    }

    auto rootRes = ProjectRoot::resolve(ctx.projectRoot);
    if (!rootRes) return rootRes.error();

    HookDiscovery discovery(rootRes.value(), ctx.hookSearchPaths);
    HookRunner runner(discovery, outStream(ctx), errStream(ctx));
    return runner.run(hookName, readHookStdin(ctx), hookArgs);
}

}
