#include "cli/CommandInvoker.hpp"

#include <iostream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace githooker {

std::ostream& outStream(const AppContext& ctx) { return ctx.out ? *ctx.out : std::cout; }
std::ostream& errStream(const AppContext& ctx) { return ctx.err ? *ctx.err : std::cerr; }

int exitCodeFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return Constants::EXIT_OK;
        case ErrorCode::InvalidArgs:
            return Constants::EXIT_USAGE;
        case ErrorCode::HookNotFound:
            return Constants::EXIT_HOOK_NOT_FOUND;
        case ErrorCode::DuplicateHook:
        case ErrorCode::MalformedDefinition:
            return Constants::EXIT_DISCOVERY_ERROR;
        default:
            return Constants::EXIT_FAILURE_CODE;
    }
}

int CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx, args);
    if (!res) {
        Logger::instance().error(std::string(cmd.name()) + ": " + res.error().message);
        return exitCodeFor(res.error().code);
    }
    return res.value();
}

}
