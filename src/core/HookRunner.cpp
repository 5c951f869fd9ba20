#include "core/HookRunner.hpp"

#include <exception>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace githooker {

HookRunner::HookRunner(const HookDiscovery& d, std::ostream& o, std::ostream& e)
    : discovery(d), out(o), err(e) {}

int HookRunner::run(const std::string& hookName, const std::string& rawStdin, const std::vector<std::string>& args) const {
    auto& log = Logger::instance();

    log.debug("Discovering hooks under " + discovery.projectRoot().string());
    auto registry = discovery.discover();
    if (!registry) {
        err << "Error: " << registry.error().message << "\n";
        return isDiscoveryError(registry.error().code) ? Constants::EXIT_DISCOVERY_ERROR
                                                       : Constants::EXIT_FAILURE_CODE;
    }

    HookDefinition* hook = registry.value().find(hookName);
    if (!hook) {
        err << "Error: " << discovery.notFoundMessage(hookName) << "\n";
        return Constants::EXIT_HOOK_NOT_FOUND;
    }
    log.debug("Resolved '" + hookName + "' to " + hook->source().string());

    HookContext ctx = HookContext::fromRawStdin(hookName, rawStdin, discovery.projectRoot(), args);
    log.debug("Executing '" + hookName + "' with " + std::to_string(ctx.stdinLines().size()) +
              " stdin line(s) and " + std::to_string(args.size()) + " argument(s)");

    HookResult result = executeSafely(*hook, ctx);
    int code = report(result);
    log.debug("Hook '" + hookName + "' finished with exit code " + std::to_string(code));
    return code;
}

HookResult HookRunner::executeSafely(HookDefinition& hook, const HookContext& ctx) {
    try {
        return hook.execute(ctx);
    } catch (const std::exception& e) {
        Logger::instance().debug(std::string("Exception escaped hook execute: ") + e.what());
        return HookResult::failure("Unexpected error in hook '" + ctx.hookName() + "': " + e.what());
    } catch (...) {
        return HookResult::failure("Unexpected error in hook '" + ctx.hookName() + "': unknown exception");
    }
}

int HookRunner::report(const HookResult& result) const {
    if (result.message && !result.message->empty()) {
        if (result.success) {
            out << *result.message << "\n";
        } else {
            err << *result.message << "\n";
        }
    }
    out.flush();
    err.flush();
    return result.effectiveExitCode();
}

}
