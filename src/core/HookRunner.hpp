#pragma once

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "core/HookDefinition.hpp"
#include "core/HookDiscovery.hpp"

namespace githooker {

/**
 * @brief Runs one hook invocation end to end
 *
 * Discover -> resolve -> execute -> report -> exit code. Every failure below
 * this point (including exceptions thrown by a hook) becomes an exit code and
 * a message on the error stream; nothing escapes to crash the process Git
 * is waiting on.
 *
 * Exit codes: the hook's effective exit code, Constants::EXIT_HOOK_NOT_FOUND
 * for an unknown name, Constants::EXIT_DISCOVERY_ERROR when discovery fails.
 */
class HookRunner {
public:
    explicit HookRunner(const HookDiscovery& discovery,
                        std::ostream& out = std::cout,
                        std::ostream& err = std::cerr);

    int run(const std::string& hookName, const std::string& rawStdin, const std::vector<std::string>& args) const;

    /// Calls hook.execute(ctx), converting any exception into a failed result
    static HookResult executeSafely(HookDefinition& hook, const HookContext& ctx);

    /// Print the result's message to the right stream and return its exit code
    int report(const HookResult& result) const;

private:
    const HookDiscovery& discovery;
    std::ostream& out;
    std::ostream& err;
};

}
