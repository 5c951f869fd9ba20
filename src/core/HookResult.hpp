#pragma once

#include <optional>
#include <string>
#include <utility>

#include "core/Constants.hpp"

namespace githooker {

/**
 * @brief Outcome of one hook execution
 *
 * The runner turns it into the process exit code and, when a message is set,
 * prints it (stdout on success, stderr on failure).
 */
struct HookResult {
    bool success{true};
    std::optional<std::string> message;
    std::optional<int> exitCode;        // unset = derived from success

    static HookResult ok(std::optional<std::string> msg = std::nullopt) {
        return HookResult{true, std::move(msg), std::nullopt};
    }

    static HookResult failure(std::optional<std::string> msg = std::nullopt, std::optional<int> code = std::nullopt) {
        return HookResult{false, std::move(msg), code};
    }

    /**
     * @brief Exit code handed to Git
     *
     * Success is always 0 and a failure never is. The runner's own codes
     * (hook not found, discovery error) are not available to hooks: a failure
     * carrying one of them exits with the generic failure code instead.
     */
    int effectiveExitCode() const {
        if (success) return Constants::EXIT_OK;
        if (!exitCode) return Constants::EXIT_FAILURE_CODE;
        switch (*exitCode) {
            case Constants::EXIT_OK:
            case Constants::EXIT_HOOK_NOT_FOUND:
            case Constants::EXIT_DISCOVERY_ERROR:
                return Constants::EXIT_FAILURE_CODE;
            default:
                return *exitCode;
        }
    }

    explicit operator bool() const { return success; }
};

}
