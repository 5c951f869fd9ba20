#pragma once

#include <cstdint>

/**
 * @brief Constants shared by discovery, the installer and the runner
 *
 * Centralizes file names, patterns and exit codes so the shim generator and
 * the runner agree on them.
 */
namespace githooker {

namespace Constants {
    // Repository layout
    constexpr const char* GIT_DIR = ".git";
    constexpr const char* HOOKS_DIR = "hooks";             // .git/hooks
    constexpr const char* SAMPLE_SUFFIX = ".sample";       // Git's bundled *.sample hooks

    // Discovery
    constexpr const char* DEFAULT_HOOK_SEARCH_DIR = "githooks";
    constexpr const char* HOOK_FILE_PATTERN = "*.json";         // inside search directories
    constexpr const char* ROOT_HOOK_FILE_PATTERN = "*_hook.json"; // legacy files at the project root
    constexpr const char* HOOK_FILE_EXTENSION = ".json";

    // Shim
    constexpr const char* SHIM_SENTINEL = "# githooker-managed-hook";
    constexpr uint32_t MODE_SHIM = 0755;                   // -rwxr-xr-x

    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILURE_CODE = 1;                   // hook ran and failed, or command failed
    constexpr int EXIT_USAGE = 2;                          // bad command line
    constexpr int EXIT_HOOK_NOT_FOUND = 3;                 // reserved: no definition for the name
    constexpr int EXIT_DISCOVERY_ERROR = 4;                // duplicate or malformed definitions
    constexpr int EXIT_COMMAND_NOT_FOUND = 127;            // step program could not be started
}
}
