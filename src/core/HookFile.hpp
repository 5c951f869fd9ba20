#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace githooker {

/// One entry of a definition's "steps" array
struct HookStep {
    std::vector<std::string> argv;  // unexpanded, placeholders still present
    size_t index{0};                // position in "steps"
};

/// Parsed content of a hook definition file
struct HookSpec {
    std::string name;
    std::string description;
    std::vector<HookStep> steps;
    std::optional<std::string> successMessage;
    std::optional<std::string> failureMessage;
    bool continueOnError{false};
};

/**
 * @brief Reader for hook definition files (*.json)
 *
 *   // githooks/pre_commit.json
 *   {
 *     "hook": "pre-commit",
 *     "description": "Check formatting before committing",
 *     "steps": [
 *       ["clang-format", "--dry-run", "--Werror", "src/main.cpp"],
 *       ["git", "diff", "--cached", "--check"]
 *     ],
 *     "success_message": "Pre-commit checks passed!",
 *     "failure_message": null,
 *     "continue_on_error": false
 *   }
 *
 * Each step is an argv array; nothing is split or interpreted by a shell.
 * "hook" and "steps" are required, every other key is optional, unknown keys
 * are rejected. A JSON document without a "hook" key is not a hook
 * definition.
 */
namespace HookFile {

/**
 * @brief Parse definition text
 * @param text File content
 * @param sourceLabel File name used in error messages
 * @return The parsed HookSpec, std::nullopt when the document declares no
 *         hook, or MalformedDefinition with "<source>: <reason>"
 */
Expected<std::optional<HookSpec>> parse(const std::string& text, const std::string& sourceLabel);

/// Read and parse a file; unreadable files are IoError
Expected<std::optional<HookSpec>> load(const std::filesystem::path& file);

/// True if `name` can be used as a file name under .git/hooks
bool isValidHookName(const std::string& name);

}

}
