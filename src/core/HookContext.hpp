#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace githooker {

/**
 * @brief Inputs of one hook invocation
 *
 * Built by the runner from what Git handed to the shim: the hook's arguments
 * (e.g. the message file path for commit-msg) and its stdin (e.g. ref update
 * lines for pre-push), split into lines. Immutable after construction.
 */
class HookContext {
public:
    HookContext(std::string hookName,
                std::vector<std::string> stdinLines,
                std::filesystem::path projectRoot,
                std::vector<std::string> args = {});

    /**
     * @brief Build a context from raw stdin text
     *
     * A trailing newline does not produce an empty last line, "\r\n" line
     * endings are accepted, and empty input yields no lines.
     */
    static HookContext fromRawStdin(const std::string& hookName,
                                    const std::string& rawStdin,
                                    const std::filesystem::path& projectRoot,
                                    const std::vector<std::string>& args = {});

    static std::vector<std::string> splitLines(const std::string& raw);

    const std::string& hookName() const { return hookName_; }
    const std::vector<std::string>& stdinLines() const { return stdinLines_; }
    const std::filesystem::path& projectRoot() const { return projectRoot_; }
    const std::vector<std::string>& args() const { return args_; }

    bool hasStdin() const { return !stdinLines_.empty(); }
    std::string stdinLine(size_t index, const std::string& fallback = "") const;
    std::string arg(size_t index, const std::string& fallback = "") const;

    /// Stdin lines joined back with '\n' (with a trailing newline when non-empty)
    std::string stdinText() const;

private:
    std::string hookName_;
    std::vector<std::string> stdinLines_;
    std::filesystem::path projectRoot_;
    std::vector<std::string> args_;
};

}
