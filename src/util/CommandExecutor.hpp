#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace githooker {

/// Outcome of one child process
struct CommandResult {
    bool success{false};
    int exitCode{0};                    // 127 when the program could not be started, 128+N when killed by signal N
    std::string stdoutText;
    std::string stderrText;
    std::vector<std::string> command;
};

struct CommandOptions {
    std::filesystem::path cwd;          // empty = inherit
    std::string input;                  // written to the child's stdin, then closed
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
};

/**
 * @brief Runs an argument list as a child process and captures its output
 *
 * The program is looked up on PATH (execvp). The call blocks until the child
 * exits; there is no timeout. Never throws for child failures, which are
 * reported through CommandResult.
 */
class CommandExecutor {
public:
    CommandResult run(const std::vector<std::string>& argv, const CommandOptions& options = {}) const;
};

}
