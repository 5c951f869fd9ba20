#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace githooker {

/// Global options and process plumbing shared by all commands
struct AppContext {
    std::filesystem::path projectRoot;        // --project-root; empty = discover from cwd
    std::vector<std::string> hookSearchPaths; // --hook-paths / --hook-path; empty = default
    std::filesystem::path executablePath;     // baked into installed shims
    bool debug{false};
    std::istream* input{nullptr};             // hook stdin; nullptr = std::cin unless it is a terminal
    std::ostream* out{nullptr};               // nullptr = std::cout
    std::ostream* err{nullptr};               // nullptr = std::cerr
};

class ICommand {
public:
    virtual ~ICommand() = default;
    /// Returns the process exit code, or an Error the invoker reports
    virtual Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    // Detailed help getters
    virtual const char* helpNameLine() const = 0;      // "<cmd> - <one line>"
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    virtual const char* helpDescription() const = 0;   // long description
    virtual std::vector<std::pair<std::string, std::string>> helpOptions() const = 0; // flag -> description
};

/// Streams of a context with the std defaults filled in
std::ostream& outStream(const AppContext& ctx);
std::ostream& errStream(const AppContext& ctx);

/// Exit code for a failed command
int exitCodeFor(ErrorCode code);

}
