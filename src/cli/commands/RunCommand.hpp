#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class RunCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "run"; }
    const char* description() const override { return "Run a hook directly"; }
    const char* helpNameLine() const override { return "run -  Execute a hook without going through git"; }
    const char* helpSynopsis() const override { return "githooker run <hook-name> [--debug] [-- <hook-args>...]"; }
    const char* helpDescription() const override { return "Discover the hook, run it with this process's stdin and the given arguments, and exit with the hook's exit code. Installed shims call this command. Exits 3 when no hook has that name."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return { {"--debug", "Enable debug logging."}, {"-- <hook-args>", "Pass the remaining arguments to the hook as if git had supplied them."} };
    }
};

}
