#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class InstallCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "install"; }
    const char* description() const override { return "Install a hook shim into .git/hooks"; }
    const char* helpNameLine() const override { return "install -  Install a hook into the repository"; }
    const char* helpSynopsis() const override { return "githooker install <hook-name>"; }
    const char* helpDescription() const override { return "Write an executable shim to .git/hooks/<hook-name> that runs the hook through githooker. An existing shim written by githooker is replaced; any other file is left alone and the install fails."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {};
    }
};

}
