#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class UninstallCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "uninstall"; }
    const char* description() const override { return "Remove a hook shim from .git/hooks"; }
    const char* helpNameLine() const override { return "uninstall -  Uninstall a hook from the repository"; }
    const char* helpSynopsis() const override { return "githooker uninstall <hook-name>"; }
    const char* helpDescription() const override { return "Remove .git/hooks/<hook-name> if it was written by githooker. Nothing happens if no hook is installed; a hook not written by githooker is never removed."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {};
    }
};

}
