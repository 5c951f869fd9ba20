#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class ShowCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Show hooks installed in .git/hooks"; }
    const char* helpNameLine() const override { return "show -  Show installed git hooks"; }
    const char* helpSynopsis() const override { return "githooker show"; }
    const char* helpDescription() const override { return "List the files in .git/hooks (ignoring *.sample). Hooks written by githooker are marked (managed); anything else is marked (external)."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {};
    }
};

}
