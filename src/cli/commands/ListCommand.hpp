#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class ListCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "list"; }
    const char* description() const override { return "List hooks defined in the project"; }
    const char* helpNameLine() const override { return "list -  Show hook definitions found by discovery"; }
    const char* helpSynopsis() const override { return "githooker list"; }
    const char* helpDescription() const override { return "Scan the hook search paths (default githooks/) and the project root for hook definition files and print the hook names they declare, with descriptions and source files."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {};
    }
};

}
