#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class SeedCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "seed"; }
    const char* description() const override { return "Copy a bundled example hook into githooks/"; }
    const char* helpNameLine() const override { return "seed -  Seed an example hook definition"; }
    const char* helpSynopsis() const override { return "githooker seed [<example>]"; }
    const char* helpDescription() const override { return "Without an argument, list the bundled example hooks. With an argument, copy that example to githooks/<example>.json. Existing files are never overwritten."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {};
    }
};

}
