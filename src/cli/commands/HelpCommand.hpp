#pragma once

#include "cli/ICommand.hpp"

namespace githooker {

class HelpCommand : public ICommand {
public:
    Expected<int> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show help for commands"; }
    const char* helpNameLine() const override { return "help -  Display help information about githooker"; }
    const char* helpSynopsis() const override { return "githooker help [<command>]"; }
    const char* helpDescription() const override { return "Without arguments, lists the available commands and global options. With a command name, shows detailed help for that command."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
