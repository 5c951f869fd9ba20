#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace githooker {

class CommandInvoker {
public:
    /// Runs the command; failures are logged and turned into exit codes
    int invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
