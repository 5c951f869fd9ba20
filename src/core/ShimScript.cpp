#include "core/ShimScript.hpp"

#include <fstream>
#include <sstream>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace githooker {
namespace ShimScript {

std::string shellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "'\"'\"'";
        else out += c;
    }
    out += "'";
    return out;
}

std::string render(const ShimConfig& config) {
    std::ostringstream s;
    s << "#!/bin/sh\n";
    s << Constants::SHIM_SENTINEL << "\n";
    s << "# Installed by `githooker install " << config.hookName << "`; remove with `githooker uninstall "
      << config.hookName << "`.\n";
    s << "# Hook: " << config.hookName << "\n";
    s << "GITHOOKER_PROJECT_ROOT=" << shellQuote(config.projectRoot.string()) << "\n";
    s << "GITHOOKER_BIN=" << shellQuote(config.executable.string()) << "\n";
    s << "\n";
    s << "if [ ! -x \"$GITHOOKER_BIN\" ]; then\n";
    s << "    echo \"githooker: executable not found: $GITHOOKER_BIN\" >&2\n";
    s << "    exit 1\n";
    s << "fi\n";
    s << "cd \"$GITHOOKER_PROJECT_ROOT\" || exit 1\n";
    s << "exec \"$GITHOOKER_BIN\" --project-root \"$GITHOOKER_PROJECT_ROOT\"";
    for (const auto& p : config.searchPaths) {
        s << " --hook-path " << shellQuote(p);
    }
    s << " run " << shellQuote(config.hookName) << " -- \"$@\"\n";
    return s.str();
}

bool isManaged(const std::string& content) {
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == Constants::SHIM_SENTINEL) return true;
    }
    return false;
}

bool isManagedFile(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) return false;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return isManaged(buffer.str());
}

}
}
