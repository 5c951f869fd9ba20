#include "core/HookContext.hpp"

#include <sstream>

namespace githooker {

HookContext::HookContext(std::string hookName,
                         std::vector<std::string> stdinLines,
                         std::filesystem::path projectRoot,
                         std::vector<std::string> args)
    : hookName_(std::move(hookName)),
      stdinLines_(std::move(stdinLines)),
      projectRoot_(std::move(projectRoot)),
      args_(std::move(args)) {}

HookContext HookContext::fromRawStdin(const std::string& hookName,
                                      const std::string& rawStdin,
                                      const std::filesystem::path& projectRoot,
                                      const std::vector<std::string>& args) {
    return HookContext(hookName, splitLines(rawStdin), projectRoot, args);
}

std::vector<std::string> HookContext::splitLines(const std::string& raw) {
    std::vector<std::string> lines;
    if (raw.empty()) return lines;

    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string HookContext::stdinLine(size_t index, const std::string& fallback) const {
    return index < stdinLines_.size() ? stdinLines_[index] : fallback;
}

std::string HookContext::arg(size_t index, const std::string& fallback) const {
    return index < args_.size() ? args_[index] : fallback;
}

std::string HookContext::stdinText() const {
    std::string out;
    for (const auto& line : stdinLines_) {
        out += line;
        out += '\n';
    }
    return out;
}

}
