#include "core/ScriptHook.hpp"

#include <sstream>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace githooker {

namespace {

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

std::string expandToken(const std::string& token, const HookContext& ctx) {
    std::string out;
    size_t i = 0;
    while (i < token.size()) {
        char c = token[i];
        if (c != '$' || i + 1 >= token.size()) {
            out += c;
            ++i;
            continue;
        }
        char next = token[i + 1];
        if (next == '$') {
            out += '$';
            i += 2;
        } else if (next >= '1' && next <= '9') {
            out += ctx.arg(static_cast<size_t>(next - '1'));
            i += 2;
        } else if (token.compare(i + 1, 4, "HOOK") == 0) {
            out += ctx.hookName();
            i += 5;
        } else if (token.compare(i + 1, 4, "ROOT") == 0) {
            out += ctx.projectRoot().string();
            i += 5;
        } else {
            out += c;
            ++i;
        }
    }
    return out;
}

void logOutput(const std::string& label, const std::string& text, bool asError) {
    if (text.empty()) return;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (asError) Logger::instance().error(label + line);
        else Logger::instance().debug(label + line);
    }
}

}

ScriptHook::ScriptHook(HookSpec s, fs::path source)
    : spec(std::move(s)), sourcePath(std::move(source)) {}

Expected<std::unique_ptr<ScriptHook>> ScriptHook::fromFile(const fs::path& file) {
    auto parsed = HookFile::load(file);
    if (!parsed) return parsed.error();
    if (!parsed.value()) return std::unique_ptr<ScriptHook>();
    return std::make_unique<ScriptHook>(std::move(*parsed.value()), file);
}

std::vector<std::string> ScriptHook::expandArgs(const std::vector<std::string>& argv, const HookContext& ctx) {
    std::vector<std::string> out;
    out.reserve(argv.size());
    for (const auto& token : argv) {
        if (token == "$@") {
            out.insert(out.end(), ctx.args().begin(), ctx.args().end());
            continue;
        }
        out.push_back(expandToken(token, ctx));
    }
    return out;
}

HookResult ScriptHook::execute(const HookContext& ctx) {
    auto& log = Logger::instance();
    const std::string prefix = "[" + spec.name + "] ";

    CommandOptions options;
    options.cwd = ctx.projectRoot();
    options.input = ctx.stdinText();
    options.env = {{"GITHOOKER_HOOK", ctx.hookName()}, {"GITHOOKER_ROOT", ctx.projectRoot().string()}};

    std::optional<std::string> firstFailure;
    for (const auto& step : spec.steps) {
        std::vector<std::string> argv = expandArgs(step.argv, ctx);
        if (argv.empty() || argv.front().empty()) {
            // "$@" alone with no arguments leaves nothing to run
            log.debug(prefix + "Skipping empty step " + std::to_string(step.index));
            continue;
        }
        const std::string cmd = joinArgs(argv);
        log.debug(prefix + "Running: " + cmd);

        CommandResult res = executor.run(argv, options);
        if (res.success) {
            logOutput(prefix, res.stdoutText, false);
            logOutput(prefix, res.stderrText, false);
            continue;
        }

        std::string reason = "Step failed: " + cmd + " (exit " + std::to_string(res.exitCode) + ")";
        if (res.exitCode == Constants::EXIT_COMMAND_NOT_FOUND) {
            reason = "Step failed: " + cmd + " (command not found or not executable)";
        }
        // The runner reports the hook's failure message; only the step output is shown here
        log.debug(prefix + reason);
        logOutput(prefix, res.stdoutText, true);
        logOutput(prefix, res.stderrText, true);
        if (!firstFailure) firstFailure = reason;
        if (!spec.continueOnError) break;
    }

    if (firstFailure) {
        return HookResult::failure(spec.failureMessage ? spec.failureMessage : firstFailure,
                                   Constants::EXIT_FAILURE_CODE);
    }
    return HookResult::ok(spec.successMessage);
}

}
