#include "core/HookExamples.hpp"

#include <fstream>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace githooker {
namespace HookExamples {

const std::vector<HookExample>& all() {
    static const std::vector<HookExample> examples{
        {"commit_msg_not_empty",
         "Reject commit messages that contain only comments or whitespace",
         R"json({
  "hook": "commit-msg",
  "description": "Reject empty commit messages (git passes the message file as $1)",
  "steps": [
    ["grep", "-q", "-v", "-e", "^#", "-e", "^[[:space:]]*$", "$1"]
  ],
  "failure_message": "Commit message is empty. Commit aborted."
}
)json"},
        {"pre_commit_clang_format",
         "Check staged C/C++ sources with clang-format",
         R"json({
  "hook": "pre-commit",
  "description": "Check formatting of staged C/C++ files",
  "steps": [
    ["sh", "-c", "git diff --cached --name-only --diff-filter=ACM | grep -E '[.](c|cc|cpp|h|hpp)$$' | xargs -r clang-format --dry-run --Werror"]
  ],
  "success_message": "Pre-commit checks passed!",
  "failure_message": "Code is not properly formatted. Commit aborted."
}
)json"},
        {"pre_push_ctest",
         "Build and run the test suite before pushing",
         R"json({
  "hook": "pre-push",
  "description": "Build and test before pushing",
  "steps": [
    ["cmake", "--build", "build"],
    ["ctest", "--test-dir", "build", "--output-on-failure"]
  ],
  "success_message": "All checks passed!"
}
)json"},
    };
    return examples;
}

const HookExample* find(const std::string& name) {
    for (const auto& ex : all()) {
        if (ex.name == name) return &ex;
    }
    return nullptr;
}

Expected<fs::path> seed(const fs::path& root, const std::string& name) {
    const HookExample* ex = find(name);
    if (!ex) {
        std::string available;
        for (const auto& e : all()) {
            if (!available.empty()) available += ", ";
            available += e.name;
        }
        return Error{ErrorCode::UnknownExample, "Example '" + name + "' not found. Available examples: " + available};
    }

    fs::path dir = root / Constants::DEFAULT_HOOK_SEARCH_DIR;
    fs::path target = dir / (name + Constants::HOOK_FILE_EXTENSION);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        return Error{ErrorCode::AlreadyExists, "Example '" + name + "' already exists at " + target.string()};
    }
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create " + dir.string() + ": " + ec.message()};
    }

    std::ofstream out(target, std::ios::binary);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to write " + target.string()};
    }
    out << ex->content;
    out.flush();
    if (!out.good()) {
        return Error{ErrorCode::IoError, "Failed to write " + target.string()};
    }
    Logger::instance().debug("Seeded example '" + name + "' to " + target.string());
    return target;
}

}
}
