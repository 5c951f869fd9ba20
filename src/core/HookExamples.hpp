#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace githooker {

/// A bundled hook definition that `githooker seed` can copy into a project
struct HookExample {
    std::string name;           // file stem, e.g. "pre_commit_clang_format"
    std::string description;
    std::string content;        // full definition file text (JSON)
};

namespace HookExamples {

/// Bundled examples sorted by name
const std::vector<HookExample>& all();

/// nullptr for an unknown name
const HookExample* find(const std::string& name);

/**
 * @brief Copy an example to <root>/githooks/<name>.json
 * @return Written path; UnknownExample for an unknown name, AlreadyExists if
 *         the target file is present (it is never overwritten), IoError
 */
Expected<std::filesystem::path> seed(const std::filesystem::path& root, const std::string& name);

}

}
