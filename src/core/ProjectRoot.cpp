#include "core/ProjectRoot.hpp"

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace githooker {

static bool hasGitDir(const fs::path& dir) {
    std::error_code ec;
    fs::path gd = dir / Constants::GIT_DIR;
    return fs::exists(gd, ec) && fs::is_directory(gd, ec);
}

Expected<fs::path> ProjectRoot::discover(const fs::path& start) {
    std::error_code ec;
    fs::path cur = fs::weakly_canonical(fs::absolute(start), ec);
    if (ec) cur = fs::absolute(start).lexically_normal();
    while (true) {
        if (hasGitDir(cur)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a git repository (no .git found above " + fs::absolute(start).string() + ")"};
        }
        cur = cur.parent_path();
    }
}

Expected<fs::path> ProjectRoot::resolve(const fs::path& explicitRoot) {
    if (explicitRoot.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec) return Error{ErrorCode::IoError, "Cannot read current directory: " + ec.message()};
        return discover(cwd);
    }
    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::absolute(explicitRoot), ec);
    if (ec) root = fs::absolute(explicitRoot).lexically_normal();
    if (!hasGitDir(root)) {
        return Error{ErrorCode::NotARepository, "Project root has no .git directory: " + root.string()};
    }
    return root;
}

}
