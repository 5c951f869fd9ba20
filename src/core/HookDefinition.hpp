#pragma once

#include <filesystem>
#include <string>

#include "core/HookContext.hpp"
#include "core/HookResult.hpp"

namespace githooker {

/**
 * @brief A named, executable hook implementation
 *
 * Discovery produces ScriptHook instances from definition files; other
 * variants can be added to a HookRegistry directly. execute() may throw, the
 * runner converts any escaping exception into a failed HookResult.
 */
class HookDefinition {
public:
    virtual ~HookDefinition() = default;

    /// Git hook name this definition answers to (e.g. "pre-commit")
    virtual const std::string& name() const = 0;

    /// One-line human description, may be empty
    virtual const std::string& description() const = 0;

    /// Where the definition came from, used in duplicate and list output
    virtual const std::filesystem::path& source() const = 0;

    virtual HookResult execute(const HookContext& ctx) = 0;
};

}
