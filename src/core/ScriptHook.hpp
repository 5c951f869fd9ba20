#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/HookDefinition.hpp"
#include "core/HookFile.hpp"
#include "util/CommandExecutor.hpp"

namespace githooker {

/**
 * @brief Hook backed by a definition file: runs its steps in order
 *
 * Every step runs in the project root with the hook's stdin lines on its
 * standard input and GITHOOKER_HOOK / GITHOOKER_ROOT in its environment.
 * Placeholders in step arguments:
 *   $1..$9  hook argument N (empty when absent)
 *   $@      all hook arguments, one argv entry each (whole token only)
 *   $HOOK   hook name
 *   $ROOT   project root
 *   $$      literal '$'
 *
 * The hook fails on the first failing step unless continue-on-error is set,
 * in which case all steps run and the hook still fails.
 */
class ScriptHook : public HookDefinition {
public:
    ScriptHook(HookSpec spec, std::filesystem::path source);

    /**
     * @brief Load a definition file
     * @return The hook, nullptr when the file declares no hook, or the parse error
     */
    static Expected<std::unique_ptr<ScriptHook>> fromFile(const std::filesystem::path& file);

    const std::string& name() const override { return spec.name; }
    const std::string& description() const override { return spec.description; }
    const std::filesystem::path& source() const override { return sourcePath; }
    HookResult execute(const HookContext& ctx) override;

    const HookSpec& definition() const { return spec; }

    /// Substitute placeholders in one step's argv
    static std::vector<std::string> expandArgs(const std::vector<std::string>& argv, const HookContext& ctx);

private:
    HookSpec spec;
    std::filesystem::path sourcePath;
    CommandExecutor executor;
};

}
