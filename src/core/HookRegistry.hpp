#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/HookDefinition.hpp"
#include "util/Expected.hpp"

namespace githooker {

/**
 * @brief Name -> definition map built by one discovery pass
 *
 * Owns its definitions. Names are unique; adding a second definition for a
 * name is a DuplicateHook error naming both sources and leaves the registry
 * unchanged.
 */
class HookRegistry {
public:
    Expected<void> add(std::unique_ptr<HookDefinition> hook);

    /// nullptr when no definition has that name
    HookDefinition* find(const std::string& name) const;
    bool contains(const std::string& name) const { return hooks.count(name) != 0; }

    /// Sorted hook names
    std::vector<std::string> names() const;
    size_t size() const { return hooks.size(); }
    bool empty() const { return hooks.empty(); }

    const std::map<std::string, std::unique_ptr<HookDefinition>>& all() const { return hooks; }

private:
    std::map<std::string, std::unique_ptr<HookDefinition>> hooks;
};

}
