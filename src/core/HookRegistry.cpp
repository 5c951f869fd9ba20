#include "core/HookRegistry.hpp"

namespace githooker {

Expected<void> HookRegistry::add(std::unique_ptr<HookDefinition> hook) {
    if (!hook) {
        return Error{ErrorCode::InternalError, "Cannot register a null hook"};
    }
    auto it = hooks.find(hook->name());
    if (it != hooks.end()) {
        return Error{ErrorCode::DuplicateHook,
                     "Duplicate hook '" + hook->name() + "' defined in " + it->second->source().string() +
                     " and " + hook->source().string()};
    }
    const std::string key = hook->name();
    hooks.emplace(key, std::move(hook));
    return {};
}

HookDefinition* HookRegistry::find(const std::string& name) const {
    auto it = hooks.find(name);
    return it == hooks.end() ? nullptr : it->second.get();
}

std::vector<std::string> HookRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(hooks.size());
    for (const auto& kv : hooks) out.push_back(kv.first);
    return out;
}

}
