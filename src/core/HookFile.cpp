#include "core/HookFile.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace githooker {
namespace HookFile {

namespace {

using nlohmann::json;

const char* const KNOWN_KEYS[] = {
    "hook", "description", "steps", "success_message", "failure_message", "continue_on_error"};

Error malformed(const std::string& source, const std::string& reason) {
    return Error{ErrorCode::MalformedDefinition, source + ": " + reason};
}

bool isKnownKey(const std::string& key) {
    for (const char* k : KNOWN_KEYS) {
        if (key == k) return true;
    }
    return false;
}

// Absent and null both mean "not set"; anything but a string is an error
Expected<std::optional<std::string>> optionalString(const json& doc, const char* key, const std::string& source) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return malformed(source, std::string("'") + key + "' must be a string");
    }
    return std::optional<std::string>(it->get<std::string>());
}

Expected<std::vector<HookStep>> parseSteps(const json& doc, const std::string& source) {
    auto it = doc.find("steps");
    if (it == doc.end() || !it->is_array()) {
        return malformed(source, "'steps' must be an array of commands");
    }
    if (it->empty()) {
        return malformed(source, "hook declares no steps");
    }

    std::vector<HookStep> steps;
    steps.reserve(it->size());
    for (size_t i = 0; i < it->size(); ++i) {
        const json& step = (*it)[i];
        const std::string where = "steps[" + std::to_string(i) + "]";
        if (!step.is_array() || step.empty()) {
            return malformed(source, where + " must be a non-empty array of strings");
        }
        HookStep parsed;
        parsed.index = i;
        for (const auto& arg : step) {
            if (!arg.is_string()) {
                return malformed(source, where + " must contain only strings");
            }
            parsed.argv.push_back(arg.get<std::string>());
        }
        if (parsed.argv.front().empty()) {
            return malformed(source, where + " has an empty program name");
        }
        steps.push_back(std::move(parsed));
    }
    return steps;
}

}

bool isValidHookName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (c == '/' || c == '\\' || std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Expected<std::optional<HookSpec>> parse(const std::string& text, const std::string& sourceLabel) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return malformed(sourceLabel, std::string("invalid JSON: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("hook")) {
        return std::optional<HookSpec>{};
    }

    for (const auto& item : doc.items()) {
        if (!isKnownKey(item.key())) {
            return malformed(sourceLabel, "unknown key '" + item.key() + "'");
        }
    }

    HookSpec spec;
    const json& hook = doc["hook"];
    if (!hook.is_string() || !isValidHookName(hook.get<std::string>())) {
        return malformed(sourceLabel, "invalid hook name " + hook.dump());
    }
    spec.name = hook.get<std::string>();

    auto description = optionalString(doc, "description", sourceLabel);
    if (!description) return description.error();
    spec.description = description.value().value_or("");

    auto steps = parseSteps(doc, sourceLabel);
    if (!steps) return steps.error();
    spec.steps = std::move(steps.value());

    auto success = optionalString(doc, "success_message", sourceLabel);
    if (!success) return success.error();
    spec.successMessage = success.value();

    auto failure = optionalString(doc, "failure_message", sourceLabel);
    if (!failure) return failure.error();
    spec.failureMessage = failure.value();

    auto cont = doc.find("continue_on_error");
    if (cont != doc.end()) {
        if (!cont->is_boolean()) {
            return malformed(sourceLabel, "'continue_on_error' must be true or false");
        }
        spec.continueOnError = cont->get<bool>();
    }

    return std::optional<HookSpec>(std::move(spec));
}

Expected<std::optional<HookSpec>> load(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read hook definition: " + file.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), file.string());
}

}
}
