// File: src/export/redaction_profile.cpp
#include "export/redaction_profile.hpp"
#include "core/errors.hpp"

namespace lexreason {

const char* ToString(RedactionAction action) {
    switch (action) {
        case RedactionAction::DROP: return "drop";
        case RedactionAction::HASH: return "hash";
        case RedactionAction::TRUNCATE: return "truncate";
        default: return "unknown";
    }
}

std::optional<RedactionAction> ParseRedactionAction(const std::string& str) {
    if (str == "drop") return RedactionAction::DROP;
    if (str == "hash") return RedactionAction::HASH;
    if (str == "truncate") return RedactionAction::TRUNCATE;
    return std::nullopt;
}

std::vector<std::string> RedactionProfile::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (name.empty()) {
        errors.push_back("profile name must not be empty");
    }
    if (truncate_length == 0) {
        errors.push_back("profile '" + name + "': truncate_length must be greater than 0");
    }
    for (const auto& [path, action] : fields) {
        if (path.empty() || path.front() == '.' || path.back() == '.' ||
            path.find("..") != std::string::npos) {
            errors.push_back("profile '" + name + "': malformed field path '" + path + "'");
        }
    }

    return errors;
}

RedactionProfile RedactionProfile::Default() {
    RedactionProfile profile;
    profile.name = "default";
    profile.include_derivations = false;
    return profile;
}

RedactionProfile RedactionProfile::Audit() {
    RedactionProfile profile;
    profile.name = "audit";
    profile.include_derivations = true;
    return profile;
}

ProfileRegistry::ProfileRegistry() {
    Register(RedactionProfile::Default());
    Register(RedactionProfile::Audit());
}

void ProfileRegistry::Register(const RedactionProfile& profile) {
    auto errors = profile.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors);
    }
    profiles_[profile.name] = profile;
}

const RedactionProfile& ProfileRegistry::Get(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        throw ProfileNotFound(name);
    }
    return it->second;
}

std::vector<std::string> ProfileRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& [name, profile] : profiles_) {
        names.push_back(name);
    }
    return names;
}

} // namespace lexreason
