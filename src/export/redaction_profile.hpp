// File: src/export/redaction_profile.hpp
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexreason {

// RedactionAction: What happens to an exported field
enum class RedactionAction : uint8_t {
    DROP = 0,       // Remove the field
    HASH = 1,       // Replace by "sha256:<hex>" of its canonical JSON
    TRUNCATE = 2,   // Shorten strings and arrays to truncate_length
};

const char* ToString(RedactionAction action);
std::optional<RedactionAction> ParseRedactionAction(const std::string& str);

/// RedactionProfile: Named export policy
///
/// Field paths are dotted and relative to the exported document; a path
/// segment that lands on an array applies to every element
/// (e.g. "derivations.premises.entity.id").
struct RedactionProfile {
    std::string name;

    /// Export derivation records, diagnostics and trace
    bool include_derivations{false};

    size_t truncate_length{16};

    /// Facts and derivations with these labels are left out entirely
    std::set<std::string> blocked_labels;

    std::map<std::string, RedactionAction> fields;

    bool IsValid() const { return GetValidationErrors().empty(); }
    std::vector<std::string> GetValidationErrors() const;

    /// Facts only
    static RedactionProfile Default();

    /// Facts plus derivations, diagnostics and trace
    static RedactionProfile Audit();
};

/// ProfileRegistry: Profiles available to the exporter, keyed by name
///
/// Always contains the built-in "default" and "audit" profiles; registered
/// profiles with the same name replace them.
class ProfileRegistry {
public:
    ProfileRegistry();

    /// @throws ConfigError if the profile is invalid
    void Register(const RedactionProfile& profile);

    /// @throws ProfileNotFound for an unknown name
    const RedactionProfile& Get(const std::string& name) const;

    bool Has(const std::string& name) const { return profiles_.count(name) > 0; }

    std::vector<std::string> Names() const;

private:
    std::map<std::string, RedactionProfile> profiles_;
};

} // namespace lexreason
