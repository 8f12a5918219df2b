// File: src/export/interpretation_exporter.hpp
#pragma once

#include "engine/fixed_point_engine.hpp"
#include "engine/interpretation.hpp"
#include "export/redaction_profile.hpp"
#include <json/json.h>
#include <string>

namespace lexreason {

/// InterpretationExporter: Serializes interpretations under a redaction profile
///
/// Document layout (JSON, object keys sorted):
///   profile, timestep, [status, steps,]
///   facts:        [{entity, label, lower, upper}]
///   derivations:  [{id, rule_id, head, timestep, interval, prior, premises, supersede}]
///   diagnostics:  [{rule_id, target, timestep, reason}]
///   trace:        [{timestep, rule_id, head, proposed, applied}]
/// derivations, diagnostics and trace are present only when the profile
/// includes derivations. Blocked labels are removed before field actions run.
class InterpretationExporter {
public:
    InterpretationExporter() = default;
    explicit InterpretationExporter(ProfileRegistry profiles) : profiles_(std::move(profiles)) {}

    /// Serialized document (two-space indented JSON)
    /// @throws ProfileNotFound for an unknown profile; nothing is produced
    std::string Export(const Interpretation& interpretation, const std::string& profile_name) const;

    /// Same as Export, with run status and step count
    std::string Export(const RunResult& result, const std::string& profile_name) const;

    /// One compact JSON fact per line
    /// @throws ProfileNotFound for an unknown profile
    std::string ExportFactsJsonl(const Interpretation& interpretation,
                                 const std::string& profile_name) const;

    /// Redacted document as a JSON value
    /// @throws ProfileNotFound for an unknown profile
    Json::Value BuildDocument(const Interpretation& interpretation,
                                 const std::string& profile_name) const;

    /// "sha256:<hex>" of a value's compact JSON
    /// @throws std::runtime_error if the digest cannot be computed
    static std::string ContentHash(const Json::Value& value);

    const ProfileRegistry& GetProfiles() const { return profiles_; }
    ProfileRegistry& GetProfiles() { return profiles_; }

private:
    ProfileRegistry profiles_;

    static std::string Compact(const Json::Value& value);

    static void ApplyFieldActions(Json::Value& document, const RedactionProfile& profile);
};

} // namespace lexreason
