// File: include/config/reasoner_config.hpp
//
// YAML Configuration Support for the lexreason engine
// Loads engine settings, authority weight tables and redaction profiles

#ifndef LEXREASON_CONFIG_REASONER_CONFIG_HPP
#define LEXREASON_CONFIG_REASONER_CONFIG_HPP

#include "authority/authority_multiplier.hpp"
#include "engine/fixed_point_engine.hpp"
#include "export/redaction_profile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

/// Configuration structure for a reasoning session
///
/// YAML layout:
///   engine:    tmax, update_mode, num_threads, retain_snapshots,
///              record_trace, time_origin, time_step, debug_logging
///   authority: recency {half_life_years, min_multiplier},
///              treatment_modifier, jurisdiction_alignment, court_levels,
///              jurisdiction_hierarchy, debug_logging
///   export:    profiles {name: {include_derivations, truncate_length,
///                                blocked_labels, fields}}
///
/// A table that is present in the document replaces the default table as a
/// whole, so a partial table fails validation instead of being completed
/// with defaults.
struct ReasonerConfig {
    // === Engine Settings ===
    FixedPointEngine::Config engine;

    // === Authority Multiplier Settings ===
    AuthorityMultiplierCalculator::Config authority;

    // === Export Settings ===
    /// Profiles registered on top of the built-in "default" and "audit"
    std::vector<RedactionProfile> export_profiles;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return ReasonerConfig if successful, std::nullopt on error
    static std::optional<ReasonerConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return ReasonerConfig if successful, std::nullopt on error
    static std::optional<ReasonerConfig> LoadFromString(const std::string& yaml_content);

    /// Load configuration from YAML file
    /// @throws ConfigError listing every problem found
    static ReasonerConfig LoadOrThrow(const std::string& filepath);

    /// Parse configuration from YAML string
    /// @throws ConfigError listing every problem found
    static ReasonerConfig ParseOrThrow(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Built-in profiles plus export_profiles
    /// @throws ConfigError if a profile is invalid
    ProfileRegistry BuildProfileRegistry() const;

    /// Create default configuration
    static ReasonerConfig Default();
};

} // namespace lexreason

#endif // LEXREASON_CONFIG_REASONER_CONFIG_HPP
