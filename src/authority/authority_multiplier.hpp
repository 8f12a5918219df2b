// File: src/authority/authority_multiplier.hpp
#pragma once

#include "rules/rule.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

// Treatment: How a citing decision treated the cited authority
enum class Treatment : uint8_t {
    FOLLOWED = 0,
    CITED = 1,
    DISTINGUISHED = 2,
    QUESTIONED = 3,
    CRITICIZED = 4,
    OVERRULED = 5,
    UNKNOWN = 6,
};

const char* ToString(Treatment treatment);
std::optional<Treatment> ParseTreatment(const std::string& str);
const std::vector<Treatment>& AllTreatments();

// CourtLevel: Position of the deciding court in its hierarchy
enum class CourtLevel : uint8_t {
    HIGHEST = 0,
    INTERMEDIATE = 1,
    TRIAL = 2,
    ADMINISTRATIVE = 3,
};

const char* ToString(CourtLevel level);
std::optional<CourtLevel> ParseCourtLevel(const std::string& str);
const std::vector<CourtLevel>& AllCourtLevels();

// JurisdictionAlignment: Relation between citing and cited jurisdictions
enum class JurisdictionAlignment : uint8_t {
    EXACT = 0,      // Same jurisdiction
    ANCESTOR = 1,   // One lies in the other's parent lineage
    SIBLING = 2,    // Distinct, sharing a common parent
    FOREIGN = 3,    // Unrelated
};

const char* ToString(JurisdictionAlignment alignment);
std::optional<JurisdictionAlignment> ParseJurisdictionAlignment(const std::string& str);
const std::vector<JurisdictionAlignment>& AllJurisdictionAlignments();

/// CitationSignals: Inputs describing one cited authority
struct CitationSignals {
    Treatment treatment{Treatment::UNKNOWN};
    double age_years{0.0};
    std::string source_jurisdiction;
    std::string target_jurisdiction;
    CourtLevel court_level{CourtLevel::HIGHEST};
};

/// AuthorityMultiplierCalculator: Scales rule weights by precedent authority
///
/// multiplier = treatment_modifier[treatment]
///            * max(min_multiplier, exp(-ln2 * age / half_life_years))
///            * alignment[align(source, target)]
///            * court_levels[court_level]
/// clamped to [0, 1].
///
/// Pure and stateless after construction; knows nothing about the engine.
class AuthorityMultiplierCalculator {
public:
    struct Config {
        /// Age at which the recency factor halves
        double half_life_years{10.0};

        /// Floor of the recency factor
        double min_multiplier{0.5};

        std::map<Treatment, double> treatment_modifier{
            {Treatment::FOLLOWED, 1.0},
            {Treatment::CITED, 0.9},
            {Treatment::DISTINGUISHED, 0.7},
            {Treatment::QUESTIONED, 0.5},
            {Treatment::CRITICIZED, 0.4},
            {Treatment::OVERRULED, 0.1},
            {Treatment::UNKNOWN, 0.8},
        };

        std::map<JurisdictionAlignment, double> jurisdiction_alignment{
            {JurisdictionAlignment::EXACT, 1.0},
            {JurisdictionAlignment::ANCESTOR, 0.9},
            {JurisdictionAlignment::SIBLING, 0.85},
            {JurisdictionAlignment::FOREIGN, 0.75},
        };

        std::map<CourtLevel, double> court_levels{
            {CourtLevel::HIGHEST, 1.0},
            {CourtLevel::INTERMEDIATE, 0.9},
            {CourtLevel::TRIAL, 0.78},
            {CourtLevel::ADMINISTRATIVE, 0.7},
        };

        /// Jurisdiction -> parent jurisdictions (e.g. "US-CA" -> ["US-FED"])
        std::map<std::string, std::vector<std::string>> jurisdiction_hierarchy;

        bool debug_logging{false};

        bool IsValid() const { return GetValidationErrors().empty(); }

        /// Every table must cover every enum value with a finite value in [0,1]
        std::vector<std::string> GetValidationErrors() const;
    };

    AuthorityMultiplierCalculator();

    /// @throws ConfigError if config is invalid
    explicit AuthorityMultiplierCalculator(const Config& config);

    // ========================================================================
    // Multiplier
    // ========================================================================

    /// Combined multiplier in [0, 1]
    /// @throws std::invalid_argument if age_years is negative or not finite
    double ComputeMultiplier(const CitationSignals& signals) const;

    /// weight * multiplier, clamped to [0, 1]
    double ScaleWeight(double weight, const CitationSignals& signals) const;

    /// Copy of rule with its weight scaled by the multiplier
    Rule AdjustRuleWeight(const Rule& rule, const CitationSignals& signals) const;

    // ========================================================================
    // Factors
    // ========================================================================

    double TreatmentModifier(Treatment treatment) const;
    double RecencyDecay(double age_years) const;
    double CourtLevelWeight(CourtLevel level) const;
    double AlignmentFactor(JurisdictionAlignment alignment) const;

    /// Classify two jurisdictions using the configured hierarchy
    JurisdictionAlignment Align(const std::string& source, const std::string& target) const;

    /// [jurisdiction, parents..., grandparents...] in breadth-first order
    std::vector<std::string> Lineage(const std::string& jurisdiction) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void LogDebug(const std::string& message) const;
};

} // namespace lexreason
