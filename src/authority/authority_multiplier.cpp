// File: src/authority/authority_multiplier.cpp
#include "authority/authority_multiplier.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <iostream>
#include <set>
#include <stdexcept>

namespace lexreason {

namespace {

bool InUnitRange(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

template <typename Enum>
void ValidateTable(const std::string& name,
                   const std::map<Enum, double>& table,
                   const std::vector<Enum>& keys,
                   std::vector<std::string>& errors) {
    for (Enum key : keys) {
        auto it = table.find(key);
        if (it == table.end()) {
            errors.push_back(name + " is missing '" + ToString(key) + "'");
        } else if (!InUnitRange(it->second)) {
            errors.push_back(name + "." + ToString(key) + " must be between 0.0 and 1.0");
        }
    }
}

} // namespace

// ============================================================================
// Enums
// ============================================================================

const char* ToString(Treatment treatment) {
    switch (treatment) {
        case Treatment::FOLLOWED: return "followed";
        case Treatment::CITED: return "cited";
        case Treatment::DISTINGUISHED: return "distinguished";
        case Treatment::QUESTIONED: return "questioned";
        case Treatment::CRITICIZED: return "criticized";
        case Treatment::OVERRULED: return "overruled";
        case Treatment::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

const std::vector<Treatment>& AllTreatments() {
    static const std::vector<Treatment> values = {
        Treatment::FOLLOWED, Treatment::CITED, Treatment::DISTINGUISHED,
        Treatment::QUESTIONED, Treatment::CRITICIZED, Treatment::OVERRULED,
        Treatment::UNKNOWN,
    };
    return values;
}

std::optional<Treatment> ParseTreatment(const std::string& str) {
    for (Treatment t : AllTreatments()) {
        if (str == ToString(t)) return t;
    }
    return std::nullopt;
}

const char* ToString(CourtLevel level) {
    switch (level) {
        case CourtLevel::HIGHEST: return "highest";
        case CourtLevel::INTERMEDIATE: return "intermediate";
        case CourtLevel::TRIAL: return "trial";
        case CourtLevel::ADMINISTRATIVE: return "administrative";
        default: return "unknown";
    }
}

const std::vector<CourtLevel>& AllCourtLevels() {
    static const std::vector<CourtLevel> values = {
        CourtLevel::HIGHEST, CourtLevel::INTERMEDIATE, CourtLevel::TRIAL,
        CourtLevel::ADMINISTRATIVE,
    };
    return values;
}

std::optional<CourtLevel> ParseCourtLevel(const std::string& str) {
    for (CourtLevel level : AllCourtLevels()) {
        if (str == ToString(level)) return level;
    }
    return std::nullopt;
}

const char* ToString(JurisdictionAlignment alignment) {
    switch (alignment) {
        case JurisdictionAlignment::EXACT: return "exact";
        case JurisdictionAlignment::ANCESTOR: return "ancestor";
        case JurisdictionAlignment::SIBLING: return "sibling";
        case JurisdictionAlignment::FOREIGN: return "foreign";
        default: return "unknown";
    }
}

const std::vector<JurisdictionAlignment>& AllJurisdictionAlignments() {
    static const std::vector<JurisdictionAlignment> values = {
        JurisdictionAlignment::EXACT, JurisdictionAlignment::ANCESTOR,
        JurisdictionAlignment::SIBLING, JurisdictionAlignment::FOREIGN,
    };
    return values;
}

std::optional<JurisdictionAlignment> ParseJurisdictionAlignment(const std::string& str) {
    for (JurisdictionAlignment a : AllJurisdictionAlignments()) {
        if (str == ToString(a)) return a;
    }
    return std::nullopt;
}

// ============================================================================
// Configuration
// ============================================================================

std::vector<std::string> AuthorityMultiplierCalculator::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (!std::isfinite(half_life_years) || half_life_years <= 0.0) {
        errors.push_back("recency.half_life_years must be greater than 0");
    }
    if (!InUnitRange(min_multiplier)) {
        errors.push_back("recency.min_multiplier must be between 0.0 and 1.0");
    }

    ValidateTable("treatment_modifier", treatment_modifier, AllTreatments(), errors);
    ValidateTable("jurisdiction_alignment", jurisdiction_alignment,
                  AllJurisdictionAlignments(), errors);
    ValidateTable("court_levels", court_levels, AllCourtLevels(), errors);

    for (const auto& [jurisdiction, parents] : jurisdiction_hierarchy) {
        if (jurisdiction.empty()) {
            errors.push_back("jurisdiction_hierarchy has an empty jurisdiction name");
        }
        for (const auto& parent : parents) {
            if (parent.empty()) {
                errors.push_back("jurisdiction_hierarchy." + jurisdiction + " has an empty parent");
            }
        }
    }

    return errors;
}

AuthorityMultiplierCalculator::AuthorityMultiplierCalculator()
    : AuthorityMultiplierCalculator(Config{}) {}

AuthorityMultiplierCalculator::AuthorityMultiplierCalculator(const Config& config)
    : config_(config) {
    auto errors = config_.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors);
    }
}

// ============================================================================
// Factors
// ============================================================================

double AuthorityMultiplierCalculator::TreatmentModifier(Treatment treatment) const {
    return config_.treatment_modifier.at(treatment);
}

double AuthorityMultiplierCalculator::RecencyDecay(double age_years) const {
    if (!std::isfinite(age_years) || age_years < 0.0) {
        throw std::invalid_argument("age_years must be a non-negative number");
    }
    double decay = std::exp(-std::log(2.0) * age_years / config_.half_life_years);
    return std::max(config_.min_multiplier, decay);
}

double AuthorityMultiplierCalculator::CourtLevelWeight(CourtLevel level) const {
    return config_.court_levels.at(level);
}

double AuthorityMultiplierCalculator::AlignmentFactor(JurisdictionAlignment alignment) const {
    return config_.jurisdiction_alignment.at(alignment);
}

std::vector<std::string> AuthorityMultiplierCalculator::Lineage(const std::string& jurisdiction) const {
    std::vector<std::string> lineage;
    std::set<std::string> seen;
    std::deque<std::string> frontier{jurisdiction};

    while (!frontier.empty()) {
        std::string current = frontier.front();
        frontier.pop_front();
        if (current.empty() || !seen.insert(current).second) {
            continue;
        }
        lineage.push_back(current);

        auto it = config_.jurisdiction_hierarchy.find(current);
        if (it != config_.jurisdiction_hierarchy.end()) {
            for (const auto& parent : it->second) {
                frontier.push_back(parent);
            }
        }
    }

    return lineage;
}

JurisdictionAlignment AuthorityMultiplierCalculator::Align(const std::string& source,
                                                           const std::string& target) const {
    // Unknown jurisdictions carry no alignment penalty
    if (source.empty() || target.empty() || source == target) {
        return JurisdictionAlignment::EXACT;
    }

    auto source_line = Lineage(source);
    auto target_line = Lineage(target);

    std::set<std::string> source_parents(source_line.begin() + 1, source_line.end());
    std::set<std::string> target_parents(target_line.begin() + 1, target_line.end());

    if (source_parents.count(target) > 0 || target_parents.count(source) > 0) {
        return JurisdictionAlignment::ANCESTOR;
    }
    for (const auto& parent : source_parents) {
        if (target_parents.count(parent) > 0) {
            return JurisdictionAlignment::SIBLING;
        }
    }
    return JurisdictionAlignment::FOREIGN;
}

// ============================================================================
// Multiplier
// ============================================================================

double AuthorityMultiplierCalculator::ComputeMultiplier(const CitationSignals& signals) const {
    JurisdictionAlignment alignment = Align(signals.source_jurisdiction, signals.target_jurisdiction);

    double treatment = TreatmentModifier(signals.treatment);
    double recency = RecencyDecay(signals.age_years);
    double align = AlignmentFactor(alignment);
    double level = CourtLevelWeight(signals.court_level);

    double multiplier = std::clamp(treatment * recency * align * level, 0.0, 1.0);

    LogDebug(std::string("treatment=") + ToString(signals.treatment) +
             " recency=" + std::to_string(recency) +
             " alignment=" + ToString(alignment) +
             " level=" + ToString(signals.court_level) +
             " -> " + std::to_string(multiplier));

    return multiplier;
}

double AuthorityMultiplierCalculator::ScaleWeight(double weight, const CitationSignals& signals) const {
    if (!InUnitRange(weight)) {
        throw std::invalid_argument("weight must be between 0.0 and 1.0");
    }
    return std::clamp(weight * ComputeMultiplier(signals), 0.0, 1.0);
}

Rule AuthorityMultiplierCalculator::AdjustRuleWeight(const Rule& rule,
                                                     const CitationSignals& signals) const {
    Rule adjusted = rule;
    adjusted.weight = ScaleWeight(rule.weight, signals);
    return adjusted;
}

void AuthorityMultiplierCalculator::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[AuthorityMultiplierCalculator] " << message << std::endl;
    }
}

} // namespace lexreason
