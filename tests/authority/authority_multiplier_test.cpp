// File: tests/authority/authority_multiplier_test.cpp
#include "authority/authority_multiplier.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

namespace lexreason {
namespace {

AuthorityMultiplierCalculator::Config CreateHierarchyConfig() {
    AuthorityMultiplierCalculator::Config config;
    config.jurisdiction_hierarchy = {
        {"US-CA", {"US-9CIR"}},
        {"US-OR", {"US-9CIR"}},
        {"US-9CIR", {"US-FED"}},
        {"US-NY", {"US-2CIR"}},
        {"US-2CIR", {"US-FED"}},
    };
    return config;
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(AuthorityMultiplierConfigTest, DefaultConfigIsValid) {
    AuthorityMultiplierCalculator::Config config;
    EXPECT_TRUE(config.IsValid());
    EXPECT_DOUBLE_EQ(10.0, config.half_life_years);
    EXPECT_DOUBLE_EQ(0.5, config.min_multiplier);
}

TEST(AuthorityMultiplierConfigTest, MissingTableEntryIsInvalid) {
    AuthorityMultiplierCalculator::Config config;
    config.court_levels.erase(CourtLevel::TRIAL);

    auto errors = config.GetValidationErrors();
    ASSERT_EQ(1u, errors.size());
    EXPECT_NE(errors[0].find("trial"), std::string::npos);
    EXPECT_THROW(AuthorityMultiplierCalculator calculator(config), ConfigError);
}

TEST(AuthorityMultiplierConfigTest, OutOfRangeValuesAreInvalid) {
    AuthorityMultiplierCalculator::Config config;
    config.half_life_years = 0.0;
    config.min_multiplier = 1.5;
    config.treatment_modifier[Treatment::CITED] = -0.1;
    config.jurisdiction_alignment[JurisdictionAlignment::SIBLING] = NAN;

    EXPECT_EQ(4u, config.GetValidationErrors().size());
}

TEST(AuthorityMultiplierConfigTest, EmptyHierarchyNamesAreInvalid) {
    AuthorityMultiplierCalculator::Config config;
    config.jurisdiction_hierarchy[""] = {"US-FED"};
    config.jurisdiction_hierarchy["US-CA"] = {""};
    EXPECT_EQ(2u, config.GetValidationErrors().size());
}

// ============================================================================
// Factor Tests
// ============================================================================

TEST(AuthorityMultiplierTest, RecencyHalvesEveryHalfLife) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_DOUBLE_EQ(1.0, calculator.RecencyDecay(0.0));
    EXPECT_NEAR(std::pow(2.0, -0.1), calculator.RecencyDecay(1.0), 1e-12);
    EXPECT_NEAR(0.5, calculator.RecencyDecay(10.0), 1e-12);
}

TEST(AuthorityMultiplierTest, RecencyIsFloored) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_DOUBLE_EQ(0.5, calculator.RecencyDecay(20.0));
    EXPECT_DOUBLE_EQ(0.5, calculator.RecencyDecay(500.0));
}

TEST(AuthorityMultiplierTest, RecencyRejectsBadAge) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_THROW(calculator.RecencyDecay(-1.0), std::invalid_argument);
    EXPECT_THROW(calculator.RecencyDecay(INFINITY), std::invalid_argument);
}

TEST(AuthorityMultiplierTest, TableLookups) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_DOUBLE_EQ(0.1, calculator.TreatmentModifier(Treatment::OVERRULED));
    EXPECT_DOUBLE_EQ(0.78, calculator.CourtLevelWeight(CourtLevel::TRIAL));
    EXPECT_DOUBLE_EQ(0.75, calculator.AlignmentFactor(JurisdictionAlignment::FOREIGN));
}

// ============================================================================
// Jurisdiction Tests
// ============================================================================

TEST(AuthorityMultiplierTest, LineageIsBreadthFirst) {
    AuthorityMultiplierCalculator calculator(CreateHierarchyConfig());
    auto lineage = calculator.Lineage("US-CA");
    ASSERT_EQ(3u, lineage.size());
    EXPECT_EQ("US-CA", lineage[0]);
    EXPECT_EQ("US-9CIR", lineage[1]);
    EXPECT_EQ("US-FED", lineage[2]);

    EXPECT_EQ(1u, calculator.Lineage("UK").size());
}

TEST(AuthorityMultiplierTest, LineageToleratesCycles) {
    AuthorityMultiplierCalculator::Config config;
    config.jurisdiction_hierarchy = {{"A", {"B"}}, {"B", {"A"}}};
    AuthorityMultiplierCalculator calculator(config);
    EXPECT_EQ(2u, calculator.Lineage("A").size());
}

TEST(AuthorityMultiplierTest, AlignClassifiesJurisdictions) {
    AuthorityMultiplierCalculator calculator(CreateHierarchyConfig());

    EXPECT_EQ(JurisdictionAlignment::EXACT, calculator.Align("US-CA", "US-CA"));
    EXPECT_EQ(JurisdictionAlignment::ANCESTOR, calculator.Align("US-CA", "US-FED"));
    EXPECT_EQ(JurisdictionAlignment::ANCESTOR, calculator.Align("US-9CIR", "US-OR"));
    EXPECT_EQ(JurisdictionAlignment::SIBLING, calculator.Align("US-CA", "US-OR"));
    // Common grandparent
    EXPECT_EQ(JurisdictionAlignment::SIBLING, calculator.Align("US-CA", "US-NY"));
    EXPECT_EQ(JurisdictionAlignment::FOREIGN, calculator.Align("US-CA", "UK"));
}

TEST(AuthorityMultiplierTest, UnknownJurisdictionIsExact) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_EQ(JurisdictionAlignment::EXACT, calculator.Align("", "US-CA"));
    EXPECT_EQ(JurisdictionAlignment::EXACT, calculator.Align("US-CA", ""));
}

// ============================================================================
// Multiplier Tests
// ============================================================================

TEST(AuthorityMultiplierTest, WeakOldForeignAuthority) {
    AuthorityMultiplierCalculator calculator;
    CitationSignals signals;
    signals.treatment = Treatment::OVERRULED;
    signals.age_years = 20.0;
    signals.source_jurisdiction = "US-CA";
    signals.target_jurisdiction = "UK";
    signals.court_level = CourtLevel::TRIAL;

    // 0.1 * 0.5 * 0.75 * 0.78
    EXPECT_NEAR(0.02925, calculator.ComputeMultiplier(signals), 1e-12);
}

TEST(AuthorityMultiplierTest, StrongRecentBindingAuthority) {
    AuthorityMultiplierCalculator calculator;
    CitationSignals signals;
    signals.treatment = Treatment::FOLLOWED;
    signals.age_years = 1.0;
    signals.source_jurisdiction = "US-CA";
    signals.target_jurisdiction = "US-CA";
    signals.court_level = CourtLevel::HIGHEST;

    EXPECT_NEAR(std::pow(2.0, -0.1), calculator.ComputeMultiplier(signals), 1e-12);
}

TEST(AuthorityMultiplierTest, MultiplierStaysInUnitRange) {
    AuthorityMultiplierCalculator calculator(CreateHierarchyConfig());
    for (Treatment treatment : AllTreatments()) {
        for (CourtLevel level : AllCourtLevels()) {
            CitationSignals signals;
            signals.treatment = treatment;
            signals.court_level = level;
            signals.age_years = 3.0;
            signals.source_jurisdiction = "US-CA";
            signals.target_jurisdiction = "US-NY";
            double m = calculator.ComputeMultiplier(signals);
            EXPECT_GE(m, 0.0);
            EXPECT_LE(m, 1.0);
        }
    }
}

TEST(AuthorityMultiplierTest, AdjustRuleWeightScalesCopy) {
    AuthorityMultiplierCalculator calculator;
    Rule rule;
    rule.id = "follows_precedent";
    rule.head = RuleHead{"supported", TargetKind::NODE};
    rule.weight = 0.8;
    rule.body.push_back(Clause{PatternKind::SELF, "support", "", 0.5, ""});

    CitationSignals signals;
    signals.treatment = Treatment::DISTINGUISHED;

    Rule adjusted = calculator.AdjustRuleWeight(rule, signals);
    EXPECT_NEAR(0.8 * 0.7, adjusted.weight, 1e-12);
    EXPECT_DOUBLE_EQ(0.8, rule.weight);
    EXPECT_EQ(rule.id, adjusted.id);
    EXPECT_TRUE(adjusted.IsValid());
}

TEST(AuthorityMultiplierTest, ScaleWeightRejectsOutOfRangeWeight) {
    AuthorityMultiplierCalculator calculator;
    EXPECT_THROW(calculator.ScaleWeight(1.2, CitationSignals{}), std::invalid_argument);
}

TEST(AuthorityMultiplierTest, EnumNamesRoundTrip) {
    for (Treatment t : AllTreatments()) {
        EXPECT_EQ(t, ParseTreatment(ToString(t)));
    }
    EXPECT_EQ(CourtLevel::ADMINISTRATIVE, ParseCourtLevel("administrative"));
    EXPECT_EQ(JurisdictionAlignment::SIBLING, ParseJurisdictionAlignment("sibling"));
    EXPECT_FALSE(ParseTreatment("affirmed").has_value());
}

} // namespace
} // namespace lexreason
