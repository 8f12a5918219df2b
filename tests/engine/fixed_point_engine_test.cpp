// File: tests/engine/fixed_point_engine_test.cpp
#include "engine/fixed_point_engine.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <random>

namespace lexreason {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

FactKey NodeKey(const std::string& id, const std::string& label) {
    return FactKey{EntityRef::Node(id), label};
}

Rule SelfRule(const std::string& id, const std::string& head,
              std::vector<std::pair<std::string, double>> clauses,
              AggregationKind aggregation = AggregationKind::LEGAL_CONSERVATIVE_MIN) {
    Rule rule;
    rule.id = id;
    rule.head = RuleHead{head, TargetKind::NODE};
    rule.aggregation = aggregation;
    for (const auto& [label, threshold] : clauses) {
        rule.body.push_back(Clause{PatternKind::SELF, label, "", threshold, ""});
    }
    return rule;
}

std::shared_ptr<TypedGraph> CreateClaimGraph() {
    auto graph = std::make_shared<TypedGraph>();
    graph->AddNode("c1", "claim");
    graph->AddNode("c2", "claim");
    graph->AddNode("c3", "claim");
    graph->AddNode("p1", "precedent");
    graph->AddNode("p2", "precedent");
    graph->AddEdge("c1", "p1", "cites");
    graph->AddEdge("c1", "p2", "cites");
    graph->AddEdge("c2", "p1", "cites");
    return graph;
}

/// Facts and rules with chained derivations and competing rules
struct Scenario {
    std::shared_ptr<TypedGraph> graph;
    std::vector<InitialFact> facts;
    std::vector<Rule> rules;
};

Scenario CreateChainedScenario() {
    Scenario s;
    s.graph = CreateClaimGraph();
    s.facts = {
        {NodeKey("c1", "evidence"), Interval(0.7, 0.9)},
        {NodeKey("c1", "causation"), Interval(0.6, 0.95)},
        {NodeKey("c2", "evidence"), Interval(0.55, 0.8)},
        {NodeKey("c2", "causation"), Interval(0.8, 0.9)},
        {NodeKey("c3", "evidence"), Interval(0.2, 0.4)},
        {NodeKey("p1", "support"), Interval(0.7, 0.8)},
        {NodeKey("p2", "support"), Interval(0.6, 0.9)},
    };

    s.rules.push_back(SelfRule("breach_min", "breach", {{"evidence", 0.5}, {"causation", 0.5}}));
    s.rules.push_back(SelfRule("breach_civil", "breach", {{"evidence", 0.5}},
                               AggregationKind::LEGAL_BURDEN_CIVIL_051));
    s.rules.push_back(SelfRule("liable", "liable", {{"breach", 0.55}}));

    Rule supported;
    supported.id = "supported";
    supported.head = RuleHead{"supported", TargetKind::NODE};
    supported.aggregation = AggregationKind::AVERAGE;
    supported.weight = 0.9;
    supported.body.push_back(Clause{PatternKind::OUT_NEIGHBOR, "support", "cites", 0.5, ""});
    s.rules.push_back(supported);

    s.rules.push_back(SelfRule("strong_case", "strong_case", {{"liable", 0.5}, {"supported", 0.5}}));
    return s;
}

FixedPointEngine::Config DefaultConfig() {
    FixedPointEngine::Config config;
    config.tmax = 50;
    return config;
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(FixedPointEngineConfigTest, DefaultConfigIsValid) {
    FixedPointEngine::Config config;
    EXPECT_TRUE(config.IsValid());
    EXPECT_EQ(100u, config.tmax);
    EXPECT_EQ(UpdateMode::INTERSECT, config.update_mode);
}

TEST(FixedPointEngineConfigTest, InvalidConfigThrows) {
    FixedPointEngine::Config config;
    config.tmax = 0;
    config.num_threads = 0;
    config.time_step = 0.0;
    EXPECT_EQ(3u, config.GetValidationErrors().size());
    EXPECT_THROW(FixedPointEngine engine(config), ConfigError);

    FixedPointEngine engine;
    EXPECT_THROW(engine.SetConfig(config), ConfigError);
}

TEST(FixedPointEngineConfigTest, ParseUpdateMode) {
    EXPECT_EQ(UpdateMode::STRICT, ParseUpdateMode("strict"));
    EXPECT_EQ(UpdateMode::INTERSECT, ParseUpdateMode(ToString(UpdateMode::INTERSECT)));
    EXPECT_THROW(ParseUpdateMode("loose"), ConfigError);
}

TEST(FixedPointEngineConfigTest, LegalTime) {
    FixedPointEngine::Config config;
    config.time_origin = 2000.0;
    config.time_step = 0.5;
    FixedPointEngine engine(config);
    EXPECT_DOUBLE_EQ(2000.0, engine.LegalTime(0));
    EXPECT_DOUBLE_EQ(2002.0, engine.LegalTime(4));
}

// ============================================================================
// Input Validation Tests
// ============================================================================

TEST(FixedPointEngineTest, ZeroTmaxIsConfigError) {
    Scenario s = CreateChainedScenario();
    FixedPointEngine engine;
    EXPECT_THROW(engine.Run(s.graph, s.facts, s.rules, 0), ConfigError);
}

TEST(FixedPointEngineTest, NullGraphIsConfigError) {
    FixedPointEngine engine;
    EXPECT_THROW(engine.Run(nullptr, {}, {}), ConfigError);
}

TEST(FixedPointEngineTest, InitialFactOnUnknownEntityIsConfigError) {
    Scenario s = CreateChainedScenario();
    s.facts.push_back({NodeKey("ghost", "evidence"), Interval()});
    FixedPointEngine engine;
    EXPECT_THROW(engine.Run(s.graph, s.facts, s.rules), ConfigError);
}

TEST(FixedPointEngineTest, DuplicateInitialFactIsConfigError) {
    Scenario s = CreateChainedScenario();
    s.facts.push_back(s.facts.front());
    EXPECT_THROW(FixedPointEngine::ValidateInputs(*s.graph, s.facts, s.rules), ConfigError);
}

TEST(FixedPointEngineTest, DuplicateRuleIdIsConfigError) {
    Scenario s = CreateChainedScenario();
    s.rules.push_back(s.rules.front());
    EXPECT_THROW(FixedPointEngine().Run(s.graph, s.facts, s.rules), ConfigError);
}

TEST(FixedPointEngineTest, MalformedRuleIsConfigErrorBeforeEvaluation) {
    Scenario s = CreateChainedScenario();
    Rule bad = SelfRule("bad", "x", {{"evidence", 1.5}});
    s.rules.push_back(bad);
    try {
        FixedPointEngine().Run(s.graph, s.facts, s.rules);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        ASSERT_EQ(1u, e.errors().size());
        EXPECT_NE(e.errors()[0].find("threshold"), std::string::npos);
    }
}

// ============================================================================
// Firing Scenarios
// ============================================================================

TEST(FixedPointEngineTest, ThresholdGatesFiring) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "breach"), Interval(0.55, 0.55)},
        {NodeKey("c2", "breach"), Interval(0.62, 0.70)},
    };
    std::vector<Rule> rules{SelfRule("established", "established", {{"breach", 0.6}},
                                     AggregationKind::LEGAL_BURDEN_CIVIL_051)};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    EXPECT_TRUE(result.Converged());
    EXPECT_FALSE(result.interpretation.Get(NodeKey("c1", "established")).has_value());
    auto established = result.interpretation.Get(NodeKey("c2", "established"));
    ASSERT_TRUE(established.has_value());
    EXPECT_EQ(Interval(0.62, 0.70), *established);
}

TEST(FixedPointEngineTest, ConservativeMinTakesWeakestPremise) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "evidence"), Interval(0.9, 0.95)},
        {NodeKey("c1", "causation"), Interval(0.4, 0.6)},
    };
    std::vector<Rule> rules{SelfRule("liability", "liable", {{"evidence", 0.0}, {"causation", 0.0}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    ASSERT_TRUE(result.interpretation.Get(NodeKey("c1", "liable")).has_value());
    EXPECT_EQ(Interval(0.4, 0.6), *result.interpretation.Get(NodeKey("c1", "liable")));
}

TEST(FixedPointEngineTest, ConvergesWhenNothingChanges) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};
    std::vector<Rule> rules{SelfRule("established", "established", {{"breach", 0.6}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    // Step 0 derives the head; step 1 changes nothing
    EXPECT_EQ(ConvergenceStatus::CONVERGED, result.status);
    EXPECT_EQ(2u, result.steps);
    EXPECT_EQ(2u, result.interpretation.timestep());
}

TEST(FixedPointEngineTest, NoRulesConvergesAfterOneStep) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};

    RunResult result = FixedPointEngine().Run(graph, facts, {});
    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(1u, result.steps);
    EXPECT_EQ(1u, result.interpretation.size());
}

TEST(FixedPointEngineTest, ExhaustsStepBudget) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "reading_a"), Interval(0.2, 1.0)},
        {NodeKey("c1", "reading_b"), Interval(0.2, 1.0)},
    };
    // Mutual support: each step shrinks both upper bounds toward 0.2 without reaching it
    std::vector<Rule> rules{
        SelfRule("a_from_b", "reading_a", {{"reading_b", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
        SelfRule("b_from_a", "reading_b", {{"reading_a", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
    };

    RunResult result = FixedPointEngine().Run(graph, facts, rules, 5);

    EXPECT_EQ(ConvergenceStatus::EXHAUSTED, result.status);
    EXPECT_EQ(5u, result.steps);
    auto reading = result.interpretation.Get(NodeKey("c1", "reading_a"));
    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(0.2, reading->lower());
    EXPECT_NEAR(0.2 + 0.8 * std::pow(0.95, 5), reading->upper(), 1e-12);
}

TEST(FixedPointEngineTest, HistorySummarizesEachStep) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};
    std::vector<Rule> rules{SelfRule("established", "established", {{"breach", 0.6}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    ASSERT_EQ(2u, result.history.size());
    EXPECT_EQ(1u, result.history[0].timestep);
    EXPECT_EQ(1u, result.history[0].changed);
    // A new fact is measured against [0, 1]
    EXPECT_DOUBLE_EQ(0.7, result.history[0].max_bound_delta);
    EXPECT_EQ(2u, result.history[1].timestep);
    EXPECT_EQ(0u, result.history[1].changed);
    EXPECT_DOUBLE_EQ(0.0, result.history[1].max_bound_delta);
}

std::vector<Rule> MutualSupportRules() {
    return {
        SelfRule("a_from_b", "reading_a", {{"reading_b", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
        SelfRule("b_from_a", "reading_b", {{"reading_a", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
    };
}

std::vector<InitialFact> OpenReadings() {
    return {
        {NodeKey("c1", "reading_a"), Interval(0.2, 1.0)},
        {NodeKey("c1", "reading_b"), Interval(0.2, 1.0)},
    };
}

TEST(FixedPointEngineTest, BoundThresholdStopsEarly) {
    FixedPointEngine::Config config = DefaultConfig();
    config.convergence_bound_threshold = 0.037;

    RunResult result = FixedPointEngine(config).Run(CreateClaimGraph(), OpenReadings(),
                                                    MutualSupportRules());

    // Upper bounds move by 0.04, 0.038, 0.0361
    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(3u, result.steps);
    ASSERT_EQ(3u, result.history.size());
    EXPECT_NEAR(0.04, result.history[0].max_bound_delta, 1e-12);
    EXPECT_NEAR(0.0361, result.history[2].max_bound_delta, 1e-12);
    EXPECT_EQ(2u, result.history[2].changed);
}

TEST(FixedPointEngineTest, ChangeCountThresholdStopsEarly) {
    FixedPointEngine::Config config = DefaultConfig();
    config.convergence_threshold = 2;

    RunResult result = FixedPointEngine(config).Run(CreateClaimGraph(), OpenReadings(),
                                                    MutualSupportRules());
    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(1u, result.steps);

    config.convergence_threshold = 1;
    result = FixedPointEngine(config).Run(CreateClaimGraph(), OpenReadings(),
                                          MutualSupportRules(), 5);
    EXPECT_EQ(ConvergenceStatus::EXHAUSTED, result.status);
}

TEST(FixedPointEngineTest, NegativeBoundThresholdIsConfigError) {
    FixedPointEngine::Config config;
    config.convergence_bound_threshold = -0.01;
    EXPECT_FALSE(config.IsValid());
    EXPECT_THROW(FixedPointEngine engine(config), ConfigError);
}

TEST(FixedPointEngineTest, DelayedRuleTakesEffectLater) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};
    std::vector<Rule> rules{SelfRule("established", "established", {{"breach", 0.6}})};
    rules[0].delay = 2;

    FixedPointEngine::Config config = DefaultConfig();
    config.retain_snapshots = true;
    RunResult result = FixedPointEngine(config).Run(graph, facts, rules);

    // Nothing changes at steps 0 and 1, but the pending effect holds convergence off
    ASSERT_TRUE(result.Converged());
    EXPECT_EQ(4u, result.steps);
    ASSERT_EQ(5u, result.snapshots.size());
    EXPECT_FALSE(result.snapshots[1].Get(NodeKey("c1", "established")).has_value());
    EXPECT_FALSE(result.snapshots[2].Get(NodeKey("c1", "established")).has_value());
    ASSERT_TRUE(result.snapshots[3].Get(NodeKey("c1", "established")).has_value());
    EXPECT_EQ(Interval(0.7, 0.8), *result.snapshots[3].Get(NodeKey("c1", "established")));
    EXPECT_EQ(0u, result.history[0].changed);
    EXPECT_EQ(0u, result.history[1].changed);
    EXPECT_EQ(1u, result.history[2].changed);

    auto records = result.log->GetRecordsFor(NodeKey("c1", "established"));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(3u, result.log->Get(records[0]).timestep);
}

TEST(FixedPointEngineTest, DelayBeyondBudgetNeverApplies) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};
    std::vector<Rule> rules{SelfRule("established", "established", {{"breach", 0.6}})};
    rules[0].delay = 10;

    RunResult result = FixedPointEngine().Run(graph, facts, rules, 5);
    EXPECT_FALSE(result.interpretation.Get(NodeKey("c1", "established")).has_value());
}

TEST(FixedPointEngineTest, StaticInitialFactIsNeverUpdated) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "h"), Interval(0.4, 0.6), true},
        {NodeKey("c1", "e"), Interval(0.5, 0.9)},
    };
    std::vector<Rule> rules{SelfRule("r", "h", {{"e", 0.0}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(Interval(0.4, 0.6), *result.interpretation.Get(NodeKey("c1", "h")));
    EXPECT_EQ(1u, result.log->GetRecordsFor(NodeKey("c1", "h")).size());
    EXPECT_TRUE(result.log->GetFailures().empty());
}

TEST(FixedPointEngineTest, StaticRuleFreezesHead) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "a"), Interval(0.2, 0.9)},
        {NodeKey("c1", "c"), Interval(0.5, 0.6)},
    };
    std::vector<Rule> rules{
        SelfRule("freeze", "h", {{"a", 0.0}}),
        SelfRule("narrow_a", "a", {{"c", 0.0}}),
    };

    // Without the flag h follows a down to [0.5, 0.6]
    RunResult plain = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);
    EXPECT_EQ(Interval(0.5, 0.6), *plain.interpretation.Get(NodeKey("c1", "h")));

    rules[0].set_static = true;
    RunResult frozen = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);
    EXPECT_TRUE(frozen.Converged());
    EXPECT_EQ(Interval(0.5, 0.6), *frozen.interpretation.Get(NodeKey("c1", "a")));
    EXPECT_EQ(Interval(0.2, 0.9), *frozen.interpretation.Get(NodeKey("c1", "h")));
    EXPECT_EQ(1u, frozen.log->GetRecordsFor(NodeKey("c1", "h")).size());
}

TEST(FixedPointEngineTest, ChainedDerivations) {
    Scenario s = CreateChainedScenario();
    RunResult result = FixedPointEngine(DefaultConfig()).Run(s.graph, s.facts, s.rules);

    ASSERT_TRUE(result.Converged());
    EXPECT_TRUE(result.interpretation.Get(NodeKey("c1", "breach")).has_value());
    EXPECT_TRUE(result.interpretation.Get(NodeKey("c1", "liable")).has_value());
    EXPECT_TRUE(result.interpretation.Get(NodeKey("c1", "strong_case")).has_value());
    EXPECT_FALSE(result.interpretation.Get(NodeKey("c3", "breach")).has_value());
}

TEST(FixedPointEngineTest, RuleWeightScalesProposal) {
    Scenario s = CreateChainedScenario();
    RunResult result = FixedPointEngine(DefaultConfig()).Run(s.graph, s.facts, s.rules);

    // c2 cites only p1: average [0.7, 0.8] scaled by 0.9 toward 0
    auto supported = result.interpretation.Get(NodeKey("c2", "supported"));
    ASSERT_TRUE(supported.has_value());
    EXPECT_NEAR(0.63, supported->lower(), 1e-12);
    EXPECT_NEAR(0.72, supported->upper(), 1e-12);
}

// ============================================================================
// Conflict Resolution Tests
// ============================================================================

TEST(FixedPointEngineTest, MostConservativeProposalWins) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "a"), Interval(0.2, 0.9)},
        {NodeKey("c1", "b"), Interval(0.5, 0.6)},
    };
    std::vector<Rule> rules{
        SelfRule("wide", "h", {{"a", 0.0}}),
        SelfRule("narrow", "h", {{"b", 0.0}}),
    };

    FixedPointEngine::Config config = DefaultConfig();
    config.record_trace = true;
    RunResult result = FixedPointEngine(config).Run(graph, facts, rules);

    EXPECT_EQ(Interval(0.5, 0.6), *result.interpretation.Get(NodeKey("c1", "h")));

    auto explanation = result.Explain(NodeKey("c1", "h"));
    ASSERT_FALSE(explanation.empty());
    EXPECT_EQ("narrow", explanation.back().rule_id);

    // Both rules fired at t=0; only the winner was applied
    size_t applied = 0;
    size_t fired_at_zero = 0;
    for (const auto& event : result.log->GetTrace()) {
        if (event.timestep == 0) {
            ++fired_at_zero;
            if (event.applied) ++applied;
        }
    }
    EXPECT_EQ(2u, fired_at_zero);
    EXPECT_EQ(1u, applied);
}

TEST(FixedPointEngineTest, IdenticalProposalsAttributedToSmallestRuleId) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "a"), Interval(0.5, 0.6)}};
    std::vector<Rule> rules{
        SelfRule("zeta", "h", {{"a", 0.0}}),
        SelfRule("alpha", "h", {{"a", 0.0}}, AggregationKind::MINIMUM),
    };

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);
    auto records = result.log->GetRecordsFor(NodeKey("c1", "h"));
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("alpha", result.log->Get(records[0]).rule_id);
}

TEST(FixedPointEngineTest, IntersectNarrowsExistingFact) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "h"), Interval(0.4, 0.6)},
        {NodeKey("c1", "e"), Interval(0.5, 0.9)},
    };
    std::vector<Rule> rules{SelfRule("r", "h", {{"e", 0.0}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);
    EXPECT_EQ(Interval(0.5, 0.6), *result.interpretation.Get(NodeKey("c1", "h")));

    auto records = result.log->GetRecordsFor(NodeKey("c1", "h"));
    ASSERT_EQ(2u, records.size());
    const DerivationRecord& derived = result.log->Get(records[1]);
    ASSERT_TRUE(derived.prior.has_value());
    EXPECT_EQ(Interval(0.4, 0.6), *derived.prior);
    EXPECT_EQ(records[0], *derived.prior_record);
}

TEST(FixedPointEngineTest, DisjointProposalIsRejected) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "h"), Interval(0.1, 0.3)},
        {NodeKey("c1", "e"), Interval(0.7, 0.9)},
    };
    std::vector<Rule> rules{SelfRule("r", "h", {{"e", 0.0}})};

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(1u, result.steps);
    EXPECT_EQ(Interval(0.1, 0.3), *result.interpretation.Get(NodeKey("c1", "h")));
    EXPECT_EQ(1u, result.log->GetRecordsFor(NodeKey("c1", "h")).size());

    const auto& failures = result.log->GetFailures();
    ASSERT_EQ(1u, failures.size());
    EXPECT_EQ("r", failures[0].rule_id);
    EXPECT_EQ(EntityRef::Node("c1"), failures[0].target);
    EXPECT_EQ(0u, failures[0].timestep);
    EXPECT_NE(std::string::npos, failures[0].reason.find("disjoint"));
}

TEST(FixedPointEngineTest, DisjointProposalDoesNotBlockCompetitor) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "h"), Interval(0.4, 0.6)},
        {NodeKey("c1", "far"), Interval(0.8, 0.81)},
        {NodeKey("c1", "near"), Interval(0.3, 0.5)},
    };
    // The disjoint proposal is the narrowest, yet the other one applies
    std::vector<Rule> rules{
        SelfRule("from_far", "h", {{"far", 0.0}}),
        SelfRule("from_near", "h", {{"near", 0.0}}),
    };

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(Interval(0.4, 0.5), *result.interpretation.Get(NodeKey("c1", "h")));
    ASSERT_FALSE(result.log->GetFailures().empty());
    EXPECT_EQ("from_far", result.log->GetFailures()[0].rule_id);
}

TEST(FixedPointEngineTest, WeightedMutualSupportStopsAtDisjointProposal) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "a"), Interval(0.5, 0.6)},
        {NodeKey("c1", "b"), Interval(0.5, 0.6)},
    };
    std::vector<Rule> rules{
        SelfRule("a_from_b", "a", {{"b", 0.0}}),
        SelfRule("b_from_a", "b", {{"a", 0.0}}),
    };
    rules[0].weight = 0.9;
    rules[1].weight = 0.9;

    RunResult result;
    ASSERT_NO_THROW(result = FixedPointEngine().Run(graph, facts, rules, 5));

    // Step 0 proposes [0.45, 0.54]; step 1 proposes [0.45, 0.486], below 0.5
    EXPECT_TRUE(result.Converged());
    EXPECT_EQ(2u, result.steps);
    auto a = result.interpretation.Get(NodeKey("c1", "a"));
    ASSERT_TRUE(a.has_value());
    EXPECT_DOUBLE_EQ(0.5, a->lower());
    EXPECT_NEAR(0.54, a->upper(), 1e-12);

    const auto& failures = result.log->GetFailures();
    ASSERT_EQ(2u, failures.size());
    std::vector<std::string> rejected{failures[0].rule_id, failures[1].rule_id};
    std::sort(rejected.begin(), rejected.end());
    EXPECT_EQ("a_from_b", rejected[0]);
    EXPECT_EQ("b_from_a", rejected[1]);
    EXPECT_EQ(1u, failures[0].timestep);
}

TEST(FixedPointEngineTest, WeightedCycleExhaustsBeforeRejection) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "reading_a"), Interval(0.2, 1.0)},
        {NodeKey("c1", "reading_b"), Interval(0.2, 1.0)},
    };
    std::vector<Rule> rules{
        SelfRule("a_from_b", "reading_a", {{"reading_b", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
        SelfRule("b_from_a", "reading_b", {{"reading_a", 0.0}}, AggregationKind::TEXTUALISM_ALPHA),
    };
    rules[0].weight = 0.9;
    rules[1].weight = 0.9;

    RunResult short_run;
    ASSERT_NO_THROW(short_run = FixedPointEngine().Run(graph, facts, rules, 5));
    EXPECT_EQ(ConvergenceStatus::EXHAUSTED, short_run.status);
    EXPECT_EQ(5u, short_run.steps);
    EXPECT_TRUE(short_run.log->GetFailures().empty());
    EXPECT_NEAR(0.49061894611500007,
                short_run.interpretation.Get(NodeKey("c1", "reading_a"))->upper(), 1e-12);

    // The upper bound sinks toward 0.062 and the proposal eventually misses 0.2
    RunResult long_run = FixedPointEngine().Run(graph, facts, rules, 50);
    EXPECT_TRUE(long_run.Converged());
    EXPECT_EQ(13u, long_run.steps);
    EXPECT_EQ(2u, long_run.log->GetFailures().size());
    auto reading = long_run.interpretation.Get(NodeKey("c1", "reading_a"));
    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(0.2, reading->lower());
    EXPECT_NEAR(0.20521004328571854, reading->upper(), 1e-9);
}

TEST(FixedPointEngineTest, StrictModeRejectsNonNarrowingProposal) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "h"), Interval(0.4, 0.6)},
        {NodeKey("c1", "e"), Interval(0.5, 0.9)},
    };
    std::vector<Rule> rules{SelfRule("r", "h", {{"e", 0.0}})};

    FixedPointEngine::Config config = DefaultConfig();
    config.update_mode = UpdateMode::STRICT;

    try {
        FixedPointEngine(config).Run(graph, facts, rules);
        FAIL() << "Expected InvariantViolation";
    } catch (const InvariantViolation& e) {
        EXPECT_EQ(NodeKey("c1", "h"), e.key());
        EXPECT_EQ(1u, e.timestep());
    }
}

TEST(FixedPointEngineTest, SupersedeReplacesInterval) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("c1", "good_law"), Interval(0.8, 1.0)},
        {NodeKey("c1", "overruled"), Interval::Point(1.0)},
    };
    Rule overrule;
    overrule.id = "overrule";
    overrule.head = RuleHead{"good_law", TargetKind::NODE};
    overrule.aggregation = AggregationKind::LENITY_ALPHA;
    overrule.weight = 0.1;
    overrule.supersede = true;
    overrule.body.push_back(Clause{PatternKind::SELF, "overruled", "", 0.9, ""});

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, {overrule});

    ASSERT_TRUE(result.Converged());
    auto good_law = result.interpretation.Get(NodeKey("c1", "good_law"));
    ASSERT_TRUE(good_law.has_value());
    EXPECT_NEAR(0.095, good_law->lower(), 1e-12);
    EXPECT_NEAR(0.1, good_law->upper(), 1e-12);

    auto records = result.log->GetRecordsFor(NodeKey("c1", "good_law"));
    ASSERT_EQ(2u, records.size());
    EXPECT_TRUE(result.log->Get(records[1]).supersede);
}

// ============================================================================
// Rule Preconditions
// ============================================================================

TEST(FixedPointEngineTest, ValidTimeWindowGatesRule) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("c1", "breach"), Interval(0.7, 0.8)}};

    Rule in_force = SelfRule("in_force", "established", {{"breach", 0.0}});
    in_force.valid_time = TimeWindow{2010.0, 2020.0};
    Rule repealed = SelfRule("repealed", "remedy", {{"breach", 0.0}});
    repealed.valid_time = TimeWindow{1990.0, 2000.0};

    FixedPointEngine::Config config = DefaultConfig();
    config.time_origin = 2015.0;
    RunResult result = FixedPointEngine(config).Run(graph, facts, {in_force, repealed});

    EXPECT_TRUE(result.interpretation.Get(NodeKey("c1", "established")).has_value());
    EXPECT_FALSE(result.interpretation.Get(NodeKey("c1", "remedy")).has_value());
}

TEST(FixedPointEngineTest, AggregationInputErrorIsRecordedNotFatal) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{
        {NodeKey("p1", "support"), Interval(0.7, 0.8)},
        {NodeKey("c1", "breach"), Interval(0.7, 0.8)},
    };

    Rule weighted;
    weighted.id = "weighted";
    weighted.head = RuleHead{"supported", TargetKind::NODE};
    weighted.aggregation = AggregationKind::PRECEDENT_WEIGHTED;
    weighted.body.push_back(Clause{PatternKind::OUT_NEIGHBOR, "support", "cites", 0.0, "precedent_weight"});

    std::vector<Rule> rules{weighted, SelfRule("established", "established", {{"breach", 0.0}})};
    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, rules);

    EXPECT_FALSE(result.interpretation.Get(NodeKey("c1", "supported")).has_value());
    EXPECT_TRUE(result.interpretation.Get(NodeKey("c1", "established")).has_value());

    ASSERT_FALSE(result.log->GetFailures().empty());
    const FiringFailure& failure = result.log->GetFailures().front();
    EXPECT_EQ("weighted", failure.rule_id);
    EXPECT_EQ(EntityRef::Node("c1"), failure.target);
}

TEST(FixedPointEngineTest, EdgeHeadsDerivedFromEndpoints) {
    auto graph = CreateClaimGraph();
    std::vector<InitialFact> facts{{NodeKey("p1", "good_law"), Interval(0.9, 1.0)}};

    Rule binding;
    binding.id = "binding";
    binding.head = RuleHead{"binding", TargetKind::EDGE};
    binding.target_type = "cites";
    binding.body.push_back(Clause{PatternKind::TARGET, "good_law", "", 0.5, ""});

    RunResult result = FixedPointEngine(DefaultConfig()).Run(graph, facts, {binding});

    EXPECT_TRUE(result.interpretation.Get(EntityRef::Edge("c1", "p1", "cites"), "binding").has_value());
    EXPECT_TRUE(result.interpretation.Get(EntityRef::Edge("c2", "p1", "cites"), "binding").has_value());
    EXPECT_FALSE(result.interpretation.Get(EntityRef::Edge("c1", "p2", "cites"), "binding").has_value());
}

// ============================================================================
// Determinism and Monotonicity
// ============================================================================

TEST(FixedPointEngineTest, RepeatedRunsAreIdentical) {
    Scenario s = CreateChainedScenario();
    FixedPointEngine engine(DefaultConfig());

    RunResult first = engine.Run(s.graph, s.facts, s.rules);
    RunResult second = engine.Run(s.graph, s.facts, s.rules);

    EXPECT_TRUE(first.interpretation.SameFacts(second.interpretation));
    EXPECT_EQ(first.steps, second.steps);
    ASSERT_EQ(first.log->size(), second.log->size());
    for (size_t i = 0; i < first.log->size(); ++i) {
        EXPECT_EQ(first.log->Get(i).head, second.log->Get(i).head);
        EXPECT_EQ(first.log->Get(i).interval, second.log->Get(i).interval);
    }
}

TEST(FixedPointEngineTest, RuleOrderDoesNotMatter) {
    Scenario s = CreateChainedScenario();
    FixedPointEngine engine(DefaultConfig());
    RunResult baseline = engine.Run(s.graph, s.facts, s.rules);

    std::mt19937 rng(42);
    for (int round = 0; round < 5; ++round) {
        std::vector<Rule> shuffled = s.rules;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        std::vector<InitialFact> facts = s.facts;
        std::shuffle(facts.begin(), facts.end(), rng);

        RunResult result = engine.Run(s.graph, facts, shuffled);
        EXPECT_TRUE(baseline.interpretation.SameFacts(result.interpretation));
        EXPECT_EQ(baseline.steps, result.steps);
        EXPECT_EQ(baseline.log->size(), result.log->size());
    }
}

TEST(FixedPointEngineTest, ThreadCountDoesNotMatter) {
    Scenario s = CreateChainedScenario();
    for (int i = 0; i < 6; ++i) {
        s.rules.push_back(SelfRule("extra_" + std::to_string(i), "extra",
                                   {{"evidence", 0.1 * i}},
                                   i % 2 == 0 ? AggregationKind::AVERAGE : AggregationKind::MINIMUM));
    }

    FixedPointEngine::Config serial = DefaultConfig();
    FixedPointEngine::Config parallel = DefaultConfig();
    parallel.num_threads = 4;
    serial.record_trace = parallel.record_trace = true;

    RunResult a = FixedPointEngine(serial).Run(s.graph, s.facts, s.rules);
    RunResult b = FixedPointEngine(parallel).Run(s.graph, s.facts, s.rules);

    EXPECT_TRUE(a.interpretation.SameFacts(b.interpretation));
    ASSERT_EQ(a.log->size(), b.log->size());
    for (size_t i = 0; i < a.log->size(); ++i) {
        EXPECT_EQ(a.log->Get(i).rule_id, b.log->Get(i).rule_id);
    }
    ASSERT_EQ(a.log->GetTrace().size(), b.log->GetTrace().size());
    for (size_t i = 0; i < a.log->GetTrace().size(); ++i) {
        EXPECT_EQ(a.log->GetTrace()[i].rule_id, b.log->GetTrace()[i].rule_id);
    }
}

TEST(FixedPointEngineTest, IntervalsOnlyNarrowBetweenSnapshots) {
    Scenario s = CreateChainedScenario();
    FixedPointEngine::Config config = DefaultConfig();
    config.retain_snapshots = true;

    RunResult result = FixedPointEngine(config).Run(s.graph, s.facts, s.rules);
    ASSERT_EQ(result.steps + 1, result.snapshots.size());

    for (size_t t = 0; t + 1 < result.snapshots.size(); ++t) {
        const auto& before = result.snapshots[t];
        const auto& after = result.snapshots[t + 1];
        EXPECT_EQ(t, before.timestep());
        for (const auto& [key, interval] : before.facts()) {
            auto next = after.Get(key);
            ASSERT_TRUE(next.has_value()) << key.ToString();
            EXPECT_TRUE(interval.Contains(*next)) << key.ToString() << " at t=" << t;
        }
    }
}

TEST(FixedPointEngineTest, RerunFromFixedPointChangesNothing) {
    Scenario s = CreateChainedScenario();
    FixedPointEngine engine(DefaultConfig());

    RunResult first = engine.Run(s.graph, s.facts, s.rules);
    ASSERT_TRUE(first.Converged());

    RunResult second = engine.Run(s.graph, first.interpretation.ToInitialFacts(), s.rules);
    EXPECT_TRUE(second.Converged());
    EXPECT_EQ(1u, second.steps);
    EXPECT_TRUE(first.interpretation.SameFacts(second.interpretation));
}

TEST(FixedPointEngineTest, ExplainReachesInitialFacts) {
    Scenario s = CreateChainedScenario();
    RunResult result = FixedPointEngine(DefaultConfig()).Run(s.graph, s.facts, s.rules);

    auto explanation = result.Explain(NodeKey("c1", "strong_case"));
    ASSERT_FALSE(explanation.empty());

    bool reaches_evidence = false;
    bool reaches_support = false;
    for (const auto& record : explanation) {
        if (record.IsInitial() && record.head == NodeKey("c1", "evidence")) reaches_evidence = true;
        if (record.IsInitial() && record.head.label == "support") reaches_support = true;
    }
    EXPECT_TRUE(reaches_evidence);
    EXPECT_TRUE(reaches_support);
    EXPECT_EQ("strong_case", explanation.back().rule_id);
}

} // namespace
} // namespace lexreason
