// File: examples/legal_claim_example.cpp
//
// Full pipeline example: configuration, authority weighting, export and archive.
//
// Usage: legal_claim_example [config.yaml] [archive.db]

#include "authority/authority_multiplier.hpp"
#include "config/reasoner_config.hpp"
#include "core/errors.hpp"
#include "export/interpretation_exporter.hpp"
#include "graph/graph_loader.hpp"
#include "storage/interpretation_archive.hpp"
#include <iostream>

using namespace lexreason;

namespace {

GraphSpec BuildCase() {
    GraphSpec spec;
    spec.nodes.push_back(NodeSpec{"acme-v-widgetco", "claim", {
        {"contract_formed", AttributeValue(true)},
        {"nonperformance", AttributeValue(std::make_pair(0.65, 0.85))},
        {"damages", AttributeValue(0.7)},
        {"settlement_memo", AttributeValue(std::string("yes"))},
    }});
    spec.nodes.push_back(NodeSpec{"hadley-v-baxendale", "precedent", {
        {"support", AttributeValue(std::make_pair(0.75, 0.9))},
        {"jurisdiction", AttributeValue(std::string("UK"))},
    }});
    spec.nodes.push_back(NodeSpec{"jacob-youngs-v-kent", "precedent", {
        {"support", AttributeValue(std::make_pair(0.55, 0.7))},
    }});
    spec.edges.push_back(EdgeSpec{"acme-v-widgetco", "hadley-v-baxendale", "cites", {
        {"precedent_weight", AttributeValue(0.5)},
    }});
    spec.edges.push_back(EdgeSpec{"acme-v-widgetco", "jacob-youngs-v-kent", "cites", {
        {"precedent_weight", AttributeValue(0.8)},
    }});
    return spec;
}

std::vector<Rule> BuildRules() {
    Rule breach;
    breach.id = "breach_of_contract";
    breach.head = RuleHead{"breach", TargetKind::NODE};
    breach.target_type = "claim";
    breach.aggregation = AggregationKind::LEGAL_BURDEN_CIVIL_051;
    breach.body.push_back(Clause{PatternKind::SELF, "contract_formed", "", 0.5, ""});
    breach.body.push_back(Clause{PatternKind::SELF, "nonperformance", "", 0.5, ""});

    Rule authority;
    authority.id = "precedent_support";
    authority.head = RuleHead{"precedent_support", TargetKind::NODE};
    authority.target_type = "claim";
    authority.aggregation = AggregationKind::PRECEDENT_WEIGHTED;
    authority.body.push_back(Clause{PatternKind::OUT_NEIGHBOR, "support", "cites", 0.5,
                                    "precedent_weight"});

    Rule remedy;
    remedy.id = "expectation_damages";
    remedy.head = RuleHead{"remedy", TargetKind::NODE};
    remedy.target_type = "claim";
    remedy.body.push_back(Clause{PatternKind::SELF, "breach", "", 0.51, ""});
    remedy.body.push_back(Clause{PatternKind::SELF, "damages", "", 0.5, ""});
    remedy.body.push_back(Clause{PatternKind::SELF, "precedent_support", "", 0.5, ""});

    return {breach, authority, remedy};
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== lexreason Contract Claim Example ===\n\n";

    // Configuration
    ReasonerConfig config = ReasonerConfig::Default();
    if (argc > 1) {
        auto loaded = ReasonerConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    } else {
        RedactionProfile client;
        client.name = "client";
        client.include_derivations = true;
        client.blocked_labels = {"settlement_memo"};
        client.fields["derivations.premises.entity.id"] = RedactionAction::HASH;
        config.export_profiles.push_back(client);
        config.engine.record_trace = true;
    }
    const std::string db_path = argc > 2 ? argv[2] : "/tmp/lexreason_example.db";

    try {
        // Graph and initial facts
        GraphLoader::Config loader_config;
        loader_config.numeric_attributes = {"precedent_weight"};
        GraphLoader::Result loaded = GraphLoader(loader_config).Load(BuildCase());
        std::cout << "Loaded " << loaded.graph->ToString() << " with "
                  << loaded.facts.size() << " initial facts\n";

        // Authority of the cited line of cases
        AuthorityMultiplierCalculator calculator(config.authority);
        CitationSignals signals;
        signals.treatment = Treatment::DISTINGUISHED;
        signals.age_years = 12.0;
        signals.source_jurisdiction = "US-NY";
        signals.target_jurisdiction = "UK";
        signals.court_level = CourtLevel::INTERMEDIATE;

        std::vector<Rule> rules = BuildRules();
        for (auto& rule : rules) {
            if (rule.aggregation == AggregationKind::PRECEDENT_WEIGHTED) {
                rule = calculator.AdjustRuleWeight(rule, signals);
                std::cout << "Authority multiplier for " << rule.id << ": "
                          << calculator.ComputeMultiplier(signals) << "\n";
            }
        }

        // Evaluate
        FixedPointEngine engine(config.engine);
        RunResult result = engine.Run(loaded.graph, loaded.facts, rules);
        std::cout << "Run " << ToString(result.status) << " after " << result.steps << " steps\n\n";
        std::cout << result.interpretation.ToString() << "\n";

        // Export under every configured profile
        InterpretationExporter exporter(config.BuildProfileRegistry());
        for (const auto& name : exporter.GetProfiles().Names()) {
            std::cout << "--- profile: " << name << " ---\n";
            std::cout << exporter.Export(result, name) << "\n";
        }

        // Archive
        InterpretationArchive::Config archive_config;
        archive_config.db_path = db_path;
        InterpretationArchive archive(archive_config);
        int64_t run_id = archive.StoreRun(result, "acme-v-widgetco");
        auto summary = archive.GetRunSummary(run_id);
        if (summary) {
            std::cout << "Archived run " << summary->run_id << " to " << db_path << ": "
                      << summary->fact_count << " facts, " << summary->record_count
                      << " derivation records\n";
        }
    } catch (const ReasonerError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
