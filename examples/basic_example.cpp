// File: examples/basic_example.cpp
//
// Basic reasoning example using the lexreason engine.
// Demonstrates:
// - Building a typed graph of a claim and the precedents it cites
// - Seeding initial facts as confidence intervals
// - Writing rules with thresholds and aggregation functions
// - Running the fixed-point engine to convergence
// - Asking "why" a derived fact holds

#include "core/errors.hpp"
#include "engine/fixed_point_engine.hpp"
#include <iomanip>
#include <iostream>
#include <memory>

using namespace lexreason;

void PrintInterval(const std::string& name, const std::optional<Interval>& interval) {
    std::cout << "  " << std::left << std::setw(28) << name;
    if (interval) {
        std::cout << interval->ToString() << "\n";
    } else {
        std::cout << "(not derived)\n";
    }
}

int main() {
    std::cout << "=== lexreason Basic Reasoning Example ===\n\n";

    // Step 1: Build the graph
    std::cout << "Step 1: Building the case graph...\n";

    auto graph = std::make_shared<TypedGraph>();
    graph->AddNode("smith-v-jones", "claim");
    graph->AddNode("palsgraf", "precedent");
    graph->AddNode("donoghue", "precedent");
    graph->AddEdge("smith-v-jones", "palsgraf", "cites");
    graph->AddEdge("smith-v-jones", "donoghue", "cites");
    std::cout << "  " << graph->ToString() << "\n\n";

    // Step 2: Seed initial facts
    std::cout << "Step 2: Seeding initial facts...\n";

    auto claim = [](const std::string& label) {
        return FactKey{EntityRef::Node("smith-v-jones"), label};
    };

    std::vector<InitialFact> facts{
        {claim("duty"), Interval::Point(1.0)},
        {claim("breach_evidence"), Interval(0.7, 0.9)},
        {claim("causation"), Interval(0.6, 0.95)},
        {FactKey{EntityRef::Node("palsgraf"), "support"}, Interval(0.7, 0.9)},
        {FactKey{EntityRef::Node("donoghue"), "support"}, Interval(0.6, 0.8)},
    };
    for (const auto& fact : facts) {
        PrintInterval(fact.key.ToString(), fact.interval);
    }
    std::cout << "\n";

    // Step 3: Define rules
    std::cout << "Step 3: Defining rules...\n";

    Rule breach;
    breach.id = "breach";
    breach.head = RuleHead{"breach", TargetKind::NODE};
    breach.target_type = "claim";
    breach.aggregation = AggregationKind::LEGAL_BURDEN_CIVIL_051;
    breach.body.push_back(Clause{PatternKind::SELF, "breach_evidence", "", 0.5, ""});
    breach.body.push_back(Clause{PatternKind::SELF, "causation", "", 0.5, ""});

    Rule supported;
    supported.id = "supported";
    supported.head = RuleHead{"supported", TargetKind::NODE};
    supported.target_type = "claim";
    supported.aggregation = AggregationKind::AVERAGE;
    supported.weight = 0.9;
    supported.body.push_back(Clause{PatternKind::OUT_NEIGHBOR, "support", "cites", 0.5, ""});

    Rule liable;
    liable.id = "liable";
    liable.head = RuleHead{"liable", TargetKind::NODE};
    liable.body.push_back(Clause{PatternKind::SELF, "duty", "", 0.5, ""});
    liable.body.push_back(Clause{PatternKind::SELF, "breach", "", 0.51, ""});
    liable.body.push_back(Clause{PatternKind::SELF, "supported", "", 0.5, ""});

    std::vector<Rule> rules{breach, supported, liable};
    for (const auto& rule : rules) {
        std::cout << "  " << rule.ToString() << "\n";
    }
    std::cout << "\n";

    // Step 4: Run to a fixed point
    std::cout << "Step 4: Running the engine...\n";

    FixedPointEngine::Config config;
    config.tmax = 20;
    FixedPointEngine engine(config);

    RunResult result;
    try {
        result = engine.Run(graph, facts, rules);
    } catch (const ReasonerError& e) {
        std::cerr << "  Run failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "  Status: " << ToString(result.status) << " after "
              << result.steps << " steps\n\n";

    // Step 5: Inspect the result
    std::cout << "Step 5: Derived facts...\n";
    PrintInterval("breach(smith-v-jones)", result.interpretation.Get(claim("breach")));
    PrintInterval("supported(smith-v-jones)", result.interpretation.Get(claim("supported")));
    PrintInterval("liable(smith-v-jones)", result.interpretation.Get(claim("liable")));
    std::cout << "\n";

    // Step 6: Explain
    std::cout << "Step 6: Why is smith-v-jones liable?\n";
    for (const auto& record : result.Explain(claim("liable"))) {
        std::cout << "  #" << record.id << " t=" << record.timestep << " "
                  << record.head.ToString() << " = " << record.interval.ToString();
        if (record.IsInitial()) {
            std::cout << "  [initial]";
        } else {
            std::cout << "  [rule " << record.rule_id << "]";
        }
        std::cout << "\n";
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
