// File: src/rules/clause_matcher.cpp
#include "rules/clause_matcher.hpp"

namespace lexreason {

std::vector<EntityRef> ClauseMatcher::CandidateTargets(const Rule& rule) const {
    const TypedGraph& graph = store_.graph();
    std::vector<EntityRef> targets;

    if (rule.head.target_kind == TargetKind::NODE) {
        for (const auto& id : graph.GetNodes()) {
            if (rule.target_type.empty() || graph.GetNodeType(id) == rule.target_type) {
                targets.push_back(EntityRef::Node(id));
            }
        }
    } else {
        for (const auto& edge : graph.GetEdges()) {
            if (rule.target_type.empty() || edge.type == rule.target_type) {
                targets.push_back(EntityRef(edge));
            }
        }
    }

    return targets;
}

std::optional<RuleBinding> ClauseMatcher::Match(const Rule& rule, const EntityRef& target,
                                                Timestep t) const {
    RuleBinding binding;
    binding.target = target;

    for (const auto& clause : rule.body) {
        FactPattern pattern = clause.ToFactPattern();
        auto matches = store_.MatchClause(pattern, target, t);
        if (clause.quantifier) {
            FactCounts counts = store_.CountPattern(pattern, target, t);
            if (!clause.quantifier->Accepts(matches.size(), counts.total, counts.available)) {
                return std::nullopt;
            }
        } else if (matches.empty()) {
            return std::nullopt;
        }

        for (auto& match : matches) {
            Premise premise{match.interval, std::nullopt};
            if (!clause.weight_attribute.empty()) {
                premise.weight = LookupWeight(match, clause.weight_attribute);
            }
            binding.premises.push_back(premise);
            binding.matches.push_back(std::move(match));
        }
    }

    return binding;
}

std::optional<double> ClauseMatcher::LookupWeight(const FactMatch& match,
                                                  const std::string& attribute) const {
    const TypedGraph& graph = store_.graph();
    if (match.via) {
        auto weight = graph.GetAttribute(EntityRef(*match.via), attribute);
        if (weight) {
            return weight;
        }
    }
    return graph.GetAttribute(match.key.entity, attribute);
}

} // namespace lexreason
