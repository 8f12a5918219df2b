// File: src/rules/clause_matcher.hpp
#pragma once

#include "graph/fact_store.hpp"
#include "rules/aggregation.hpp"
#include "rules/rule.hpp"
#include <optional>
#include <vector>

namespace lexreason {

/// RuleBinding: Premises that satisfy every clause of a rule for one target
struct RuleBinding {
    EntityRef target;

    /// Qualifying matches, clause by clause in body order
    std::vector<FactMatch> matches;

    /// Aggregation input aligned with matches
    std::vector<Premise> premises;
};

/// ClauseMatcher: Grounds rules against a frozen FactStore timestep
///
/// Stateless apart from the store reference; safe to share between threads
/// as long as the store is not mutated.
class ClauseMatcher {
public:
    explicit ClauseMatcher(const FactStore& store) : store_(store) {}

    /// Candidate head targets for a rule: every node (node heads) or every
    /// edge (edge heads), filtered by target_type, in ascending order
    std::vector<EntityRef> CandidateTargets(const Rule& rule) const;

    /// Match all clauses of a rule for one target at timestep t
    /// @return nullopt if some clause has no premise at or above its threshold,
    ///         or fails its quantifier. A satisfied quantifier may contribute
    ///         no premises.
    std::optional<RuleBinding> Match(const Rule& rule, const EntityRef& target, Timestep t) const;

private:
    const FactStore& store_;

    /// Precedent weight of a match: connecting edge first, then premise entity
    std::optional<double> LookupWeight(const FactMatch& match,
                                       const std::string& attribute) const;
};

} // namespace lexreason
