// File: src/engine/interpretation.hpp
#pragma once

#include "core/interval.hpp"
#include "core/types.hpp"
#include "engine/derivation_log.hpp"
#include "graph/fact_store.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

/// Interpretation: Immutable fact assignment at one timestep
///
/// Optionally shares the run's derivation log, which answers "why" queries
/// for the facts it contains.
class Interpretation {
public:
    Interpretation() = default;

    Interpretation(Timestep timestep,
                   std::map<FactKey, Interval> facts,
                   std::shared_ptr<const DerivationLog> log = nullptr);

    Timestep timestep() const { return timestep_; }
    const std::map<FactKey, Interval>& facts() const { return facts_; }

    std::optional<Interval> Get(const FactKey& key) const;

    std::optional<Interval> Get(const EntityRef& entity, const Label& label) const {
        return Get(FactKey{entity, label});
    }

    size_t size() const { return facts_.size(); }
    bool empty() const { return facts_.empty(); }

    /// Derivation log of the run that produced this interpretation (may be null)
    const DerivationLog* derivations() const { return log_.get(); }
    bool HasDerivations() const { return log_ && !log_->empty(); }

    /// Derivation records supporting one fact at this timestep
    std::vector<DerivationRecord> Explain(const FactKey& key) const;

    /// Facts as timestep-0 input for a new run
    std::vector<InitialFact> ToInitialFacts() const;

    /// Same facts, ignoring timestep and derivations
    bool SameFacts(const Interpretation& other) const { return facts_ == other.facts_; }

    /// One "key = [l, u]" line per fact, in key order
    std::string ToString() const;

private:
    Timestep timestep_{0};
    std::map<FactKey, Interval> facts_;
    std::shared_ptr<const DerivationLog> log_;
};

} // namespace lexreason
