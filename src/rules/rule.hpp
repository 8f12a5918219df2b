// File: src/rules/rule.hpp
#pragma once

#include "core/types.hpp"
#include "graph/fact_store.hpp"
#include "rules/aggregation.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

/// TimeWindow: Closed legal-time window [start, end]
struct TimeWindow {
    double start{0.0};
    double end{0.0};

    bool Contains(double time) const { return start <= time && time <= end; }
};

// Comparison: Operator of a clause quantifier
enum class Comparison : uint8_t {
    GREATER_EQUAL = 0,
    GREATER = 1,
    LESS_EQUAL = 2,
    LESS = 3,
    EQUAL = 4,
};

const char* ToString(Comparison comparison);

/// @throws ConfigError for an unknown name
Comparison ParseComparison(const std::string& str);

// QuantifierMode: Compare a count of qualifying premises, or a percentage
enum class QuantifierMode : uint8_t {
    NUMBER = 0,
    PERCENT = 1,
};

// QuantifierBase: Denominator of a percentage
enum class QuantifierBase : uint8_t {
    TOTAL = 0,       // Every entity the pattern reaches
    AVAILABLE = 1,   // Entities that carry the clause label
};

const char* ToString(QuantifierMode mode);
const char* ToString(QuantifierBase base);

/// Quantifier: How many of a clause's candidate premises must qualify
///
/// A premise qualifies when its lower bound meets the clause threshold.
/// "at least 2 precedents" is {GREATER_EQUAL, NUMBER, TOTAL, 2};
/// "over half of the cited cases" is {GREATER, PERCENT, TOTAL, 50}.
struct Quantifier {
    Comparison comparison{Comparison::GREATER_EQUAL};
    QuantifierMode mode{QuantifierMode::NUMBER};
    QuantifierBase base{QuantifierBase::TOTAL};
    double value{1.0};

    /// Percentages are taken over `total` or `available`; an empty base is 0%
    bool Accepts(size_t qualifying, size_t total, size_t available) const;

    std::string ToString() const;
};

/// Clause: Selects premise facts by graph pattern and requires a minimum lower bound
struct Clause {
    PatternKind pattern{PatternKind::SELF};
    Label label;

    /// Restrict neighbor/edge patterns to one edge type (empty: any type)
    std::string edge_type;

    /// Minimum premise lower bound for the clause to be satisfied
    double threshold{0.0};

    /// Graph attribute holding the premise's precedent weight
    /// (read from the connecting edge first, then the premise entity)
    std::string weight_attribute;

    /// Without a quantifier one qualifying premise satisfies the clause
    std::optional<Quantifier> quantifier;

    FactPattern ToFactPattern() const {
        return FactPattern{pattern, label, edge_type, threshold};
    }

    /// e.g. "out_neighbor[cites]:support_for_breach>=0.6"
    std::string ToString() const;
};

/// RuleHead: Label derived by a rule and the kind of entity it lands on
struct RuleHead {
    Label label;
    TargetKind target_kind{TargetKind::NODE};
};

/// Rule: Declarative inference rule
///
/// A rule fires for a candidate target when its valid-time window contains
/// the timestep's legal time, every clause matches at least one premise at or
/// above its threshold (or satisfies its quantifier), and the aggregation
/// yields a non-empty interval. The weighted result is proposed for the head
/// at timestep t + 1 + delay.
///
/// Rules are immutable during a run.
struct Rule {
    std::string id;
    RuleHead head;
    std::vector<Clause> body;
    AggregationKind aggregation{AggregationKind::LEGAL_CONSERVATIVE_MIN};

    /// Rule weight in [0,1], usually scaled by an authority multiplier
    double weight{1.0};

    std::optional<TimeWindow> valid_time;

    /// Replace the current interval instead of narrowing it
    bool supersede{false};

    /// Extra timesteps before a proposal takes effect
    Timestep delay{0};

    /// A head fact this rule writes is frozen against later updates
    bool set_static{false};

    /// Only consider targets of this node/edge type (empty: all)
    std::string target_type;

    /// Free-form audit metadata (authority, text, ...)
    std::map<std::string, std::string> qualifiers;

    /// Per-clause thresholds, in body order
    std::vector<double> Thresholds() const;

    /// @throws ConfigError listing every validation failure
    void Validate() const;

    bool IsValid() const { return GetValidationErrors().empty(); }

    std::vector<std::string> GetValidationErrors() const;

    std::string ToString() const;
};

/// Resolve an aggregation identifier
/// @throws ConfigError for an unknown identifier
AggregationKind ResolveAggregation(const std::string& name);

} // namespace lexreason
