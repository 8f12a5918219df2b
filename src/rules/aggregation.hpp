// File: src/rules/aggregation.hpp
#pragma once

#include "core/interval.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lexreason {

// AggregationKind: Closed catalogue of annotation functions a rule may use
enum class AggregationKind : uint8_t {
    AVERAGE = 0,
    AVERAGE_LOWER = 1,
    MAXIMUM = 2,
    MINIMUM = 3,
    LEGAL_BURDEN_CIVIL_051 = 4,      // Preponderance of the evidence
    LEGAL_BURDEN_CLEAR_075 = 5,      // Clear and convincing evidence
    LEGAL_BURDEN_CRIMINAL_090 = 6,   // Beyond a reasonable doubt
    LEGAL_CONSERVATIVE_MIN = 7,
    PRECEDENT_WEIGHTED = 8,
    TEXTUALISM_ALPHA = 9,
    PURPOSIVISM_ALPHA = 10,
    LENITY_ALPHA = 11,
};

/// Identifier used by rules and configuration (e.g. "legal_burden_civil_051")
const char* ToString(AggregationKind kind);

/// @return nullopt for an unknown identifier
std::optional<AggregationKind> ParseAggregationKind(const std::string& name);

/// Every kind, in declaration order
const std::vector<AggregationKind>& AllAggregationKinds();

/// Lowest lower bound the function can derive (burden floors; 0 otherwise).
/// Rule weights scale toward this floor.
double AggregationFloor(AggregationKind kind);

/// True if every premise must carry a precedent weight
bool RequiresPremiseWeights(AggregationKind kind);

/// Premise: One matched premise interval with its optional precedent weight
struct Premise {
    Interval interval;
    std::optional<double> weight;
};

/// Apply an aggregation function to the matched premises
///
/// @return Derived interval, or nullopt when the rule does not fire
///         (the result would have lower > upper)
/// @throws AggregationInputError if premises is empty, or for
///         PRECEDENT_WEIGHTED if a weight is missing, negative, non-finite,
///         or the weights sum to zero
std::optional<Interval> Aggregate(AggregationKind kind, const std::vector<Premise>& premises);

/// Scale an aggregation result by a rule weight toward the function's floor:
/// bound' = floor + weight * (bound - floor), applied to both bounds.
/// @throws std::invalid_argument if weight is outside [0,1]
Interval ApplyRuleWeight(AggregationKind kind, const Interval& derived, double weight);

} // namespace lexreason
