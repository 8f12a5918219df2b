// File: src/rules/aggregation.cpp
#include "rules/aggregation.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lexreason {

namespace {

constexpr double kCivilFloor = 0.51;
constexpr double kClearFloor = 0.75;
constexpr double kCriminalFloor = 0.90;

// Statutory interpretation biases
constexpr double kTextualismSpan = 0.95;
constexpr double kPurposivismSpan = 1.05;
constexpr double kLenityLower = 0.95;

struct Bounds {
    double lower;
    double upper;
};

Bounds MeanBounds(const std::vector<Premise>& premises) {
    double sum_lower = 0.0;
    double sum_upper = 0.0;
    for (const auto& p : premises) {
        sum_lower += p.interval.lower();
        sum_upper += p.interval.upper();
    }
    double n = static_cast<double>(premises.size());
    return {sum_lower / n, sum_upper / n};
}

double MinLower(const std::vector<Premise>& premises) {
    double v = 1.0;
    for (const auto& p : premises) v = std::min(v, p.interval.lower());
    return v;
}

double MaxLower(const std::vector<Premise>& premises) {
    double v = 0.0;
    for (const auto& p : premises) v = std::max(v, p.interval.lower());
    return v;
}

double MinUpper(const std::vector<Premise>& premises) {
    double v = 1.0;
    for (const auto& p : premises) v = std::min(v, p.interval.upper());
    return v;
}

double MaxUpper(const std::vector<Premise>& premises) {
    double v = 0.0;
    for (const auto& p : premises) v = std::max(v, p.interval.upper());
    return v;
}

// [max(floor, min lower), min(1, max upper)]
std::optional<Interval> Burden(const std::vector<Premise>& premises, double floor) {
    double lower = std::max(floor, MinLower(premises));
    double upper = std::min(1.0, MaxUpper(premises));
    return Interval::Clamped(lower, upper);
}

std::optional<Interval> PrecedentWeighted(const std::vector<Premise>& premises) {
    double total = 0.0;
    for (const auto& p : premises) {
        if (!p.weight) {
            throw AggregationInputError("precedent_weighted premise has no precedent weight");
        }
        if (!std::isfinite(*p.weight) || *p.weight < 0.0) {
            throw AggregationInputError("precedent_weighted premise weight out of range: " +
                                        std::to_string(*p.weight));
        }
        total += *p.weight;
    }
    if (total <= 0.0) {
        throw AggregationInputError("precedent_weighted weights sum to zero");
    }

    double lower = 0.0;
    double upper = 0.0;
    for (const auto& p : premises) {
        double w = *p.weight / total;
        lower += w * p.interval.lower();
        upper += w * p.interval.upper();
    }
    return Interval::Clamped(lower, upper);
}

} // namespace

// ============================================================================
// Catalogue
// ============================================================================

const char* ToString(AggregationKind kind) {
    switch (kind) {
        case AggregationKind::AVERAGE: return "average";
        case AggregationKind::AVERAGE_LOWER: return "average_lower";
        case AggregationKind::MAXIMUM: return "maximum";
        case AggregationKind::MINIMUM: return "minimum";
        case AggregationKind::LEGAL_BURDEN_CIVIL_051: return "legal_burden_civil_051";
        case AggregationKind::LEGAL_BURDEN_CLEAR_075: return "legal_burden_clear_075";
        case AggregationKind::LEGAL_BURDEN_CRIMINAL_090: return "legal_burden_criminal_090";
        case AggregationKind::LEGAL_CONSERVATIVE_MIN: return "legal_conservative_min";
        case AggregationKind::PRECEDENT_WEIGHTED: return "precedent_weighted";
        case AggregationKind::TEXTUALISM_ALPHA: return "textualism_alpha";
        case AggregationKind::PURPOSIVISM_ALPHA: return "purposivism_alpha";
        case AggregationKind::LENITY_ALPHA: return "lenity_alpha";
        default: return "unknown";
    }
}

const std::vector<AggregationKind>& AllAggregationKinds() {
    static const std::vector<AggregationKind> kinds = {
        AggregationKind::AVERAGE,
        AggregationKind::AVERAGE_LOWER,
        AggregationKind::MAXIMUM,
        AggregationKind::MINIMUM,
        AggregationKind::LEGAL_BURDEN_CIVIL_051,
        AggregationKind::LEGAL_BURDEN_CLEAR_075,
        AggregationKind::LEGAL_BURDEN_CRIMINAL_090,
        AggregationKind::LEGAL_CONSERVATIVE_MIN,
        AggregationKind::PRECEDENT_WEIGHTED,
        AggregationKind::TEXTUALISM_ALPHA,
        AggregationKind::PURPOSIVISM_ALPHA,
        AggregationKind::LENITY_ALPHA,
    };
    return kinds;
}

std::optional<AggregationKind> ParseAggregationKind(const std::string& name) {
    for (AggregationKind kind : AllAggregationKinds()) {
        if (name == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

double AggregationFloor(AggregationKind kind) {
    switch (kind) {
        case AggregationKind::LEGAL_BURDEN_CIVIL_051: return kCivilFloor;
        case AggregationKind::LEGAL_BURDEN_CLEAR_075: return kClearFloor;
        case AggregationKind::LEGAL_BURDEN_CRIMINAL_090: return kCriminalFloor;
        default: return 0.0;
    }
}

bool RequiresPremiseWeights(AggregationKind kind) {
    return kind == AggregationKind::PRECEDENT_WEIGHTED;
}

// ============================================================================
// Evaluation
// ============================================================================

std::optional<Interval> Aggregate(AggregationKind kind, const std::vector<Premise>& premises) {
    if (premises.empty()) {
        throw AggregationInputError(std::string(ToString(kind)) + " received no premises");
    }

    switch (kind) {
        case AggregationKind::AVERAGE: {
            Bounds mean = MeanBounds(premises);
            return Interval::Clamped(mean.lower, mean.upper);
        }
        case AggregationKind::AVERAGE_LOWER: {
            Bounds mean = MeanBounds(premises);
            return Interval::Clamped(mean.lower, MaxUpper(premises));
        }
        case AggregationKind::MAXIMUM:
            return Interval::Clamped(MaxLower(premises), MaxUpper(premises));
        case AggregationKind::MINIMUM:
        case AggregationKind::LEGAL_CONSERVATIVE_MIN:
            return Interval::Clamped(MinLower(premises), MinUpper(premises));
        case AggregationKind::LEGAL_BURDEN_CIVIL_051:
        case AggregationKind::LEGAL_BURDEN_CLEAR_075:
        case AggregationKind::LEGAL_BURDEN_CRIMINAL_090:
            return Burden(premises, AggregationFloor(kind));
        case AggregationKind::PRECEDENT_WEIGHTED:
            return PrecedentWeighted(premises);
        case AggregationKind::TEXTUALISM_ALPHA: {
            Bounds mean = MeanBounds(premises);
            return Interval::Clamped(mean.lower,
                                     mean.lower + kTextualismSpan * (mean.upper - mean.lower));
        }
        case AggregationKind::PURPOSIVISM_ALPHA: {
            Bounds mean = MeanBounds(premises);
            return Interval::Clamped(mean.lower,
                                     mean.lower + kPurposivismSpan * (mean.upper - mean.lower));
        }
        case AggregationKind::LENITY_ALPHA: {
            Bounds mean = MeanBounds(premises);
            return Interval::Clamped(kLenityLower * mean.lower, mean.upper);
        }
    }
    throw std::invalid_argument("Unhandled aggregation kind");
}

Interval ApplyRuleWeight(AggregationKind kind, const Interval& derived, double weight) {
    if (!(weight >= 0.0 && weight <= 1.0)) {
        throw std::invalid_argument("Rule weight must be in [0,1], got " + std::to_string(weight));
    }
    if (weight == 1.0) {
        return derived;
    }

    double floor = AggregationFloor(kind);
    double lower = derived.lower() >= floor ? floor + weight * (derived.lower() - floor)
                                            : derived.lower();
    double upper = derived.upper() >= floor ? floor + weight * (derived.upper() - floor)
                                            : derived.upper();
    return Interval(std::clamp(lower, 0.0, 1.0), std::clamp(upper, 0.0, 1.0));
}

} // namespace lexreason
