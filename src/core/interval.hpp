// File: src/core/interval.hpp
#pragma once

#include <optional>
#include <string>

namespace lexreason {

/// Interval: Closed confidence interval [lower, upper] with 0 <= lower <= upper <= 1
///
/// Represents the admissible truth range of a fact. A point fact has
/// lower == upper. Intervals are partially ordered by inclusion; narrowing
/// means moving to a contained interval.
class Interval {
public:
    /// Default constructor creates the unknown interval [0, 1]
    Interval() = default;

    /// Construct interval
    /// @throws std::invalid_argument if bounds are not finite or violate
    ///         0 <= lower <= upper <= 1
    Interval(double lower, double upper);

    /// Point interval [value, value]
    static Interval Point(double value);

    /// The unknown interval [0, 1]
    static Interval Unknown() { return Interval(); }

    /// Build an interval from raw bounds, clamping each bound to [0, 1]
    /// @return nullopt if a bound is not finite or lower > upper after clamping
    static std::optional<Interval> Clamped(double lower, double upper);

    double lower() const { return lower_; }
    double upper() const { return upper_; }

    double Width() const { return upper_ - lower_; }
    bool IsPoint() const { return lower_ == upper_; }

    /// True if other lies entirely within this interval
    bool Contains(const Interval& other) const {
        return lower_ <= other.lower_ && other.upper_ <= upper_;
    }

    /// Intersection [max(l), min(u)]; nullopt when the intervals are disjoint
    std::optional<Interval> Intersect(const Interval& other) const;

    /// Total order used to pick the most conservative of competing intervals:
    /// narrower first, then lower upper bound, then lower lower bound.
    bool MoreConservativeThan(const Interval& other) const;

    bool operator==(const Interval& other) const {
        return lower_ == other.lower_ && upper_ == other.upper_;
    }
    bool operator!=(const Interval& other) const { return !(*this == other); }

    /// Lexicographic (lower, upper), for ordered containers
    bool operator<(const Interval& other) const {
        if (lower_ != other.lower_) return lower_ < other.lower_;
        return upper_ < other.upper_;
    }

    std::string ToString() const;

private:
    double lower_{0.0};
    double upper_{1.0};
};

} // namespace lexreason
