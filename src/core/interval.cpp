// File: src/core/interval.cpp
#include "core/interval.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lexreason {

Interval::Interval(double lower, double upper)
    : lower_(lower), upper_(upper) {
    if (!std::isfinite(lower) || !std::isfinite(upper)) {
        throw std::invalid_argument("Interval bounds must be finite");
    }
    if (lower < 0.0 || upper > 1.0 || lower > upper) {
        throw std::invalid_argument("Interval requires 0 <= lower <= upper <= 1, got " +
                                    ToString());
    }
}

Interval Interval::Point(double value) {
    return Interval(value, value);
}

std::optional<Interval> Interval::Clamped(double lower, double upper) {
    if (!std::isfinite(lower) || !std::isfinite(upper)) {
        return std::nullopt;
    }
    double l = std::clamp(lower, 0.0, 1.0);
    double u = std::clamp(upper, 0.0, 1.0);
    if (l > u) {
        return std::nullopt;
    }
    return Interval(l, u);
}

std::optional<Interval> Interval::Intersect(const Interval& other) const {
    double l = std::max(lower_, other.lower_);
    double u = std::min(upper_, other.upper_);
    if (l > u) {
        return std::nullopt;
    }
    return Interval(l, u);
}

bool Interval::MoreConservativeThan(const Interval& other) const {
    double w = Width();
    double ow = other.Width();
    if (w != ow) return w < ow;
    if (upper_ != other.upper_) return upper_ < other.upper_;
    return lower_ < other.lower_;
}

std::string Interval::ToString() const {
    std::ostringstream oss;
    oss << "[" << std::setprecision(17) << lower_ << ", " << upper_ << "]";
    return oss.str();
}

} // namespace lexreason
