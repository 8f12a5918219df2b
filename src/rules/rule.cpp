// File: src/rules/rule.cpp
#include "rules/rule.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace lexreason {

namespace {

bool InUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

const char* ComparisonSymbol(Comparison comparison) {
    switch (comparison) {
        case Comparison::GREATER_EQUAL: return ">=";
        case Comparison::GREATER: return ">";
        case Comparison::LESS_EQUAL: return "<=";
        case Comparison::LESS: return "<";
        case Comparison::EQUAL: return "==";
        default: return "?";
    }
}

} // namespace

// ============================================================================
// Quantifier
// ============================================================================

const char* ToString(Comparison comparison) {
    switch (comparison) {
        case Comparison::GREATER_EQUAL: return "greater_equal";
        case Comparison::GREATER: return "greater";
        case Comparison::LESS_EQUAL: return "less_equal";
        case Comparison::LESS: return "less";
        case Comparison::EQUAL: return "equal";
        default: return "unknown";
    }
}

Comparison ParseComparison(const std::string& str) {
    if (str == "greater_equal") return Comparison::GREATER_EQUAL;
    if (str == "greater") return Comparison::GREATER;
    if (str == "less_equal") return Comparison::LESS_EQUAL;
    if (str == "less") return Comparison::LESS;
    if (str == "equal") return Comparison::EQUAL;
    throw ConfigError("unknown comparison '" + str + "'");
}

const char* ToString(QuantifierMode mode) {
    switch (mode) {
        case QuantifierMode::NUMBER: return "number";
        case QuantifierMode::PERCENT: return "percent";
        default: return "unknown";
    }
}

const char* ToString(QuantifierBase base) {
    switch (base) {
        case QuantifierBase::TOTAL: return "total";
        case QuantifierBase::AVAILABLE: return "available";
        default: return "unknown";
    }
}

bool Quantifier::Accepts(size_t qualifying, size_t total, size_t available) const {
    double observed = static_cast<double>(qualifying);
    if (mode == QuantifierMode::PERCENT) {
        size_t denominator = base == QuantifierBase::AVAILABLE ? available : total;
        observed = denominator == 0
            ? 0.0
            : 100.0 * static_cast<double>(qualifying) / static_cast<double>(denominator);
    }

    switch (comparison) {
        case Comparison::GREATER_EQUAL: return observed >= value;
        case Comparison::GREATER: return observed > value;
        case Comparison::LESS_EQUAL: return observed <= value;
        case Comparison::LESS: return observed < value;
        case Comparison::EQUAL: return observed == value;
        default: return false;
    }
}

std::string Quantifier::ToString() const {
    std::ostringstream oss;
    oss << ComparisonSymbol(comparison) << value;
    if (mode == QuantifierMode::PERCENT) {
        oss << "%" << lexreason::ToString(base);
    }
    return oss.str();
}

// ============================================================================
// Clause and Rule
// ============================================================================

std::string Clause::ToString() const {
    std::ostringstream oss;
    oss << lexreason::ToString(pattern);
    if (!edge_type.empty()) {
        oss << "[" << edge_type << "]";
    }
    oss << ":" << label << ">=" << threshold;
    if (quantifier) {
        oss << "{" << quantifier->ToString() << "}";
    }
    return oss.str();
}

std::vector<double> Rule::Thresholds() const {
    std::vector<double> thresholds;
    thresholds.reserve(body.size());
    for (const auto& clause : body) {
        thresholds.push_back(clause.threshold);
    }
    return thresholds;
}

std::vector<std::string> Rule::GetValidationErrors() const {
    std::vector<std::string> errors;
    const std::string prefix = "rule '" + id + "': ";

    if (id.empty()) {
        errors.push_back("rule id must not be empty");
    }
    if (head.label.empty()) {
        errors.push_back(prefix + "head label must not be empty");
    }
    if (body.empty()) {
        errors.push_back(prefix + "body must contain at least one clause");
    }
    if (!InUnitRange(weight)) {
        errors.push_back(prefix + "weight must be between 0.0 and 1.0");
    }
    if (valid_time && !(valid_time->start <= valid_time->end)) {
        errors.push_back(prefix + "valid_time start must not exceed end");
    }

    for (size_t i = 0; i < body.size(); ++i) {
        const Clause& clause = body[i];
        const std::string where = prefix + "clause " + std::to_string(i) + ": ";

        if (clause.label.empty()) {
            errors.push_back(where + "label must not be empty");
        }
        if (!IsPatternCompatible(clause.pattern, head.target_kind)) {
            errors.push_back(where + "pattern '" + lexreason::ToString(clause.pattern) +
                             "' does not apply to " + lexreason::ToString(head.target_kind) +
                             " targets");
        }
        if (!InUnitRange(clause.threshold)) {
            errors.push_back(where + "threshold must be between 0.0 and 1.0");
        }
        if (RequiresPremiseWeights(aggregation) && clause.weight_attribute.empty()) {
            errors.push_back(where + lexreason::ToString(aggregation) +
                             " requires a weight_attribute");
        }
        if (clause.quantifier) {
            double value = clause.quantifier->value;
            if (!std::isfinite(value) || value < 0.0) {
                errors.push_back(where + "quantifier value must be a non-negative number");
            } else if (clause.quantifier->mode == QuantifierMode::PERCENT && value > 100.0) {
                errors.push_back(where + "quantifier percentage must not exceed 100");
            }
        }
    }

    return errors;
}

void Rule::Validate() const {
    auto errors = GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors);
    }
}

std::string Rule::ToString() const {
    std::ostringstream oss;
    oss << id << ": " << head.label << "(" << lexreason::ToString(head.target_kind) << ") <-"
        << lexreason::ToString(aggregation) << "- ";
    for (size_t i = 0; i < body.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << body[i].ToString();
    }
    oss << " w=" << weight;
    if (delay > 0) {
        oss << " delay=" << delay;
    }
    if (supersede) {
        oss << " supersede";
    }
    if (set_static) {
        oss << " static";
    }
    return oss.str();
}

AggregationKind ResolveAggregation(const std::string& name) {
    auto kind = ParseAggregationKind(name);
    if (!kind) {
        throw ConfigError("unknown aggregation function '" + name + "'");
    }
    return *kind;
}

} // namespace lexreason
