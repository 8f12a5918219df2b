// File: src/core/errors.cpp
#include "core/errors.hpp"
#include <sstream>

namespace lexreason {

namespace {

std::string JoinErrors(const std::vector<std::string>& errors) {
    std::ostringstream oss;
    oss << "ConfigError: ";
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << errors[i];
    }
    return oss.str();
}

std::string DescribeViolation(const FactKey& key, Timestep timestep, const std::string& detail) {
    std::ostringstream oss;
    oss << "InvariantViolation: " << key.ToString() << " at t=" << timestep << ": " << detail;
    return oss.str();
}

} // namespace

ConfigError::ConfigError(const std::vector<std::string>& errors)
    : ReasonerError(JoinErrors(errors)), errors_(errors) {}

InvariantViolation::InvariantViolation(const FactKey& key, Timestep timestep,
                                       const std::string& detail)
    : ReasonerError(DescribeViolation(key, timestep, detail)),
      key_(key),
      timestep_(timestep) {}

} // namespace lexreason
