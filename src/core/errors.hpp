// File: src/core/errors.hpp
#pragma once

#include "core/types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace lexreason {

/// Base class of every error raised by the reasoner
class ReasonerError : public std::runtime_error {
public:
    explicit ReasonerError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Malformed rule, unknown aggregation id, or invalid weight/redaction table.
/// Always raised before evaluation starts.
class ConfigError : public ReasonerError {
public:
    explicit ConfigError(const std::string& message)
        : ReasonerError("ConfigError: " + message), errors_{message} {}

    /// Aggregate several validation failures into one error
    explicit ConfigError(const std::vector<std::string>& errors);

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

/// A fact update would widen an interval outside the monotonicity policy
class InvariantViolation : public ReasonerError {
public:
    InvariantViolation(const FactKey& key, Timestep timestep, const std::string& detail);

    const FactKey& key() const { return key_; }
    Timestep timestep() const { return timestep_; }

private:
    FactKey key_;
    Timestep timestep_;
};

/// An aggregation function received missing or out-of-range premises.
/// Local to one rule firing: the engine records it and the rule does not fire.
class AggregationInputError : public ReasonerError {
public:
    explicit AggregationInputError(const std::string& reason)
        : ReasonerError("AggregationInputError: " + reason), reason_(reason) {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

/// Export requested under a profile name that is not registered
class ProfileNotFound : public ReasonerError {
public:
    explicit ProfileNotFound(const std::string& profile_name)
        : ReasonerError("ProfileNotFound: " + profile_name), profile_name_(profile_name) {}

    const std::string& profile_name() const { return profile_name_; }

private:
    std::string profile_name_;
};

} // namespace lexreason
