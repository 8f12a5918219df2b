// File: src/engine/interpretation.cpp
#include "engine/interpretation.hpp"
#include <sstream>

namespace lexreason {

Interpretation::Interpretation(Timestep timestep,
                               std::map<FactKey, Interval> facts,
                               std::shared_ptr<const DerivationLog> log)
    : timestep_(timestep),
      facts_(std::move(facts)),
      log_(std::move(log)) {}

std::optional<Interval> Interpretation::Get(const FactKey& key) const {
    auto it = facts_.find(key);
    if (it == facts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DerivationRecord> Interpretation::Explain(const FactKey& key) const {
    if (!log_) {
        return {};
    }
    return log_->Explain(key, timestep_);
}

std::vector<InitialFact> Interpretation::ToInitialFacts() const {
    std::vector<InitialFact> result;
    result.reserve(facts_.size());
    for (const auto& [key, interval] : facts_) {
        result.push_back(InitialFact{key, interval});
    }
    return result;
}

std::string Interpretation::ToString() const {
    std::ostringstream oss;
    oss << "Interpretation@t=" << timestep_ << " (" << facts_.size() << " facts)\n";
    for (const auto& [key, interval] : facts_) {
        oss << "  " << key.ToString() << " = " << interval.ToString() << "\n";
    }
    return oss.str();
}

} // namespace lexreason
