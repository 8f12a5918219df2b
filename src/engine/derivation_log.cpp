// File: src/engine/derivation_log.cpp
#include "engine/derivation_log.hpp"
#include <set>
#include <stdexcept>

namespace lexreason {

RecordId DerivationLog::Append(DerivationRecord record) {
    auto& ids = by_key_[record.head];
    if (!ids.empty() && record.timestep < records_[ids.back()].timestep) {
        throw std::invalid_argument("Derivation record for " + record.head.ToString() +
                                    " is older than the latest record");
    }

    record.id = records_.size();
    ids.push_back(record.id);
    records_.push_back(std::move(record));
    return records_.back().id;
}

void DerivationLog::RecordFailure(FiringFailure failure) {
    failures_.push_back(std::move(failure));
}

void DerivationLog::RecordTrace(TraceEvent event) {
    trace_.push_back(std::move(event));
}

std::optional<RecordId> DerivationLog::FindVisible(const FactKey& key, Timestep t) const {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) {
        return std::nullopt;
    }
    for (auto id = it->second.rbegin(); id != it->second.rend(); ++id) {
        if (records_[*id].timestep <= t) {
            return *id;
        }
    }
    return std::nullopt;
}

std::vector<RecordId> DerivationLog::GetRecordsFor(const FactKey& key) const {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) {
        return {};
    }
    return it->second;
}

std::vector<DerivationRecord> DerivationLog::Explain(const FactKey& key, Timestep t) const {
    std::vector<DerivationRecord> result;
    auto root = FindVisible(key, t);
    if (!root) {
        return result;
    }

    std::set<RecordId> visited;
    std::vector<RecordId> stack{*root};

    while (!stack.empty()) {
        RecordId id = stack.back();
        stack.pop_back();
        if (!visited.insert(id).second) {
            continue;
        }

        const DerivationRecord& record = records_[id];
        if (record.prior_record) {
            stack.push_back(*record.prior_record);
        }
        for (const auto& premise : record.premises) {
            auto premise_record = FindVisible(premise.key, premise.version);
            if (premise_record) {
                stack.push_back(*premise_record);
            }
        }
    }

    // std::set iterates in ascending id order
    result.reserve(visited.size());
    for (RecordId id : visited) {
        result.push_back(records_[id]);
    }
    return result;
}

} // namespace lexreason
