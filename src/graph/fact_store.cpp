// File: src/graph/fact_store.cpp
#include "graph/fact_store.hpp"
#include "core/errors.hpp"
#include <stdexcept>

namespace lexreason {

// ============================================================================
// PatternKind
// ============================================================================

const char* ToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::SELF: return "self";
        case PatternKind::OUT_NEIGHBOR: return "out_neighbor";
        case PatternKind::IN_NEIGHBOR: return "in_neighbor";
        case PatternKind::OUT_EDGE: return "out_edge";
        case PatternKind::IN_EDGE: return "in_edge";
        case PatternKind::SOURCE: return "source";
        case PatternKind::TARGET: return "target";
        default: return "unknown";
    }
}

PatternKind ParsePatternKind(const std::string& str) {
    if (str == "self") return PatternKind::SELF;
    if (str == "out_neighbor") return PatternKind::OUT_NEIGHBOR;
    if (str == "in_neighbor") return PatternKind::IN_NEIGHBOR;
    if (str == "out_edge") return PatternKind::OUT_EDGE;
    if (str == "in_edge") return PatternKind::IN_EDGE;
    if (str == "source") return PatternKind::SOURCE;
    if (str == "target") return PatternKind::TARGET;
    throw std::invalid_argument("Unknown PatternKind: " + str);
}

bool IsPatternCompatible(PatternKind pattern, TargetKind anchor) {
    switch (pattern) {
        case PatternKind::SELF:
            return true;
        case PatternKind::OUT_NEIGHBOR:
        case PatternKind::IN_NEIGHBOR:
        case PatternKind::OUT_EDGE:
        case PatternKind::IN_EDGE:
            return anchor == TargetKind::NODE;
        case PatternKind::SOURCE:
        case PatternKind::TARGET:
            return anchor == TargetKind::EDGE;
        default:
            return false;
    }
}

// ============================================================================
// Construction
// ============================================================================

FactStore::FactStore(std::shared_ptr<const TypedGraph> graph)
    : graph_(std::move(graph)) {
    if (!graph_) {
        throw std::invalid_argument("FactStore requires a graph");
    }
}

// ============================================================================
// Fact Access
// ============================================================================

const FactStore::Version* FactStore::FindVersion(const FactKey& key, Timestep t) const {
    auto it = facts_.find(key);
    if (it == facts_.end()) {
        return nullptr;
    }

    // Versions are appended in ascending timestep order
    const auto& versions = it->second;
    for (auto v = versions.rbegin(); v != versions.rend(); ++v) {
        if (v->timestep <= t) {
            return &*v;
        }
    }
    return nullptr;
}

std::optional<Interval> FactStore::GetFact(const FactKey& key, Timestep t) const {
    const Version* version = FindVersion(key, t);
    if (!version) {
        return std::nullopt;
    }
    return version->interval;
}

std::optional<Timestep> FactStore::GetVersion(const FactKey& key, Timestep t) const {
    const Version* version = FindVersion(key, t);
    if (!version) {
        return std::nullopt;
    }
    return version->timestep;
}

bool FactStore::SetFact(const FactKey& key, Timestep t, const Interval& interval, bool supersede) {
    if (!graph_->HasEntity(key.entity)) {
        throw std::invalid_argument("Fact refers to unknown entity: " + key.ToString());
    }

    auto& versions = facts_[key];
    if (!versions.empty()) {
        const Version& prior = versions.back();
        if (t < prior.timestep) {
            throw InvariantViolation(key, t, "update precedes stored version at t=" +
                                     std::to_string(prior.timestep));
        }
        if (!supersede && !prior.interval.Contains(interval)) {
            throw InvariantViolation(key, t, "update " + interval.ToString() +
                                     " widens " + prior.interval.ToString());
        }
        if (prior.interval == interval) {
            return false;
        }
        if (prior.timestep == t) {
            versions.back().interval = interval;
            return true;
        }
    }

    versions.push_back(Version{t, interval});
    if (t > latest_) {
        latest_ = t;
    }
    return true;
}

// ============================================================================
// Pattern Queries
// ============================================================================

void FactStore::CollectMatch(const EntityRef& entity, const FactPattern& pattern, Timestep t,
                             const std::optional<EdgeRef>& via,
                             std::map<FactKey, FactMatch>& out) const {
    FactKey key{entity, pattern.label};
    const Version* version = FindVersion(key, t);
    if (!version || version->interval.lower() < pattern.min_lower) {
        return;
    }

    out.emplace(key, FactMatch{key, version->interval, version->timestep, via});
}

std::map<EntityRef, std::optional<EdgeRef>> FactStore::SelectEntities(const FactPattern& pattern,
                                                                      const EntityRef& anchor) const {
    if (!IsPatternCompatible(pattern.kind, anchor.kind())) {
        throw std::invalid_argument(std::string("Pattern '") + ToString(pattern.kind) +
                                    "' does not apply to " + ToString(anchor.kind()) + " anchors");
    }

    // emplace keeps the first connecting edge when several reach the same entity
    std::map<EntityRef, std::optional<EdgeRef>> selected;

    switch (pattern.kind) {
        case PatternKind::SELF:
            selected.emplace(anchor, std::nullopt);
            break;

        case PatternKind::OUT_NEIGHBOR:
            for (const auto& edge : graph_->GetOutgoingEdges(anchor.AsNode().id, pattern.edge_type)) {
                selected.emplace(EntityRef::Node(edge.target), edge);
            }
            break;

        case PatternKind::IN_NEIGHBOR:
            for (const auto& edge : graph_->GetIncomingEdges(anchor.AsNode().id, pattern.edge_type)) {
                selected.emplace(EntityRef::Node(edge.source), edge);
            }
            break;

        case PatternKind::OUT_EDGE:
            for (const auto& edge : graph_->GetOutgoingEdges(anchor.AsNode().id, pattern.edge_type)) {
                selected.emplace(EntityRef(edge), std::nullopt);
            }
            break;

        case PatternKind::IN_EDGE:
            for (const auto& edge : graph_->GetIncomingEdges(anchor.AsNode().id, pattern.edge_type)) {
                selected.emplace(EntityRef(edge), std::nullopt);
            }
            break;

        case PatternKind::SOURCE:
            selected.emplace(EntityRef::Node(anchor.AsEdge().source), anchor.AsEdge());
            break;

        case PatternKind::TARGET:
            selected.emplace(EntityRef::Node(anchor.AsEdge().target), anchor.AsEdge());
            break;
    }

    return selected;
}

std::vector<FactMatch> FactStore::MatchClause(const FactPattern& pattern,
                                              const EntityRef& anchor,
                                              Timestep t) const {
    std::map<FactKey, FactMatch> matches;
    for (const auto& [entity, via] : SelectEntities(pattern, anchor)) {
        CollectMatch(entity, pattern, t, via, matches);
    }

    std::vector<FactMatch> result;
    result.reserve(matches.size());
    for (auto& [key, match] : matches) {
        result.push_back(std::move(match));
    }
    return result;
}

FactCounts FactStore::CountPattern(const FactPattern& pattern,
                                   const EntityRef& anchor,
                                   Timestep t) const {
    FactCounts counts;
    for (const auto& [entity, via] : SelectEntities(pattern, anchor)) {
        ++counts.total;
        if (FindVersion(FactKey{entity, pattern.label}, t)) {
            ++counts.available;
        }
    }
    return counts;
}

// ============================================================================
// Snapshots
// ============================================================================

std::map<FactKey, Interval> FactStore::Snapshot(Timestep t) const {
    std::map<FactKey, Interval> result;
    for (const auto& [key, versions] : facts_) {
        const Version* version = FindVersion(key, t);
        if (version) {
            result.emplace_hint(result.end(), key, version->interval);
        }
    }
    return result;
}

std::vector<std::pair<Timestep, Interval>> FactStore::GetHistory(const FactKey& key) const {
    std::vector<std::pair<Timestep, Interval>> history;
    auto it = facts_.find(key);
    if (it == facts_.end()) {
        return history;
    }
    for (const auto& version : it->second) {
        history.emplace_back(version.timestep, version.interval);
    }
    return history;
}

} // namespace lexreason
