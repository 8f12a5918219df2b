// File: src/graph/fact_store.hpp
#pragma once

#include "core/interval.hpp"
#include "core/types.hpp"
#include "graph/typed_graph.hpp"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace lexreason {

// PatternKind: Where a clause looks for premise facts relative to an anchor entity
enum class PatternKind : uint8_t {
    SELF = 0,          // The anchor itself (node or edge)
    OUT_NEIGHBOR = 1,  // Target nodes of the anchor node's outgoing edges
    IN_NEIGHBOR = 2,   // Source nodes of the anchor node's incoming edges
    OUT_EDGE = 3,      // The anchor node's outgoing edges
    IN_EDGE = 4,       // The anchor node's incoming edges
    SOURCE = 5,        // Source node of the anchor edge
    TARGET = 6,        // Target node of the anchor edge
};

const char* ToString(PatternKind kind);

/// @throws std::invalid_argument for an unknown name
PatternKind ParsePatternKind(const std::string& str);

/// True if the pattern can be evaluated from an anchor of the given kind
bool IsPatternCompatible(PatternKind pattern, TargetKind anchor);

/// FactPattern: Graph query answered by the store
/// e.g. "all edges of type T from node N with label L and lower >= threshold"
struct FactPattern {
    PatternKind kind{PatternKind::SELF};
    Label label;
    std::string edge_type;   // Empty matches every edge type
    double min_lower{0.0};
};

/// FactMatch: One premise fact produced by a pattern query
struct FactMatch {
    FactKey key;
    Interval interval;
    Timestep version{0};            // Timestep at which this interval was written
    std::optional<EdgeRef> via;     // Connecting edge for neighbor patterns
};

/// FactCounts: How many entities a pattern selects around an anchor
struct FactCounts {
    size_t total{0};       // Entities the pattern reaches
    size_t available{0};   // Of those, entities carrying the label at t
};

/// InitialFact: A fact asserted at timestep 0
struct InitialFact {
    FactKey key;
    Interval interval;

    /// Static facts keep their initial interval; later updates skip them
    bool is_static{false};
};

/// FactStore: Versioned (entity, label) -> Interval assignment over a TypedGraph
///
/// Each fact keeps its history as an append-only list of (timestep, interval)
/// versions. A read at timestep t sees the latest version written at or
/// before t, so a fact that did not change carries forward unchanged.
///
/// Updates are checked against the monotonicity rule: a new version must be
/// contained in the previous one unless the caller marks it as an explicit
/// supersede. The store knows nothing about rules.
class FactStore {
public:
    /// @throws std::invalid_argument if graph is null
    explicit FactStore(std::shared_ptr<const TypedGraph> graph);

    const TypedGraph& graph() const { return *graph_; }
    std::shared_ptr<const TypedGraph> shared_graph() const { return graph_; }

    // ========================================================================
    // Fact Access
    // ========================================================================

    /// Interval of the fact as seen at timestep t
    std::optional<Interval> GetFact(const FactKey& key, Timestep t) const;

    std::optional<Interval> GetFact(const EntityRef& entity, const Label& label, Timestep t) const {
        return GetFact(FactKey{entity, label}, t);
    }

    /// Timestep of the version visible at t
    std::optional<Timestep> GetVersion(const FactKey& key, Timestep t) const;

    /// Write a fact version at timestep t
    /// @param supersede Replace the interval even if it is not a narrowing
    /// @return true if the visible interval changed
    /// @throws std::invalid_argument if the entity is not in the graph
    /// @throws InvariantViolation if the update widens the prior interval
    ///         without supersede, or t precedes the latest stored version
    bool SetFact(const FactKey& key, Timestep t, const Interval& interval, bool supersede = false);

    // ========================================================================
    // Pattern Queries
    // ========================================================================

    /// Premise facts selected by a pattern relative to an anchor, in
    /// ascending key order, deduplicated by key
    /// @throws std::invalid_argument if the pattern does not apply to the anchor kind
    std::vector<FactMatch> MatchClause(const FactPattern& pattern,
                                       const EntityRef& anchor,
                                       Timestep t) const;

    /// Entity counts behind a pattern, ignoring min_lower
    /// @throws std::invalid_argument if the pattern does not apply to the anchor kind
    FactCounts CountPattern(const FactPattern& pattern,
                            const EntityRef& anchor,
                            Timestep t) const;

    // ========================================================================
    // Snapshots
    // ========================================================================

    /// Every fact visible at timestep t, ordered by key
    std::map<FactKey, Interval> Snapshot(Timestep t) const;

    /// Full version history of one fact
    std::vector<std::pair<Timestep, Interval>> GetHistory(const FactKey& key) const;

    size_t FactCount() const { return facts_.size(); }

    /// Highest timestep any version was written at
    Timestep LatestTimestep() const { return latest_; }

private:
    struct Version {
        Timestep timestep;
        Interval interval;
    };

    std::shared_ptr<const TypedGraph> graph_;
    std::map<FactKey, std::vector<Version>> facts_;
    Timestep latest_{0};

    const Version* FindVersion(const FactKey& key, Timestep t) const;

    /// Entities a pattern reaches from an anchor, each with its connecting
    /// edge (neighbor and endpoint patterns), deduplicated in ascending order
    std::map<EntityRef, std::optional<EdgeRef>> SelectEntities(const FactPattern& pattern,
                                                               const EntityRef& anchor) const;

    /// Append a match for (entity, label) if visible at t and above min_lower
    void CollectMatch(const EntityRef& entity, const FactPattern& pattern, Timestep t,
                      const std::optional<EdgeRef>& via,
                      std::map<FactKey, FactMatch>& out) const;
};

} // namespace lexreason
