// File: src/graph/typed_graph.hpp
#pragma once

#include "core/types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexreason {

/// TypedGraph: Directed graph of typed nodes and typed edges
///
/// Storage combines:
/// - Ordered node table (id -> node type)
/// - Outgoing and incoming edge indices per node
/// - Type index for filtering edges by type
/// - Numeric attributes per node/edge (e.g. precedent weights)
///
/// Every index is ordered, so iteration order depends only on the graph
/// contents. The graph is built once at load time and then shared read-only
/// by engine runs; it performs no locking.
class TypedGraph {
public:
    TypedGraph() = default;

    // ========================================================================
    // Construction
    // ========================================================================

    /// Add a node (returns false if the id already exists)
    bool AddNode(const NodeId& id, const std::string& type = "");

    /// Add a typed edge between existing nodes (returns false if it already exists)
    /// @throws std::invalid_argument if either endpoint is unknown
    bool AddEdge(const NodeId& source, const NodeId& target, const std::string& type);

    /// Attach a numeric attribute to a node or edge, replacing any previous value
    /// @throws std::invalid_argument if the entity is not in the graph
    void SetAttribute(const EntityRef& entity, const std::string& name, double value);

    // ========================================================================
    // Lookup Operations
    // ========================================================================

    bool HasNode(const NodeId& id) const;
    bool HasEdge(const EdgeRef& edge) const;
    bool HasEntity(const EntityRef& entity) const;

    /// Node type ("" when the node was added untyped)
    std::optional<std::string> GetNodeType(const NodeId& id) const;

    /// Type of an entity: node type for nodes, edge type for edges
    std::optional<std::string> GetEntityType(const EntityRef& entity) const;

    std::optional<double> GetAttribute(const EntityRef& entity, const std::string& name) const;

    /// All node ids in ascending order
    std::vector<NodeId> GetNodes() const;

    /// All edges in ascending (source, target, type) order
    std::vector<EdgeRef> GetEdges() const;

    /// Outgoing edges of a node, optionally restricted to one edge type
    /// @param edge_type Empty string matches every type
    std::vector<EdgeRef> GetOutgoingEdges(const NodeId& id, const std::string& edge_type = "") const;

    /// Incoming edges of a node, optionally restricted to one edge type
    std::vector<EdgeRef> GetIncomingEdges(const NodeId& id, const std::string& edge_type = "") const;

    std::vector<EdgeRef> GetEdgesByType(const std::string& edge_type) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    size_t NodeCount() const { return nodes_.size(); }
    size_t EdgeCount() const { return edges_.size(); }

    std::string ToString() const;

private:
    // Node id -> node type
    std::map<NodeId, std::string> nodes_;

    std::set<EdgeRef> edges_;

    // Indices
    std::map<NodeId, std::set<EdgeRef>> outgoing_;
    std::map<NodeId, std::set<EdgeRef>> incoming_;
    std::map<std::string, std::set<EdgeRef>> type_index_;

    std::map<EntityRef, std::map<std::string, double>> attributes_;

    static std::vector<EdgeRef> FilterByType(const std::set<EdgeRef>& edges,
                                             const std::string& edge_type);
};

} // namespace lexreason
