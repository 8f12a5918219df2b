// File: src/graph/typed_graph.cpp
#include "graph/typed_graph.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace lexreason {

// ============================================================================
// Construction
// ============================================================================

bool TypedGraph::AddNode(const NodeId& id, const std::string& type) {
    if (id.empty()) {
        throw std::invalid_argument("Node id must not be empty");
    }
    return nodes_.emplace(id, type).second;
}

bool TypedGraph::AddEdge(const NodeId& source, const NodeId& target, const std::string& type) {
    if (!HasNode(source) || !HasNode(target)) {
        throw std::invalid_argument("Edge endpoints must be existing nodes: " +
                                    source + " -> " + target);
    }

    EdgeRef edge{source, target, type};
    if (!edges_.insert(edge).second) {
        return false;
    }

    outgoing_[source].insert(edge);
    incoming_[target].insert(edge);
    type_index_[type].insert(edge);
    return true;
}

void TypedGraph::SetAttribute(const EntityRef& entity, const std::string& name, double value) {
    if (!HasEntity(entity)) {
        throw std::invalid_argument("Unknown entity for attribute '" + name + "': " +
                                    entity.ToString());
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Attribute '" + name + "' must be finite");
    }
    attributes_[entity][name] = value;
}

// ============================================================================
// Lookup Operations
// ============================================================================

bool TypedGraph::HasNode(const NodeId& id) const {
    return nodes_.count(id) > 0;
}

bool TypedGraph::HasEdge(const EdgeRef& edge) const {
    return edges_.count(edge) > 0;
}

bool TypedGraph::HasEntity(const EntityRef& entity) const {
    return entity.IsNode() ? HasNode(entity.AsNode().id) : HasEdge(entity.AsEdge());
}

std::optional<std::string> TypedGraph::GetNodeType(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> TypedGraph::GetEntityType(const EntityRef& entity) const {
    if (entity.IsNode()) {
        return GetNodeType(entity.AsNode().id);
    }
    if (!HasEdge(entity.AsEdge())) {
        return std::nullopt;
    }
    return entity.AsEdge().type;
}

std::optional<double> TypedGraph::GetAttribute(const EntityRef& entity,
                                               const std::string& name) const {
    auto it = attributes_.find(entity);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    auto attr_it = it->second.find(name);
    if (attr_it == it->second.end()) {
        return std::nullopt;
    }
    return attr_it->second;
}

std::vector<NodeId> TypedGraph::GetNodes() const {
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& [id, type] : nodes_) {
        result.push_back(id);
    }
    return result;
}

std::vector<EdgeRef> TypedGraph::GetEdges() const {
    return std::vector<EdgeRef>(edges_.begin(), edges_.end());
}

std::vector<EdgeRef> TypedGraph::GetOutgoingEdges(const NodeId& id,
                                                  const std::string& edge_type) const {
    auto it = outgoing_.find(id);
    if (it == outgoing_.end()) {
        return {};
    }
    return FilterByType(it->second, edge_type);
}

std::vector<EdgeRef> TypedGraph::GetIncomingEdges(const NodeId& id,
                                                  const std::string& edge_type) const {
    auto it = incoming_.find(id);
    if (it == incoming_.end()) {
        return {};
    }
    return FilterByType(it->second, edge_type);
}

std::vector<EdgeRef> TypedGraph::GetEdgesByType(const std::string& edge_type) const {
    auto it = type_index_.find(edge_type);
    if (it == type_index_.end()) {
        return {};
    }
    return std::vector<EdgeRef>(it->second.begin(), it->second.end());
}

std::vector<EdgeRef> TypedGraph::FilterByType(const std::set<EdgeRef>& edges,
                                              const std::string& edge_type) {
    std::vector<EdgeRef> result;
    for (const auto& edge : edges) {
        if (edge_type.empty() || edge.type == edge_type) {
            result.push_back(edge);
        }
    }
    return result;
}

// ============================================================================
// Debugging
// ============================================================================

std::string TypedGraph::ToString() const {
    std::ostringstream oss;
    oss << "TypedGraph{nodes=" << nodes_.size()
        << ", edges=" << edges_.size()
        << ", edge_types=" << type_index_.size() << "}";
    return oss.str();
}

} // namespace lexreason
