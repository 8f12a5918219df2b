// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace lexreason {

/// Discrete evaluation step. Timestep 0 holds the initial facts.
using Timestep = uint32_t;

/// Graph node identifier
using NodeId = std::string;

/// Fact label (e.g. "controlling_relation", "support_for_breach")
using Label = std::string;

// TargetKind: Kind of entity a rule head derives facts for
enum class TargetKind : uint8_t {
    NODE = 0,
    EDGE = 1,
};

// Convert TargetKind to string
const char* ToString(TargetKind kind);

// Parse TargetKind from string
TargetKind ParseTargetKind(const std::string& str);

// ConvergenceStatus: Terminal state of an engine run
enum class ConvergenceStatus : uint8_t {
    CONVERGED = 0,   // Interpretation at t+1 identical to t
    EXHAUSTED = 1,   // Step budget reached without convergence
};

const char* ToString(ConvergenceStatus status);

// Parse ConvergenceStatus from string
ConvergenceStatus ParseConvergenceStatus(const std::string& str);

/// NodeRef: A node carrying facts
struct NodeRef {
    NodeId id;

    bool operator==(const NodeRef& other) const { return id == other.id; }
    bool operator<(const NodeRef& other) const { return id < other.id; }
};

/// EdgeRef: A directed, typed edge carrying facts
struct EdgeRef {
    NodeId source;
    NodeId target;
    std::string type;

    bool operator==(const EdgeRef& other) const {
        return source == other.source && target == other.target && type == other.type;
    }
    bool operator<(const EdgeRef& other) const;
};

/// EntityRef: Tagged reference to either a node or an edge
///
/// All fact addressing goes through this type; accessors throw
/// std::bad_variant_access when the wrong alternative is requested.
class EntityRef {
public:
    EntityRef() : value_(NodeRef{}) {}
    EntityRef(NodeRef node) : value_(std::move(node)) {}
    EntityRef(EdgeRef edge) : value_(std::move(edge)) {}

    static EntityRef Node(NodeId id) { return EntityRef(NodeRef{std::move(id)}); }
    static EntityRef Edge(NodeId source, NodeId target, std::string type) {
        return EntityRef(EdgeRef{std::move(source), std::move(target), std::move(type)});
    }

    TargetKind kind() const {
        return std::holds_alternative<NodeRef>(value_) ? TargetKind::NODE : TargetKind::EDGE;
    }
    bool IsNode() const { return kind() == TargetKind::NODE; }
    bool IsEdge() const { return kind() == TargetKind::EDGE; }

    const NodeRef& AsNode() const { return std::get<NodeRef>(value_); }
    const EdgeRef& AsEdge() const { return std::get<EdgeRef>(value_); }

    bool operator==(const EntityRef& other) const { return value_ == other.value_; }
    bool operator!=(const EntityRef& other) const { return !(value_ == other.value_); }

    /// Nodes sort before edges; then by identifiers
    bool operator<(const EntityRef& other) const;

    /// "node(id)" or "edge(source->target:type)"
    std::string ToString() const;

    struct Hash {
        size_t operator()(const EntityRef& ref) const;
    };

private:
    std::variant<NodeRef, EdgeRef> value_;
};

/// FactKey: (entity, label) address of a fact
struct FactKey {
    EntityRef entity;
    Label label;

    bool operator==(const FactKey& other) const {
        return entity == other.entity && label == other.label;
    }
    bool operator!=(const FactKey& other) const { return !(*this == other); }
    bool operator<(const FactKey& other) const {
        if (entity != other.entity) return entity < other.entity;
        return label < other.label;
    }

    /// "label(node-id)" or "label(source,target:type)"
    std::string ToString() const;

    struct Hash {
        size_t operator()(const FactKey& key) const;
    };
};

} // namespace lexreason

namespace std {
    template<>
    struct hash<lexreason::EntityRef> {
        size_t operator()(const lexreason::EntityRef& ref) const {
            return lexreason::EntityRef::Hash()(ref);
        }
    };
    template<>
    struct hash<lexreason::FactKey> {
        size_t operator()(const lexreason::FactKey& key) const {
            return lexreason::FactKey::Hash()(key);
        }
    };
}
