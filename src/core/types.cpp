// File: src/core/types.cpp
#include "core/types.hpp"
#include <stdexcept>
#include <tuple>

namespace lexreason {

namespace {

size_t CombineHash(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace

// Enum implementations

const char* ToString(TargetKind kind) {
    switch (kind) {
        case TargetKind::NODE: return "node";
        case TargetKind::EDGE: return "edge";
        default: return "unknown";
    }
}

TargetKind ParseTargetKind(const std::string& str) {
    if (str == "node") return TargetKind::NODE;
    if (str == "edge") return TargetKind::EDGE;
    throw std::invalid_argument("Unknown TargetKind: " + str);
}

const char* ToString(ConvergenceStatus status) {
    switch (status) {
        case ConvergenceStatus::CONVERGED: return "converged";
        case ConvergenceStatus::EXHAUSTED: return "exhausted";
        default: return "unknown";
    }
}

ConvergenceStatus ParseConvergenceStatus(const std::string& str) {
    if (str == "converged") return ConvergenceStatus::CONVERGED;
    if (str == "exhausted") return ConvergenceStatus::EXHAUSTED;
    throw std::invalid_argument("Unknown ConvergenceStatus: " + str);
}

// EdgeRef

bool EdgeRef::operator<(const EdgeRef& other) const {
    return std::tie(source, target, type) < std::tie(other.source, other.target, other.type);
}

// EntityRef

bool EntityRef::operator<(const EntityRef& other) const {
    if (kind() != other.kind()) {
        return kind() < other.kind();
    }
    if (IsNode()) {
        return AsNode() < other.AsNode();
    }
    return AsEdge() < other.AsEdge();
}

std::string EntityRef::ToString() const {
    if (IsNode()) {
        return "node(" + AsNode().id + ")";
    }
    const EdgeRef& e = AsEdge();
    return "edge(" + e.source + "->" + e.target + ":" + e.type + ")";
}

size_t EntityRef::Hash::operator()(const EntityRef& ref) const {
    std::hash<std::string> h;
    if (ref.IsNode()) {
        return CombineHash(0, h(ref.AsNode().id));
    }
    const EdgeRef& e = ref.AsEdge();
    size_t seed = CombineHash(1, h(e.source));
    seed = CombineHash(seed, h(e.target));
    return CombineHash(seed, h(e.type));
}

// FactKey

std::string FactKey::ToString() const {
    if (entity.IsNode()) {
        return label + "(" + entity.AsNode().id + ")";
    }
    const EdgeRef& e = entity.AsEdge();
    return label + "(" + e.source + "," + e.target + ":" + e.type + ")";
}

size_t FactKey::Hash::operator()(const FactKey& key) const {
    return CombineHash(EntityRef::Hash()(key.entity), std::hash<std::string>()(key.label));
}

} // namespace lexreason
