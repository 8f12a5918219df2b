// File: src/graph/graph_loader.cpp
#include "graph/graph_loader.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace lexreason {

GraphLoader::GraphLoader()
    : GraphLoader(Config{}) {}

GraphLoader::GraphLoader(const Config& config)
    : config_(config) {}

bool GraphLoader::IsTruthy(const std::string& value) {
    std::string s;
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (s.empty()) {
        return false;
    }
    return s != "false" && s != "no" && s != "n" && s != "0" &&
           s != "none" && s != "null";
}

std::optional<Interval> GraphLoader::ToInterval(const AttributeValue& value) {
    if (std::holds_alternative<bool>(value)) {
        return std::get<bool>(value) ? Interval::Point(1.0) : Interval::Point(0.0);
    }
    if (std::holds_alternative<double>(value)) {
        double v = std::get<double>(value);
        if (!(v >= 0.0 && v <= 1.0)) {
            throw std::invalid_argument("Numeric fact value must be in [0,1], got " +
                                        std::to_string(v));
        }
        return Interval::Point(v);
    }
    if (std::holds_alternative<std::string>(value)) {
        if (IsTruthy(std::get<std::string>(value))) {
            return Interval::Point(1.0);
        }
        return std::nullopt;
    }
    const auto& [lower, upper] = std::get<std::pair<double, double>>(value);
    return Interval(lower, upper);
}

void GraphLoader::AddAttributes(TypedGraph& graph, const EntityRef& entity,
                                const std::map<std::string, AttributeValue>& attributes,
                                std::map<FactKey, Interval>& facts) const {
    for (const auto& [name, value] : attributes) {
        if (config_.numeric_attributes.count(name) > 0) {
            if (!std::holds_alternative<double>(value)) {
                throw std::invalid_argument("Attribute '" + name + "' of " + entity.ToString() +
                                            " must be numeric");
            }
            graph.SetAttribute(entity, name, std::get<double>(value));
            continue;
        }

        auto interval = ToInterval(value);
        if (!interval) {
            LogDebug("Skipping falsy attribute '" + name + "' on " + entity.ToString());
            continue;
        }
        facts[FactKey{entity, name}] = *interval;
    }
}

GraphLoader::Result GraphLoader::Load(const GraphSpec& spec) const {
    auto graph = std::make_shared<TypedGraph>();
    std::map<FactKey, Interval> facts;

    for (const auto& node : spec.nodes) {
        if (!graph->AddNode(node.id, node.type)) {
            throw std::invalid_argument("Duplicate node id: " + node.id);
        }
    }

    for (const auto& edge : spec.edges) {
        if (config_.create_missing_nodes) {
            graph->AddNode(edge.source);
            graph->AddNode(edge.target);
        }
        if (!graph->AddEdge(edge.source, edge.target, edge.type)) {
            LogDebug("Merging duplicate edge " + edge.source + " -> " + edge.target);
        }
    }

    // Attributes after structure, so duplicate edges merge their attributes
    for (const auto& node : spec.nodes) {
        AddAttributes(*graph, EntityRef::Node(node.id), node.attributes, facts);
    }
    for (const auto& edge : spec.edges) {
        AddAttributes(*graph, EntityRef::Edge(edge.source, edge.target, edge.type),
                      edge.attributes, facts);
    }

    Result result;
    result.graph = graph;
    result.facts.reserve(facts.size());
    for (const auto& [key, interval] : facts) {
        result.facts.push_back(InitialFact{key, interval, config_.static_facts});
    }

    LogDebug("Loaded " + graph->ToString() + " with " +
             std::to_string(result.facts.size()) + " initial facts");
    return result;
}

void GraphLoader::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[GraphLoader] " << message << std::endl;
    }
}

} // namespace lexreason
