// File: src/graph/graph_loader.hpp
#pragma once

#include "core/interval.hpp"
#include "core/types.hpp"
#include "graph/fact_store.hpp"
#include "graph/typed_graph.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lexreason {

/// Typed attribute value of the graph exchange format:
/// boolean, number, string, or explicit [lower, upper] pair
using AttributeValue = std::variant<bool, double, std::string, std::pair<double, double>>;

/// NodeSpec: Parsed node record
struct NodeSpec {
    NodeId id;
    std::string type;
    std::map<std::string, AttributeValue> attributes;
};

/// EdgeSpec: Parsed edge record
struct EdgeSpec {
    NodeId source;
    NodeId target;
    std::string type;
    std::map<std::string, AttributeValue> attributes;
};

/// GraphSpec: Parsed node and edge lists
struct GraphSpec {
    std::vector<NodeSpec> nodes;
    std::vector<EdgeSpec> edges;
};

/// GraphLoader: Converts a parsed typed graph into a TypedGraph plus initial facts
///
/// Attribute keys become fact labels and attribute values become initial
/// intervals:
/// - number in [0,1]       -> point interval
/// - bool                  -> [1,1] or [0,0]
/// - truthy string         -> [1,1]; falsy strings are skipped
/// - [lower, upper] pair   -> that interval
///
/// Keys listed in Config::numeric_attributes are not facts: they are kept as
/// numeric graph attributes (precedent weights and similar annotations).
class GraphLoader {
public:
    struct Config {
        /// Attribute keys stored as numeric graph attributes instead of facts
        std::set<std::string> numeric_attributes;

        /// Create nodes referenced by edges but missing from the node list
        bool create_missing_nodes{false};

        /// Load attribute facts as static: rules never update them
        bool static_facts{false};

        /// Enable debug logging
        bool debug_logging{false};
    };

    struct Result {
        std::shared_ptr<const TypedGraph> graph;
        std::vector<InitialFact> facts;   // Ascending key order
    };

    GraphLoader();
    explicit GraphLoader(const Config& config);

    /// Build graph and initial facts
    /// @throws std::invalid_argument on an unknown edge endpoint, a duplicate
    ///         node id, an out-of-range number, or an invalid pair
    Result Load(const GraphSpec& spec) const;

    /// Convert one attribute value into an initial interval
    /// @return nullopt for values that do not denote a fact (falsy strings)
    /// @throws std::invalid_argument for numbers or pairs outside [0,1]
    static std::optional<Interval> ToInterval(const AttributeValue& value);

    /// Truthiness of a string attribute ("true", "yes", "1", other non-empty
    /// words are truthy; "false", "no", "0", "none", "null", "" are not)
    static bool IsTruthy(const std::string& value);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void AddAttributes(TypedGraph& graph, const EntityRef& entity,
                       const std::map<std::string, AttributeValue>& attributes,
                       std::map<FactKey, Interval>& facts) const;

    void LogDebug(const std::string& message) const;
};

} // namespace lexreason
