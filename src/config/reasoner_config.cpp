// File: src/config/reasoner_config.cpp
//
// YAML Configuration Implementation for the lexreason engine

#include "config/reasoner_config.hpp"
#include "core/errors.hpp"
#include <yaml.h>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace lexreason {

namespace {

// ============================================================================
// Document Walking Helpers
// ============================================================================

/// Collects errors while walking a loaded libyaml document
class DocumentReader {
public:
    explicit DocumentReader(yaml_document_t* document) : document_(document) {}

    std::vector<std::string>& errors() { return errors_; }

    yaml_node_t* Node(int index) const {
        return yaml_document_get_node(document_, index);
    }

    bool IsMapping(yaml_node_t* node) const { return node && node->type == YAML_MAPPING_NODE; }
    bool IsSequence(yaml_node_t* node) const { return node && node->type == YAML_SEQUENCE_NODE; }
    bool IsScalar(yaml_node_t* node) const { return node && node->type == YAML_SCALAR_NODE; }

    static std::string Scalar(yaml_node_t* node) {
        return std::string(reinterpret_cast<char*>(node->data.scalar.value),
                           node->data.scalar.length);
    }

    /// Key/value pairs of a mapping node; reports non-scalar keys
    std::vector<std::pair<std::string, yaml_node_t*>> Pairs(yaml_node_t* node, const std::string& path) {
        std::vector<std::pair<std::string, yaml_node_t*>> pairs;
        if (!IsMapping(node)) {
            errors_.push_back(path + " must be a mapping");
            return pairs;
        }
        for (yaml_node_pair_t* pair = node->data.mapping.pairs.start;
             pair < node->data.mapping.pairs.top; ++pair) {
            yaml_node_t* key = Node(pair->key);
            if (!IsScalar(key)) {
                errors_.push_back(path + " has a non-scalar key");
                continue;
            }
            pairs.emplace_back(Scalar(key), Node(pair->value));
        }
        return pairs;
    }

    /// Scalar items of a sequence node
    std::vector<std::string> StringList(yaml_node_t* node, const std::string& path) {
        std::vector<std::string> items;
        if (!IsSequence(node)) {
            errors_.push_back(path + " must be a list");
            return items;
        }
        for (yaml_node_item_t* item = node->data.sequence.items.start;
             item < node->data.sequence.items.top; ++item) {
            yaml_node_t* value = Node(*item);
            if (!IsScalar(value)) {
                errors_.push_back(path + " must contain only scalars");
                continue;
            }
            items.push_back(Scalar(value));
        }
        return items;
    }

    bool GetString(yaml_node_t* node, const std::string& path, std::string& out) {
        if (!IsScalar(node)) {
            errors_.push_back(path + " must be a scalar");
            return false;
        }
        out = Scalar(node);
        return true;
    }

    bool GetDouble(yaml_node_t* node, const std::string& path, double& out) {
        std::string text;
        if (!GetString(node, path, text)) {
            return false;
        }
        char* end = nullptr;
        errno = 0;
        double value = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
            errors_.push_back(path + " must be a number, got '" + text + "'");
            return false;
        }
        out = value;
        return true;
    }

    bool GetUnsigned(yaml_node_t* node, const std::string& path, unsigned long long& out) {
        std::string text;
        if (!GetString(node, path, text)) {
            return false;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long long value = std::strtoull(text.c_str(), &end, 10);
        if (text.empty() || text.front() == '-' || end != text.c_str() + text.size() ||
            errno == ERANGE) {
            errors_.push_back(path + " must be a non-negative integer, got '" + text + "'");
            return false;
        }
        out = value;
        return true;
    }

    /// Unsigned integer that must also fit the destination type
    template <typename T>
    bool GetCount(yaml_node_t* node, const std::string& path, T& out) {
        unsigned long long value = 0;
        if (!GetUnsigned(node, path, value)) {
            return false;
        }
        if (value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            errors_.push_back(path + " out of range, got " + std::to_string(value));
            return false;
        }
        out = static_cast<T>(value);
        return true;
    }

    bool GetBool(yaml_node_t* node, const std::string& path, bool& out) {
        std::string text;
        if (!GetString(node, path, text)) {
            return false;
        }
        if (text == "true" || text == "True" || text == "TRUE" || text == "yes" ||
            text == "Yes" || text == "on" || text == "1") {
            out = true;
            return true;
        }
        if (text == "false" || text == "False" || text == "FALSE" || text == "no" ||
            text == "No" || text == "off" || text == "0") {
            out = false;
            return true;
        }
        errors_.push_back(path + " must be a boolean, got '" + text + "'");
        return false;
    }

    void UnknownKey(const std::string& path) {
        errors_.push_back("unknown key " + path);
    }

private:
    yaml_document_t* document_;
    std::vector<std::string> errors_;
};

/// Parse an enum-keyed numeric table, replacing the target table
template <typename Enum, typename ParseFn>
void ReadTable(DocumentReader& reader, yaml_node_t* node, const std::string& path,
               ParseFn parse, std::map<Enum, double>& table) {
    std::map<Enum, double> parsed;
    for (const auto& [key, value] : reader.Pairs(node, path)) {
        auto parsed_key = parse(key);
        if (!parsed_key) {
            reader.errors().push_back(path + " has unknown key '" + key + "'");
            continue;
        }
        double number = 0.0;
        if (reader.GetDouble(value, path + "." + key, number)) {
            parsed[*parsed_key] = number;
        }
    }
    table = parsed;
}

void ReadEngine(DocumentReader& reader, yaml_node_t* node, FixedPointEngine::Config& engine) {
    for (const auto& [key, value] : reader.Pairs(node, "engine")) {
        const std::string path = "engine." + key;
        std::string text;

        if (key == "tmax") {
            reader.GetCount(value, path, engine.tmax);
        } else if (key == "num_threads") {
            reader.GetCount(value, path, engine.num_threads);
        } else if (key == "convergence_threshold") {
            size_t threshold = 0;
            if (reader.GetCount(value, path, threshold)) engine.convergence_threshold = threshold;
        } else if (key == "convergence_bound_threshold") {
            double threshold = 0.0;
            if (reader.GetDouble(value, path, threshold)) engine.convergence_bound_threshold = threshold;
        } else if (key == "update_mode") {
            if (reader.GetString(value, path, text)) {
                try {
                    engine.update_mode = ParseUpdateMode(text);
                } catch (const ConfigError&) {
                    reader.errors().push_back(path + " must be intersect or strict, got '" + text + "'");
                }
            }
        }
        else if (key == "retain_snapshots") reader.GetBool(value, path, engine.retain_snapshots);
        else if (key == "record_trace") reader.GetBool(value, path, engine.record_trace);
        else if (key == "time_origin") reader.GetDouble(value, path, engine.time_origin);
        else if (key == "time_step") reader.GetDouble(value, path, engine.time_step);
        else if (key == "debug_logging") reader.GetBool(value, path, engine.debug_logging);
        else reader.UnknownKey(path);
    }
}

void ReadAuthority(DocumentReader& reader, yaml_node_t* node,
                   AuthorityMultiplierCalculator::Config& authority) {
    for (const auto& [key, value] : reader.Pairs(node, "authority")) {
        const std::string path = "authority." + key;

        if (key == "recency") {
            for (const auto& [rkey, rvalue] : reader.Pairs(value, path)) {
                if (rkey == "half_life_years") reader.GetDouble(rvalue, path + "." + rkey, authority.half_life_years);
                else if (rkey == "min_multiplier") reader.GetDouble(rvalue, path + "." + rkey, authority.min_multiplier);
                else reader.UnknownKey(path + "." + rkey);
            }
        } else if (key == "treatment_modifier") {
            ReadTable(reader, value, path, ParseTreatment, authority.treatment_modifier);
        } else if (key == "jurisdiction_alignment") {
            ReadTable(reader, value, path, ParseJurisdictionAlignment, authority.jurisdiction_alignment);
        } else if (key == "court_levels") {
            ReadTable(reader, value, path, ParseCourtLevel, authority.court_levels);
        } else if (key == "jurisdiction_hierarchy") {
            authority.jurisdiction_hierarchy.clear();
            for (const auto& [jurisdiction, parents] : reader.Pairs(value, path)) {
                authority.jurisdiction_hierarchy[jurisdiction] =
                    reader.StringList(parents, path + "." + jurisdiction);
            }
        } else if (key == "debug_logging") {
            reader.GetBool(value, path, authority.debug_logging);
        } else {
            reader.UnknownKey(path);
        }
    }
}

RedactionProfile ReadProfile(DocumentReader& reader, const std::string& name, yaml_node_t* node) {
    RedactionProfile profile;
    profile.name = name;
    const std::string base = "export.profiles." + name;

    for (const auto& [key, value] : reader.Pairs(node, base)) {
        const std::string path = base + "." + key;

        if (key == "include_derivations") {
            reader.GetBool(value, path, profile.include_derivations);
        } else if (key == "truncate_length") {
            reader.GetCount(value, path, profile.truncate_length);
        } else if (key == "blocked_labels") {
            for (const auto& label : reader.StringList(value, path)) {
                profile.blocked_labels.insert(label);
            }
        } else if (key == "fields") {
            for (const auto& [field, action_node] : reader.Pairs(value, path)) {
                std::string text;
                if (!reader.GetString(action_node, path + "." + field, text)) {
                    continue;
                }
                auto action = ParseRedactionAction(text);
                if (!action) {
                    reader.errors().push_back(path + "." + field +
                                              " must be drop, hash or truncate, got '" + text + "'");
                    continue;
                }
                profile.fields[field] = *action;
            }
        } else {
            reader.UnknownKey(path);
        }
    }

    return profile;
}

void ReadExport(DocumentReader& reader, yaml_node_t* node, std::vector<RedactionProfile>& profiles) {
    for (const auto& [key, value] : reader.Pairs(node, "export")) {
        if (key == "profiles") {
            profiles.clear();
            for (const auto& [name, profile_node] : reader.Pairs(value, "export.profiles")) {
                profiles.push_back(ReadProfile(reader, name, profile_node));
            }
        } else {
            reader.UnknownKey("export." + key);
        }
    }
}

const char* BoolString(bool value) {
    return value ? "true" : "false";
}

/// Shortest decimal form that reads back as the same double
std::string NumberString(double value) {
    std::ostringstream oss;
    for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        oss.str("");
        oss << std::setprecision(precision) << value;
        if (std::strtod(oss.str().c_str(), nullptr) == value) {
            break;
        }
    }
    return oss.str();
}

/// YAML double-quoted scalar
std::string Quoted(const std::string& text) {
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : text) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\t': oss << "\\t"; break;
            case '\r': oss << "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

std::optional<ReasonerConfig> ReasonerConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<ReasonerConfig> ReasonerConfig::LoadFromString(const std::string& yaml_content) {
    try {
        return ParseOrThrow(yaml_content);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : e.errors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }
}

ReasonerConfig ReasonerConfig::LoadOrThrow(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("failed to open config file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return ParseOrThrow(buffer.str());
}

ReasonerConfig ReasonerConfig::ParseOrThrow(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_document_t document;

    if (!yaml_parser_initialize(&parser)) {
        throw ConfigError("failed to initialize YAML parser");
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    if (!yaml_parser_load(&parser, &document)) {
        std::string problem = parser.problem ? parser.problem : "unknown error";
        size_t line = parser.problem_mark.line + 1;
        yaml_parser_delete(&parser);
        throw ConfigError("YAML parse error at line " + std::to_string(line) + ": " + problem);
    }

    ReasonerConfig config = Default();
    DocumentReader reader(&document);

    // An empty document yields no root node and keeps the defaults
    yaml_node_t* root = yaml_document_get_root_node(&document);
    if (root) {
        for (const auto& [section, node] : reader.Pairs(root, "document")) {
            if (section == "engine") ReadEngine(reader, node, config.engine);
            else if (section == "authority") ReadAuthority(reader, node, config.authority);
            else if (section == "export") ReadExport(reader, node, config.export_profiles);
            else reader.UnknownKey(section);
        }
    }

    std::vector<std::string> errors = reader.errors();
    yaml_document_delete(&document);
    yaml_parser_delete(&parser);

    auto validation = config.GetValidationErrors();
    errors.insert(errors.end(), validation.begin(), validation.end());
    if (!errors.empty()) {
        throw ConfigError(errors);
    }

    return config;
}

// ============================================================================
// Saving
// ============================================================================

bool ReasonerConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string ReasonerConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# lexreason configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "engine:\n";
    ss << "  tmax: " << engine.tmax << "\n";
    ss << "  update_mode: \"" << ToString(engine.update_mode) << "\"\n";
    ss << "  num_threads: " << engine.num_threads << "\n";
    ss << "  retain_snapshots: " << BoolString(engine.retain_snapshots) << "\n";
    ss << "  record_trace: " << BoolString(engine.record_trace) << "\n";
    ss << "  time_origin: " << NumberString(engine.time_origin) << "\n";
    ss << "  time_step: " << NumberString(engine.time_step) << "\n";
    if (engine.convergence_threshold) {
        ss << "  convergence_threshold: " << *engine.convergence_threshold << "\n";
    }
    if (engine.convergence_bound_threshold) {
        ss << "  convergence_bound_threshold: " << NumberString(*engine.convergence_bound_threshold) << "\n";
    }
    ss << "  debug_logging: " << BoolString(engine.debug_logging) << "\n\n";

    ss << "authority:\n";
    ss << "  recency:\n";
    ss << "    half_life_years: " << NumberString(authority.half_life_years) << "\n";
    ss << "    min_multiplier: " << NumberString(authority.min_multiplier) << "\n";
    ss << "  treatment_modifier:\n";
    for (const auto& [treatment, value] : authority.treatment_modifier) {
        ss << "    " << ToString(treatment) << ": " << NumberString(value) << "\n";
    }
    ss << "  jurisdiction_alignment:\n";
    for (const auto& [alignment, value] : authority.jurisdiction_alignment) {
        ss << "    " << ToString(alignment) << ": " << NumberString(value) << "\n";
    }
    ss << "  court_levels:\n";
    for (const auto& [level, value] : authority.court_levels) {
        ss << "    " << ToString(level) << ": " << NumberString(value) << "\n";
    }
    if (authority.jurisdiction_hierarchy.empty()) {
        ss << "  jurisdiction_hierarchy: {}\n";
    } else {
        ss << "  jurisdiction_hierarchy:\n";
        for (const auto& [jurisdiction, parents] : authority.jurisdiction_hierarchy) {
            ss << "    " << Quoted(jurisdiction) << ": [";
            for (size_t i = 0; i < parents.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << Quoted(parents[i]);
            }
            ss << "]\n";
        }
    }
    ss << "  debug_logging: " << BoolString(authority.debug_logging) << "\n\n";

    ss << "export:\n";
    if (export_profiles.empty()) {
        ss << "  profiles: {}\n";
        return ss.str();
    }
    ss << "  profiles:\n";
    for (const auto& profile : export_profiles) {
        ss << "    " << Quoted(profile.name) << ":\n";
        ss << "      include_derivations: " << BoolString(profile.include_derivations) << "\n";
        ss << "      truncate_length: " << profile.truncate_length << "\n";
        ss << "      blocked_labels: [";
        size_t i = 0;
        for (const auto& label : profile.blocked_labels) {
            if (i++ > 0) ss << ", ";
            ss << Quoted(label);
        }
        ss << "]\n";
        if (profile.fields.empty()) {
            ss << "      fields: {}\n";
        } else {
            ss << "      fields:\n";
            for (const auto& [path, action] : profile.fields) {
                ss << "        " << Quoted(path) << ": " << ToString(action) << "\n";
            }
        }
    }

    return ss.str();
}

// ============================================================================
// Validation
// ============================================================================

bool ReasonerConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> ReasonerConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    for (const auto& error : engine.GetValidationErrors()) {
        errors.push_back("engine: " + error);
    }
    for (const auto& error : authority.GetValidationErrors()) {
        errors.push_back("authority: " + error);
    }

    std::set<std::string> names;
    for (const auto& profile : export_profiles) {
        for (const auto& error : profile.GetValidationErrors()) {
            errors.push_back("export: " + error);
        }
        if (!names.insert(profile.name).second) {
            errors.push_back("export: duplicate profile '" + profile.name + "'");
        }
    }

    return errors;
}

ProfileRegistry ReasonerConfig::BuildProfileRegistry() const {
    ProfileRegistry registry;
    for (const auto& profile : export_profiles) {
        registry.Register(profile);
    }
    return registry;
}

ReasonerConfig ReasonerConfig::Default() {
    return ReasonerConfig{};  // Uses default member initializers
}

} // namespace lexreason
