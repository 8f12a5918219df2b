// File: src/export/interpretation_exporter.cpp
#include "export/interpretation_exporter.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace lexreason {

namespace {

Json::Value EntityToJson(const EntityRef& entity) {
    Json::Value j(Json::objectValue);
    j["kind"] = ToString(entity.kind());
    if (entity.IsNode()) {
        j["id"] = entity.AsNode().id;
    } else {
        const EdgeRef& edge = entity.AsEdge();
        j["source"] = edge.source;
        j["target"] = edge.target;
        j["type"] = edge.type;
    }
    return j;
}

Json::Value KeyToJson(const FactKey& key) {
    Json::Value j(Json::objectValue);
    j["entity"] = EntityToJson(key.entity);
    j["label"] = key.label;
    return j;
}

Json::Value IntervalToJson(const Interval& interval) {
    Json::Value j(Json::arrayValue);
    j.append(interval.lower());
    j.append(interval.upper());
    return j;
}

Json::Value RecordToJson(const DerivationRecord& record, const std::set<std::string>& blocked) {
    Json::Value premises(Json::arrayValue);
    for (const auto& premise : record.premises) {
        if (blocked.count(premise.key.label) > 0) {
            continue;
        }
        Json::Value p = KeyToJson(premise.key);
        p["version"] = static_cast<Json::UInt>(premise.version);
        premises.append(p);
    }

    Json::Value j(Json::objectValue);
    j["id"] = static_cast<Json::UInt64>(record.id);
    j["rule_id"] = record.rule_id;
    j["head"] = KeyToJson(record.head);
    j["timestep"] = static_cast<Json::UInt>(record.timestep);
    j["interval"] = IntervalToJson(record.interval);
    j["prior"] = record.prior ? IntervalToJson(*record.prior) : Json::Value(Json::nullValue);
    j["premises"] = premises;
    j["supersede"] = record.supersede;
    return j;
}

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

void ApplyAction(Json::Value& value, RedactionAction action, size_t truncate_length) {
    switch (action) {
        case RedactionAction::HASH:
            value = InterpretationExporter::ContentHash(value);
            break;
        case RedactionAction::TRUNCATE:
            if (value.isString()) {
                std::string s = value.asString();
                if (s.size() > truncate_length) {
                    value = s.substr(0, truncate_length);
                }
            } else if (value.isArray() && value.size() > truncate_length) {
                value.resize(static_cast<Json::ArrayIndex>(truncate_length));
            }
            break;
        case RedactionAction::DROP:
            // Handled by the parent, which owns the key
            break;
    }
}

void ApplyAtPath(Json::Value& node, const std::vector<std::string>& parts, size_t index,
                 RedactionAction action, size_t truncate_length) {
    if (node.isArray()) {
        for (auto& element : node) {
            ApplyAtPath(element, parts, index, action, truncate_length);
        }
        return;
    }
    if (!node.isObject() || !node.isMember(parts[index])) {
        return;
    }

    if (index + 1 < parts.size()) {
        ApplyAtPath(node[parts[index]], parts, index + 1, action, truncate_length);
    } else if (action == RedactionAction::DROP) {
        node.removeMember(parts[index]);
    } else {
        ApplyAction(node[parts[index]], action, truncate_length);
    }
}

std::string Write(const Json::Value& value, const char* indentation) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = indentation;
    return Json::writeString(builder, value);
}

} // namespace

// ============================================================================
// Hashing
// ============================================================================

std::string InterpretationExporter::Compact(const Json::Value& value) {
    return Write(value, "");
}

std::string InterpretationExporter::ContentHash(const Json::Value& value) {
    const std::string data = Compact(value);
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }

    std::ostringstream oss;
    oss << "sha256:" << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

// ============================================================================
// Document Construction
// ============================================================================

void InterpretationExporter::ApplyFieldActions(Json::Value& document, const RedactionProfile& profile) {
    for (const auto& [path, action] : profile.fields) {
        auto parts = SplitPath(path);
        if (parts.empty()) {
            continue;
        }
        ApplyAtPath(document, parts, 0, action, profile.truncate_length);
    }
}

Json::Value InterpretationExporter::BuildDocument(const Interpretation& interpretation,
                                                  const std::string& profile_name) const {
    const RedactionProfile& profile = profiles_.Get(profile_name);
    const auto& blocked = profile.blocked_labels;
    const Timestep timestep = interpretation.timestep();

    Json::Value document(Json::objectValue);
    document["profile"] = profile.name;
    document["timestep"] = static_cast<Json::UInt>(timestep);

    Json::Value facts(Json::arrayValue);
    for (const auto& [key, interval] : interpretation.facts()) {
        if (blocked.count(key.label) > 0) {
            continue;
        }
        Json::Value fact = KeyToJson(key);
        fact["lower"] = interval.lower();
        fact["upper"] = interval.upper();
        facts.append(fact);
    }
    document["facts"] = facts;

    if (profile.include_derivations) {
        Json::Value derivations(Json::arrayValue);
        Json::Value diagnostics(Json::arrayValue);
        Json::Value trace(Json::arrayValue);

        if (const DerivationLog* log = interpretation.derivations()) {
            for (const auto& record : log->GetRecords()) {
                if (record.timestep > timestep || blocked.count(record.head.label) > 0) {
                    continue;
                }
                derivations.append(RecordToJson(record, blocked));
            }
            for (const auto& failure : log->GetFailures()) {
                if (failure.timestep >= timestep) {
                    continue;
                }
                Json::Value entry(Json::objectValue);
                entry["rule_id"] = failure.rule_id;
                entry["target"] = EntityToJson(failure.target);
                entry["timestep"] = static_cast<Json::UInt>(failure.timestep);
                entry["reason"] = failure.reason;
                diagnostics.append(entry);
            }
            for (const auto& event : log->GetTrace()) {
                if (event.timestep >= timestep || blocked.count(event.head.label) > 0) {
                    continue;
                }
                Json::Value entry(Json::objectValue);
                entry["timestep"] = static_cast<Json::UInt>(event.timestep);
                entry["rule_id"] = event.rule_id;
                entry["head"] = KeyToJson(event.head);
                entry["proposed"] = IntervalToJson(event.proposed);
                entry["applied"] = event.applied;
                trace.append(entry);
            }
        }

        document["derivations"] = derivations;
        document["diagnostics"] = diagnostics;
        document["trace"] = trace;
    }

    ApplyFieldActions(document, profile);
    return document;
}

// ============================================================================
// Serialization
// ============================================================================

std::string InterpretationExporter::Export(const Interpretation& interpretation,
                                           const std::string& profile_name) const {
    return Write(BuildDocument(interpretation, profile_name), "  ");
}

std::string InterpretationExporter::Export(const RunResult& result,
                                           const std::string& profile_name) const {
    Json::Value document = BuildDocument(result.interpretation, profile_name);
    document["status"] = ToString(result.status);
    document["steps"] = static_cast<Json::UInt>(result.steps);
    return Write(document, "  ");
}

std::string InterpretationExporter::ExportFactsJsonl(const Interpretation& interpretation,
                                                     const std::string& profile_name) const {
    Json::Value document = BuildDocument(interpretation, profile_name);

    std::ostringstream oss;
    if (document.isMember("facts")) {
        for (const auto& fact : document["facts"]) {
            oss << Compact(fact) << "\n";
        }
    }
    return oss.str();
}

} // namespace lexreason
