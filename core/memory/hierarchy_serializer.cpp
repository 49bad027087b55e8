#include "memory/hierarchy_serializer.hpp"
#include "memory/hierarchy_manager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace vita {

nlohmann::json HierarchySerializer::serialize(const MemoryHierarchyManager& manager) {
    nlohmann::json doc = {{"version", VERSION}};

    nlohmann::json semantic = {{"concepts", nlohmann::json::object()},
                               {"associations", nlohmann::json::array()}};
    if (auto store = manager.semanticStore()) {
        for (const auto& c : store->concepts()) {
            semantic["concepts"][c.concept_id] = conceptToJson(c);
        }
        for (const auto& a : store->associations()) {
            semantic["associations"].push_back(associationToJson(a));
        }
    }
    doc["semantic_store"] = semantic;

    nlohmann::json procedural = {{"patterns", nlohmann::json::object()},
                                 {"decision_patterns", nlohmann::json::array()}};
    if (auto store = manager.proceduralStore()) {
        for (const auto& p : store->patterns()) {
            procedural["patterns"][p.pattern_id] = patternToJson(p);
        }
        for (const auto& d : store->decisionPatterns()) {
            procedural["decision_patterns"].push_back(decisionToJson(d));
        }
    }
    doc["procedural_store"] = procedural;

    return doc;
}

void HierarchySerializer::deserialize(MemoryHierarchyManager& manager,
                                      const nlohmann::json& document) {
    std::vector<SemanticConcept> concepts;
    std::vector<SemanticAssociation> associations;
    std::vector<ProceduralPattern> patterns;
    std::vector<DecisionPattern> decisions;

    // Parse everything before touching the stores
    try {
        if (!document.is_object()) {
            throw InvalidArgumentError("hierarchy document must be an object");
        }
        int version = document.value("version", 0);
        if (version != VERSION) {
            throw InvalidArgumentError("unsupported hierarchy document version " +
                                       std::to_string(version));
        }
        if (document.contains("semantic_store")) {
            const auto& s = document.at("semantic_store");
            const nlohmann::json concept_map = s.value("concepts", nlohmann::json::object());
            const nlohmann::json association_list = s.value("associations", nlohmann::json::array());
            for (const auto& item : concept_map.items()) {
                concepts.push_back(conceptFromJson(item.value()));
            }
            for (const auto& a : association_list) {
                associations.push_back(associationFromJson(a));
            }
        }
        if (document.contains("procedural_store")) {
            const auto& p = document.at("procedural_store");
            const nlohmann::json pattern_map = p.value("patterns", nlohmann::json::object());
            const nlohmann::json decision_list = p.value("decision_patterns", nlohmann::json::array());
            for (const auto& item : pattern_map.items()) {
                patterns.push_back(patternFromJson(item.value()));
            }
            for (const auto& d : decision_list) {
                decisions.push_back(decisionFromJson(d));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("malformed hierarchy document: ") + e.what());
    }

    if (auto store = manager.semanticStore()) {
        store->restore(concepts, associations);
    } else if (!concepts.empty()) {
        spdlog::warn("semantic memory unavailable, {} concepts not restored", concepts.size());
    }
    if (auto store = manager.proceduralStore()) {
        store->restore(patterns, decisions);
    } else if (!patterns.empty()) {
        spdlog::warn("procedural memory unavailable, {} patterns not restored", patterns.size());
    }
}

void HierarchySerializer::saveToFile(const MemoryHierarchyManager& manager,
                                     const std::string& path) {
    std::ofstream out(path);
    if (!out) throw InvalidArgumentError("cannot write hierarchy file: " + path);
    out << serialize(manager).dump(2);
    if (!out) throw InvalidArgumentError("failed writing hierarchy file: " + path);
}

void HierarchySerializer::loadFromFile(MemoryHierarchyManager& manager, const std::string& path) {
    std::ifstream in(path);
    if (!in) throw InvalidArgumentError("cannot read hierarchy file: " + path);
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError("hierarchy file " + path + " is not valid JSON: " + e.what());
    }
    deserialize(manager, doc);
}

} // namespace vita
