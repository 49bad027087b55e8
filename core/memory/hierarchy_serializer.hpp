#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace vita {

class MemoryHierarchyManager;

// ─── HierarchySerializer ───────────────────────────────────────
// Persists the long-lived tiers (semantic, procedural) as one JSON
// document:
//
//   {"version": 1,
//    "semantic_store":   {"concepts": {id: {...}}, "associations": [...]},
//    "procedural_store": {"patterns": {id: {...}}, "decision_patterns": [...]}}
//
// Sensory and episodic memory are not part of the document; episodic
// memory travels with SelfState snapshots.

class HierarchySerializer {
public:
    static constexpr int VERSION = 1;

    static nlohmann::json serialize(const MemoryHierarchyManager& manager);

    /// Replace the semantic and procedural contents. Throws
    /// InvalidArgumentError on a malformed document or unknown version.
    static void deserialize(MemoryHierarchyManager& manager, const nlohmann::json& document);

    static void saveToFile(const MemoryHierarchyManager& manager, const std::string& path);
    static void loadFromFile(MemoryHierarchyManager& manager, const std::string& path);
};

} // namespace vita
