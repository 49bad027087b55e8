#pragma once

#include "common/errors.hpp"

#include <cstddef>
#include <string>

namespace vita {

/// The four tiers, lowest first.
enum class MemoryLevel {
    SENSORY,
    EPISODIC,
    SEMANTIC,
    PROCEDURAL
};

inline std::string toString(MemoryLevel level) {
    switch (level) {
        case MemoryLevel::SENSORY:    return "sensory";
        case MemoryLevel::EPISODIC:   return "episodic";
        case MemoryLevel::SEMANTIC:   return "semantic";
        case MemoryLevel::PROCEDURAL: return "procedural";
    }
    return "sensory";
}

/// Throws InvalidArgumentError for anything but the four tier names.
inline MemoryLevel parseMemoryLevel(const std::string& name) {
    if (name == "sensory") return MemoryLevel::SENSORY;
    if (name == "episodic") return MemoryLevel::EPISODIC;
    if (name == "semantic") return MemoryLevel::SEMANTIC;
    if (name == "procedural") return MemoryLevel::PROCEDURAL;
    throw InvalidArgumentError("unknown memory level: " + name);
}

// ─── Memory Store ──────────────────────────────────────────────
// Common surface the hierarchy manager sees for each owned tier.
// A store that lost a dependency reports isAvailable() == false and
// the manager skips it.

class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual MemoryLevel level() const = 0;
    virtual bool isAvailable() const { return true; }
    virtual size_t size() const = 0;
    virtual void clear() = 0;
};

} // namespace vita
