#pragma once

#include "feedback/feedback_record.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace vita {

// ─── Memory Entry ──────────────────────────────────────────────
// One episodic record. Created by promotion from the sensory buffer
// or from a resolved feedback record, then never modified.

struct MemoryEntry {
    std::string event_type;
    double meaning_significance = 0.0;
    double timestamp = 0.0;
    double subjective_timestamp = 0.0;
    double weight = 1.0;
    std::optional<FeedbackRecord> feedback_data;

    bool operator==(const MemoryEntry& o) const {
        return event_type == o.event_type &&
               meaning_significance == o.meaning_significance &&
               timestamp == o.timestamp &&
               subjective_timestamp == o.subjective_timestamp &&
               weight == o.weight && feedback_data == o.feedback_data;
    }
};

nlohmann::json feedbackToJson(const FeedbackRecord& record);
FeedbackRecord feedbackFromJson(const nlohmann::json& j);
nlohmann::json memoryEntryToJson(const MemoryEntry& entry);
MemoryEntry memoryEntryFromJson(const nlohmann::json& j);

// ─── Episodic Memory ───────────────────────────────────────────
// Ordered, append-only sequence of MemoryEntry. The raw material for:
// - Semantic consolidation (recurring event types)
// - Feedback history
// - Snapshots
// Reads may come from query threads while the tick thread appends.

class EpisodicMemory {
public:
    EpisodicMemory() = default;
    EpisodicMemory(const EpisodicMemory& other);
    EpisodicMemory& operator=(const EpisodicMemory& other);

    /// Append an entry.
    void append(const MemoryEntry& entry);

    /// Retrieve entries in insertion order. Optional filter by event type.
    std::vector<MemoryEntry> retrieve(size_t limit = 0,
                                      const std::string& event_type = "") const;

    /// Retrieve the N most recent entries.
    std::vector<MemoryEntry> retrieveRecent(size_t n) const;

    /// Occurrences per event type within the N most recent entries.
    std::map<std::string, int> countByType(size_t window) const;

    /// Total stored entries.
    size_t count() const;
    bool empty() const { return count() == 0; }

    /// Number of entries that carry feedback data.
    size_t feedbackCount() const;

    /// Mean significance across all entries.
    double averageSignificance() const;

    /// Export all entries to a JSONL file.
    void exportToFile(const std::string& path) const;

    /// Import entries from a JSONL file (appends).
    void importFromFile(const std::string& path);

    /// Clear all entries. The only way entries are ever removed.
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<MemoryEntry> entries_;
};

} // namespace vita
