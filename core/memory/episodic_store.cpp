#include "memory/episodic_store.hpp"
#include "common/errors.hpp"

#include <fstream>
#include <mutex>

namespace vita {

nlohmann::json feedbackToJson(const FeedbackRecord& record) {
    return {
        {"action_id", record.action_id},
        {"action_pattern", toString(record.action_pattern)},
        {"state_delta", record.state_delta},
        {"delay_ticks", record.delay_ticks},
        {"associated_events", record.associated_events},
        {"context", record.context},
        {"timestamp", record.timestamp},
    };
}

FeedbackRecord feedbackFromJson(const nlohmann::json& j) {
    FeedbackRecord record;
    record.action_id = j.at("action_id").get<std::string>();
    record.action_pattern = parseActionPattern(j.at("action_pattern").get<std::string>());
    record.state_delta = j.at("state_delta").get<std::map<std::string, double>>();
    record.delay_ticks = j.value("delay_ticks", 0);
    record.associated_events = j.value("associated_events", std::vector<std::string>{});
    record.context = j.value("context", Attributes{});
    record.timestamp = j.value("timestamp", 0.0);
    return record;
}

nlohmann::json memoryEntryToJson(const MemoryEntry& entry) {
    nlohmann::json j = {
        {"event_type", entry.event_type},
        {"meaning_significance", entry.meaning_significance},
        {"timestamp", entry.timestamp},
        {"subjective_timestamp", entry.subjective_timestamp},
        {"weight", entry.weight},
    };
    if (entry.feedback_data) {
        j["feedback_data"] = feedbackToJson(*entry.feedback_data);
    }
    return j;
}

MemoryEntry memoryEntryFromJson(const nlohmann::json& j) {
    MemoryEntry entry;
    entry.event_type = j.at("event_type").get<std::string>();
    entry.meaning_significance = j.value("meaning_significance", 0.0);
    entry.timestamp = j.value("timestamp", 0.0);
    entry.subjective_timestamp = j.value("subjective_timestamp", 0.0);
    entry.weight = j.value("weight", 1.0);
    if (j.contains("feedback_data") && !j.at("feedback_data").is_null()) {
        entry.feedback_data = feedbackFromJson(j.at("feedback_data"));
    }
    return entry;
}

EpisodicMemory::EpisodicMemory(const EpisodicMemory& other) {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    entries_ = other.entries_;
}

EpisodicMemory& EpisodicMemory::operator=(const EpisodicMemory& other) {
    if (this == &other) return *this;
    std::vector<MemoryEntry> copy;
    {
        std::shared_lock<std::shared_mutex> lock(other.mutex_);
        copy = other.entries_;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_ = std::move(copy);
    return *this;
}

void EpisodicMemory::append(const MemoryEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<MemoryEntry> EpisodicMemory::retrieve(size_t limit,
                                                  const std::string& event_type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<MemoryEntry> result;
    for (const auto& e : entries_) {
        if (!event_type.empty() && e.event_type != event_type) continue;
        result.push_back(e);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

std::vector<MemoryEntry> EpisodicMemory::retrieveRecent(size_t n) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (n >= entries_.size()) return entries_;
    return std::vector<MemoryEntry>(entries_.end() - n, entries_.end());
}

std::map<std::string, int> EpisodicMemory::countByType(size_t window) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, int> counts;
    size_t start = window >= entries_.size() ? 0 : entries_.size() - window;
    for (size_t i = start; i < entries_.size(); i++) {
        counts[entries_[i].event_type]++;
    }
    return counts;
}

size_t EpisodicMemory::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

size_t EpisodicMemory::feedbackCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& e : entries_) {
        if (e.feedback_data) n++;
    }
    return n;
}

double EpisodicMemory::averageSignificance() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (entries_.empty()) return 0.0;
    double total = 0.0;
    for (const auto& e : entries_) total += e.meaning_significance;
    return total / entries_.size();
}

void EpisodicMemory::exportToFile(const std::string& path) const {
    std::ofstream out(path);
    if (!out) throw InvalidArgumentError("cannot write episodic export: " + path);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& e : entries_) {
        out << memoryEntryToJson(e).dump() << "\n";
    }
}

void EpisodicMemory::importFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw InvalidArgumentError("cannot read episodic export: " + path);

    std::vector<MemoryEntry> loaded;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            loaded.push_back(memoryEntryFromJson(nlohmann::json::parse(line)));
        } catch (const nlohmann::json::exception& e) {
            throw InvalidArgumentError("malformed episodic line in " + path + ": " + e.what());
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.insert(entries_.end(), loaded.begin(), loaded.end());
}

void EpisodicMemory::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
}

} // namespace vita
