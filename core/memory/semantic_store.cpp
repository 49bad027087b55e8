#include "memory/semantic_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <mutex>

namespace vita {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

double SemanticConcept::activationStrength(double now) const {
    double hours = std::max(0.0, now - last_activation) / 3600.0;
    return std::min(1.0, confidence * std::pow(0.99, hours));
}

SemanticStore::SemanticStore(const SemanticConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : defaultClock()) {}

void SemanticStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    concepts_.clear();
    associations_.clear();
}

bool SemanticStore::addConcept(const SemanticConcept& item) {
    if (item.concept_id.empty()) {
        throw InvalidArgumentError("concept id must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (concepts_.count(item.concept_id)) return false;

    SemanticConcept c = item;
    c.confidence = std::max(0.0, std::min(1.0, c.confidence));
    double now = clock_->now();
    if (c.created_at == 0.0) c.created_at = now;
    if (c.last_activation == 0.0) c.last_activation = now;
    concepts_.emplace(c.concept_id, std::move(c));
    spdlog::debug("semantic: added concept '{}'", item.concept_id);
    return true;
}

bool SemanticStore::reinforceConcept(const std::string& concept_id,
                                     double observed_confidence, double alpha) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = concepts_.find(concept_id);
    if (it == concepts_.end()) return false;

    auto& c = it->second;
    c.confidence += alpha * (observed_confidence - c.confidence);
    c.confidence = std::max(0.0, std::min(1.0, c.confidence));
    c.activation_count++;
    c.last_activation = clock_->now();
    return true;
}

bool SemanticStore::activateConcept(const std::string& concept_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = concepts_.find(concept_id);
    if (it == concepts_.end()) return false;
    it->second.activation_count++;
    it->second.last_activation = clock_->now();
    return true;
}

std::optional<SemanticConcept> SemanticStore::getConcept(const std::string& concept_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = concepts_.find(concept_id);
    if (it == concepts_.end()) return std::nullopt;
    return it->second;
}

bool SemanticStore::hasConcept(const std::string& concept_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return concepts_.count(concept_id) > 0;
}

void SemanticStore::addAssociation(const std::string& source_id, const std::string& target_id,
                                   const std::string& association_type, double strength) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto src = concepts_.find(source_id);
    auto dst = concepts_.find(target_id);
    if (src == concepts_.end() || dst == concepts_.end()) {
        throw InvalidArgumentError("association endpoints must exist: " +
                                   source_id + " -> " + target_id);
    }

    double now = clock_->now();
    AssociationKey key{source_id, target_id};
    auto it = associations_.find(key);
    if (it != associations_.end()) {
        // Strengthen the existing link
        it->second.strength = std::min(1.0, it->second.strength + strength);
        it->second.evidence_count++;
        it->second.last_updated = now;
    } else {
        SemanticAssociation a;
        a.source_id = source_id;
        a.target_id = target_id;
        a.association_type = association_type;
        a.strength = std::max(0.0, std::min(1.0, strength));
        a.evidence_count = 1;
        a.last_updated = now;
        associations_.emplace(key, a);
    }

    src->second.related_concepts.insert(target_id);
    dst->second.related_concepts.insert(source_id);
}

std::optional<SemanticAssociation> SemanticStore::getAssociation(
        const std::string& source_id, const std::string& target_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = associations_.find({source_id, target_id});
    if (it == associations_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, double> SemanticStore::findRelated(const std::string& concept_id,
                                                         int max_depth) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, double> relevance;
    if (!concepts_.count(concept_id)) return relevance;

    std::set<std::string> visited;
    std::function<void(const std::string&, int, double)> explore =
        [&](const std::string& current, int depth, double score) {
            if (depth > max_depth || visited.count(current)) return;
            visited.insert(current);
            relevance[current] = std::max(relevance[current], score);

            const auto& related = concepts_.at(current).related_concepts;
            for (const auto& next : related) {
                auto a = associations_.find({current, next});
                if (a == associations_.end()) a = associations_.find({next, current});
                if (a == associations_.end() || !concepts_.count(next)) continue;
                double link = a->second.strength * std::pow(0.8, depth);
                explore(next, depth + 1, score * link);
            }
        };
    explore(concept_id, 0, 1.0);
    return relevance;
}

std::vector<std::pair<SemanticConcept, double>> SemanticStore::search(
        const std::string& query, size_t limit) const {
    std::string q = lowercase(query);
    double now = clock_->now();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::pair<SemanticConcept, double>> results;
    for (const auto& [id, c] : concepts_) {
        double score = 0.0;
        if (lowercase(c.name).find(q) != std::string::npos) score += 1.0;
        if (lowercase(c.description).find(q) != std::string::npos) score += 0.5;
        score *= c.activationStrength(now);
        if (score > 0.0) results.emplace_back(c, score);
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (limit > 0 && results.size() > limit) results.resize(limit);
    return results;
}

int SemanticStore::consolidateKnowledge() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    double now = clock_->now();
    int touched = 0;

    for (auto it = associations_.begin(); it != associations_.end();) {
        auto& a = it->second;
        if (now - a.last_updated <= config_.association_stale_seconds) {
            ++it;
            continue;
        }
        a.strength *= config_.association_decay;
        touched++;
        if (a.strength >= config_.association_min_strength) {
            ++it;
            continue;
        }
        // Unlink endpoints unless the reverse direction still exists
        if (!associations_.count({a.target_id, a.source_id})) {
            auto src = concepts_.find(a.source_id);
            auto dst = concepts_.find(a.target_id);
            if (src != concepts_.end()) src->second.related_concepts.erase(a.target_id);
            if (dst != concepts_.end()) dst->second.related_concepts.erase(a.source_id);
        }
        it = associations_.erase(it);
    }

    last_consolidation_ = now;
    if (touched > 0) {
        spdlog::info("semantic: consolidated {} associations", touched);
    }
    return touched;
}

std::vector<SemanticConcept> SemanticStore::concepts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SemanticConcept> out;
    out.reserve(concepts_.size());
    for (const auto& [id, c] : concepts_) out.push_back(c);
    return out;
}

std::vector<SemanticAssociation> SemanticStore::associations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<SemanticAssociation> out;
    out.reserve(associations_.size());
    for (const auto& [key, a] : associations_) out.push_back(a);
    return out;
}

void SemanticStore::restore(const std::vector<SemanticConcept>& concepts,
                            const std::vector<SemanticAssociation>& associations) {
    std::map<std::string, SemanticConcept> c_map;
    for (const auto& c : concepts) c_map[c.concept_id] = c;
    std::map<AssociationKey, SemanticAssociation> a_map;
    for (const auto& a : associations) {
        if (!c_map.count(a.source_id) || !c_map.count(a.target_id)) {
            throw InvalidArgumentError("association references unknown concept: " +
                                       a.source_id + " -> " + a.target_id);
        }
        a_map[{a.source_id, a.target_id}] = a;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    concepts_ = std::move(c_map);
    associations_ = std::move(a_map);
}

size_t SemanticStore::conceptCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return concepts_.size();
}

size_t SemanticStore::associationCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return associations_.size();
}

nlohmann::json SemanticStore::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    double avg = 0.0;
    for (const auto& [id, c] : concepts_) avg += c.confidence;
    if (!concepts_.empty()) avg /= concepts_.size();
    return {
        {"total_concepts", concepts_.size()},
        {"total_associations", associations_.size()},
        {"average_confidence", avg},
        {"last_consolidation", last_consolidation_},
    };
}

nlohmann::json conceptToJson(const SemanticConcept& item) {
    return {
        {"concept_id", item.concept_id},
        {"name", item.name},
        {"description", item.description},
        {"confidence", item.confidence},
        {"activation_count", item.activation_count},
        {"last_activation", item.last_activation},
        {"related_concepts", item.related_concepts},
        {"properties", item.properties},
        {"created_at", item.created_at},
    };
}

SemanticConcept conceptFromJson(const nlohmann::json& j) {
    SemanticConcept c;
    c.concept_id = j.at("concept_id").get<std::string>();
    c.name = j.value("name", std::string());
    c.description = j.value("description", std::string());
    c.confidence = j.value("confidence", 0.5);
    c.activation_count = j.value("activation_count", 0);
    c.last_activation = j.value("last_activation", 0.0);
    c.related_concepts = j.value("related_concepts", std::set<std::string>{});
    c.properties = j.value("properties", Attributes{});
    c.created_at = j.value("created_at", 0.0);
    return c;
}

nlohmann::json associationToJson(const SemanticAssociation& a) {
    return {
        {"source_id", a.source_id},
        {"target_id", a.target_id},
        {"association_type", a.association_type},
        {"strength", a.strength},
        {"evidence_count", a.evidence_count},
        {"last_updated", a.last_updated},
    };
}

SemanticAssociation associationFromJson(const nlohmann::json& j) {
    SemanticAssociation a;
    a.source_id = j.at("source_id").get<std::string>();
    a.target_id = j.at("target_id").get<std::string>();
    a.association_type = j.value("association_type", std::string("related_to"));
    a.strength = j.value("strength", 0.5);
    a.evidence_count = j.value("evidence_count", 1);
    a.last_updated = j.value("last_updated", 0.0);
    return a;
}

} // namespace vita
