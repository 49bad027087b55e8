#pragma once

#include "common/attributes.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "memory/memory_store.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace vita {

// ─── Semantic Concept ──────────────────────────────────────────
// Generalized knowledge distilled from recurring episodic entries.
// Concepts are never removed implicitly.

struct SemanticConcept {
    std::string concept_id;
    std::string name;
    std::string description;
    double confidence = 0.5;
    int activation_count = 0;
    double last_activation = 0.0;
    std::set<std::string> related_concepts;     // ids only
    Attributes properties;
    double created_at = 0.0;

    /// min(1, confidence * 0.99^hours_since_last_activation)
    double activationStrength(double now) const;

    bool operator==(const SemanticConcept& o) const {
        return concept_id == o.concept_id && name == o.name &&
               description == o.description && confidence == o.confidence &&
               activation_count == o.activation_count &&
               last_activation == o.last_activation &&
               related_concepts == o.related_concepts &&
               properties == o.properties && created_at == o.created_at;
    }
};

struct SemanticAssociation {
    std::string source_id;
    std::string target_id;
    std::string association_type = "related_to";
    double strength = 0.5;
    int evidence_count = 1;
    double last_updated = 0.0;

    bool operator==(const SemanticAssociation& o) const {
        return source_id == o.source_id && target_id == o.target_id &&
               association_type == o.association_type && strength == o.strength &&
               evidence_count == o.evidence_count && last_updated == o.last_updated;
    }
};

// ─── Semantic Store ────────────────────────────────────────────
// Concept graph keyed by concept id. Associations are directed
// (source, target) pairs; both endpoints list each other in
// related_concepts.

class SemanticStore : public MemoryStore {
public:
    explicit SemanticStore(const SemanticConfig& config = {},
                           std::shared_ptr<Clock> clock = defaultClock());

    MemoryLevel level() const override { return MemoryLevel::SEMANTIC; }
    size_t size() const override { return conceptCount(); }
    void clear() override;

    /// Insert a concept. Returns false (no change) if the id exists.
    bool addConcept(const SemanticConcept& item);

    /// Nudge an existing concept toward `observed_confidence` and count
    /// one activation. Returns false if the concept is unknown.
    bool reinforceConcept(const std::string& concept_id,
                          double observed_confidence, double alpha);

    /// Count one activation. Returns false if the concept is unknown.
    bool activateConcept(const std::string& concept_id);

    std::optional<SemanticConcept> getConcept(const std::string& concept_id) const;
    bool hasConcept(const std::string& concept_id) const;

    /// Add or strengthen the (source, target) association. Both
    /// concepts must exist, otherwise InvalidArgumentError.
    void addAssociation(const std::string& source_id, const std::string& target_id,
                        const std::string& association_type, double strength);

    std::optional<SemanticAssociation> getAssociation(const std::string& source_id,
                                                      const std::string& target_id) const;

    /// Concepts reachable from `concept_id` within `max_depth` hops,
    /// with relevance attenuated by association strength and depth.
    std::map<std::string, double> findRelated(const std::string& concept_id,
                                              int max_depth = 2) const;

    /// Text search over name (1.0) and description (0.5), weighted by
    /// activation strength. Best first.
    std::vector<std::pair<SemanticConcept, double>> search(const std::string& query,
                                                           size_t limit = 10) const;

    /// Decay stale associations and drop the ones that fall below the
    /// minimum strength. Returns the number of associations touched.
    virtual int consolidateKnowledge();

    std::vector<SemanticConcept> concepts() const;
    std::vector<SemanticAssociation> associations() const;

    /// Replace the whole store content (deserialization).
    void restore(const std::vector<SemanticConcept>& concepts,
                 const std::vector<SemanticAssociation>& associations);

    size_t conceptCount() const;
    size_t associationCount() const;
    nlohmann::json statistics() const;

private:
    using AssociationKey = std::pair<std::string, std::string>;

    SemanticConfig config_;
    std::shared_ptr<Clock> clock_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, SemanticConcept> concepts_;
    std::map<AssociationKey, SemanticAssociation> associations_;
    double last_consolidation_ = 0.0;
};

nlohmann::json conceptToJson(const SemanticConcept& item);
SemanticConcept conceptFromJson(const nlohmann::json& j);
nlohmann::json associationToJson(const SemanticAssociation& association);
SemanticAssociation associationFromJson(const nlohmann::json& j);

} // namespace vita
