#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace vita {

// ─── Configuration ─────────────────────────────────────────────
// One struct per component, default member initializers hold the
// tuned constants. Passed by const reference into constructors.

struct SensoryConfig {
    size_t capacity = 256;          // ring size
    double ttl_seconds = 30.0;      // 0 disables expiry
};

struct FeedbackConfig {
    int min_delay_ticks = 3;
    int max_delay_ticks = 10;
    int timeout_ticks = 20;         // hard drop after this many ticks
    double noise_floor = 0.001;     // max |delta| below this is suppressed
    size_t max_associated_events = 16;
};

struct HierarchyConfig {
    int sensory_to_episodic_threshold = 5;
    int episodic_to_semantic_threshold = 10;
    double high_salience_intensity = 0.8;
    size_t semantic_window = 100;                   // recent episodic entries scanned
    double semantic_smoothing = 0.2;                // confidence EMA alpha
    double semantic_consolidation_interval = 60.0;  // seconds
    double co_occurrence_strength = 0.1;
    double query_cache_ttl_seconds = 1.0;
};

struct SemanticConfig {
    double association_stale_seconds = 7 * 24 * 3600.0;
    double association_decay = 0.9;
    double association_min_strength = 0.05;
};

struct ProceduralConfig {
    double min_automation_threshold = 0.8;
    double initial_success_automation = 0.3;
    double initial_failure_automation = 0.1;
    double removal_effectiveness = 0.2;
    int removal_min_executions = 3;
    double decay_success_rate = 0.3;
    double decision_match_threshold = 0.7;
};

struct RuntimeConfig {
    double tick_interval_seconds = 1.0;     // 0 runs ticks back to back
    int consolidation_interval_ticks = 10;
    int snapshot_period_ticks = 10;
    size_t snapshot_queue_capacity = 4;
    size_t event_queue_capacity = 100;
    size_t max_events_per_tick = 0;         // 0 drains the whole queue
    size_t intensity_history = 16;
    double intensity_smoothing = 0.3;
    double error_integrity_penalty = 0.05;
    std::string snapshot_dir = "data/snapshots";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                       // empty: console only
    std::string structured_file;            // empty: structured records disabled
    size_t structured_queue_size = 8192;
};

struct VitaConfig {
    SensoryConfig sensory;
    FeedbackConfig feedback;
    HierarchyConfig hierarchy;
    SemanticConfig semantic;
    ProceduralConfig procedural;
    RuntimeConfig runtime;
    LoggingConfig logging;

    /// Throws ConfigurationError on the first out-of-range value.
    void validate() const;
};

/// Overlay the keys present in `j` on top of the defaults.
VitaConfig configFromJson(const nlohmann::json& j);
nlohmann::json configToJson(const VitaConfig& config);

/// Read, overlay and validate a JSON configuration file.
VitaConfig loadConfig(const std::string& path);

} // namespace vita
