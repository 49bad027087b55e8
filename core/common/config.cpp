#include "common/config.hpp"
#include "common/errors.hpp"

#include <fstream>

namespace vita {

namespace {

template <typename T>
void overlay(const nlohmann::json& section, const char* key, T& field) {
    if (!section.contains(key)) return;
    try {
        field = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("bad value for '") + key + "': " + e.what());
    }
}

const nlohmann::json& sectionOf(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name)) return empty;
    const auto& s = j.at(name);
    if (!s.is_object()) {
        throw ConfigurationError(std::string("section '") + name + "' must be an object");
    }
    return s;
}

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigurationError(message);
}

bool unitInterval(double v) { return v >= 0.0 && v <= 1.0; }

} // namespace

void VitaConfig::validate() const {
    require(sensory.capacity > 0, "sensory.capacity must be positive");
    require(sensory.ttl_seconds >= 0.0, "sensory.ttl_seconds must be >= 0");

    require(feedback.min_delay_ticks >= 1, "feedback.min_delay_ticks must be >= 1");
    require(feedback.min_delay_ticks <= feedback.max_delay_ticks,
            "feedback.min_delay_ticks must not exceed max_delay_ticks");
    require(feedback.timeout_ticks >= feedback.max_delay_ticks,
            "feedback.timeout_ticks must be >= max_delay_ticks");
    require(feedback.noise_floor >= 0.0, "feedback.noise_floor must be >= 0");

    require(hierarchy.sensory_to_episodic_threshold >= 1,
            "hierarchy.sensory_to_episodic_threshold must be >= 1");
    require(hierarchy.episodic_to_semantic_threshold >= 1,
            "hierarchy.episodic_to_semantic_threshold must be >= 1");
    require(unitInterval(hierarchy.high_salience_intensity),
            "hierarchy.high_salience_intensity must be in [0,1]");
    require(hierarchy.semantic_window > 0, "hierarchy.semantic_window must be positive");
    require(hierarchy.semantic_smoothing > 0.0 && hierarchy.semantic_smoothing <= 1.0,
            "hierarchy.semantic_smoothing must be in (0,1]");
    require(unitInterval(hierarchy.co_occurrence_strength),
            "hierarchy.co_occurrence_strength must be in [0,1]");

    require(unitInterval(semantic.association_decay), "semantic.association_decay must be in [0,1]");

    require(unitInterval(procedural.min_automation_threshold),
            "procedural.min_automation_threshold must be in [0,1]");
    require(unitInterval(procedural.initial_success_automation) &&
            unitInterval(procedural.initial_failure_automation),
            "procedural initial automation levels must be in [0,1]");
    require(unitInterval(procedural.decision_match_threshold),
            "procedural.decision_match_threshold must be in [0,1]");

    require(runtime.tick_interval_seconds >= 0.0, "runtime.tick_interval_seconds must be >= 0");
    require(runtime.consolidation_interval_ticks > 0,
            "runtime.consolidation_interval_ticks must be positive");
    require(runtime.snapshot_period_ticks > 0, "runtime.snapshot_period_ticks must be positive");
    require(runtime.event_queue_capacity > 0, "runtime.event_queue_capacity must be positive");
    require(runtime.intensity_history > 0, "runtime.intensity_history must be positive");
    require(unitInterval(runtime.intensity_smoothing), "runtime.intensity_smoothing must be in [0,1]");
    require(unitInterval(runtime.error_integrity_penalty),
            "runtime.error_integrity_penalty must be in [0,1]");
}

VitaConfig configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigurationError("configuration root must be an object");

    VitaConfig c;

    const auto& s = sectionOf(j, "sensory");
    overlay(s, "capacity", c.sensory.capacity);
    overlay(s, "ttl_seconds", c.sensory.ttl_seconds);

    const auto& f = sectionOf(j, "feedback");
    overlay(f, "min_delay_ticks", c.feedback.min_delay_ticks);
    overlay(f, "max_delay_ticks", c.feedback.max_delay_ticks);
    overlay(f, "timeout_ticks", c.feedback.timeout_ticks);
    overlay(f, "noise_floor", c.feedback.noise_floor);
    overlay(f, "max_associated_events", c.feedback.max_associated_events);

    const auto& h = sectionOf(j, "hierarchy");
    overlay(h, "sensory_to_episodic_threshold", c.hierarchy.sensory_to_episodic_threshold);
    overlay(h, "episodic_to_semantic_threshold", c.hierarchy.episodic_to_semantic_threshold);
    overlay(h, "high_salience_intensity", c.hierarchy.high_salience_intensity);
    overlay(h, "semantic_window", c.hierarchy.semantic_window);
    overlay(h, "semantic_smoothing", c.hierarchy.semantic_smoothing);
    overlay(h, "semantic_consolidation_interval", c.hierarchy.semantic_consolidation_interval);
    overlay(h, "co_occurrence_strength", c.hierarchy.co_occurrence_strength);
    overlay(h, "query_cache_ttl_seconds", c.hierarchy.query_cache_ttl_seconds);

    const auto& sem = sectionOf(j, "semantic");
    overlay(sem, "association_stale_seconds", c.semantic.association_stale_seconds);
    overlay(sem, "association_decay", c.semantic.association_decay);
    overlay(sem, "association_min_strength", c.semantic.association_min_strength);

    const auto& p = sectionOf(j, "procedural");
    overlay(p, "min_automation_threshold", c.procedural.min_automation_threshold);
    overlay(p, "initial_success_automation", c.procedural.initial_success_automation);
    overlay(p, "initial_failure_automation", c.procedural.initial_failure_automation);
    overlay(p, "removal_effectiveness", c.procedural.removal_effectiveness);
    overlay(p, "removal_min_executions", c.procedural.removal_min_executions);
    overlay(p, "decay_success_rate", c.procedural.decay_success_rate);
    overlay(p, "decision_match_threshold", c.procedural.decision_match_threshold);

    const auto& r = sectionOf(j, "runtime");
    overlay(r, "tick_interval_seconds", c.runtime.tick_interval_seconds);
    overlay(r, "consolidation_interval_ticks", c.runtime.consolidation_interval_ticks);
    overlay(r, "snapshot_period_ticks", c.runtime.snapshot_period_ticks);
    overlay(r, "snapshot_queue_capacity", c.runtime.snapshot_queue_capacity);
    overlay(r, "event_queue_capacity", c.runtime.event_queue_capacity);
    overlay(r, "max_events_per_tick", c.runtime.max_events_per_tick);
    overlay(r, "intensity_history", c.runtime.intensity_history);
    overlay(r, "intensity_smoothing", c.runtime.intensity_smoothing);
    overlay(r, "error_integrity_penalty", c.runtime.error_integrity_penalty);
    overlay(r, "snapshot_dir", c.runtime.snapshot_dir);

    const auto& l = sectionOf(j, "logging");
    overlay(l, "level", c.logging.level);
    overlay(l, "file", c.logging.file);
    overlay(l, "structured_file", c.logging.structured_file);
    overlay(l, "structured_queue_size", c.logging.structured_queue_size);

    return c;
}

nlohmann::json configToJson(const VitaConfig& c) {
    return {
        {"sensory", {
            {"capacity", c.sensory.capacity},
            {"ttl_seconds", c.sensory.ttl_seconds},
        }},
        {"feedback", {
            {"min_delay_ticks", c.feedback.min_delay_ticks},
            {"max_delay_ticks", c.feedback.max_delay_ticks},
            {"timeout_ticks", c.feedback.timeout_ticks},
            {"noise_floor", c.feedback.noise_floor},
            {"max_associated_events", c.feedback.max_associated_events},
        }},
        {"hierarchy", {
            {"sensory_to_episodic_threshold", c.hierarchy.sensory_to_episodic_threshold},
            {"episodic_to_semantic_threshold", c.hierarchy.episodic_to_semantic_threshold},
            {"high_salience_intensity", c.hierarchy.high_salience_intensity},
            {"semantic_window", c.hierarchy.semantic_window},
            {"semantic_smoothing", c.hierarchy.semantic_smoothing},
            {"semantic_consolidation_interval", c.hierarchy.semantic_consolidation_interval},
            {"co_occurrence_strength", c.hierarchy.co_occurrence_strength},
            {"query_cache_ttl_seconds", c.hierarchy.query_cache_ttl_seconds},
        }},
        {"semantic", {
            {"association_stale_seconds", c.semantic.association_stale_seconds},
            {"association_decay", c.semantic.association_decay},
            {"association_min_strength", c.semantic.association_min_strength},
        }},
        {"procedural", {
            {"min_automation_threshold", c.procedural.min_automation_threshold},
            {"initial_success_automation", c.procedural.initial_success_automation},
            {"initial_failure_automation", c.procedural.initial_failure_automation},
            {"removal_effectiveness", c.procedural.removal_effectiveness},
            {"removal_min_executions", c.procedural.removal_min_executions},
            {"decay_success_rate", c.procedural.decay_success_rate},
            {"decision_match_threshold", c.procedural.decision_match_threshold},
        }},
        {"runtime", {
            {"tick_interval_seconds", c.runtime.tick_interval_seconds},
            {"consolidation_interval_ticks", c.runtime.consolidation_interval_ticks},
            {"snapshot_period_ticks", c.runtime.snapshot_period_ticks},
            {"snapshot_queue_capacity", c.runtime.snapshot_queue_capacity},
            {"event_queue_capacity", c.runtime.event_queue_capacity},
            {"max_events_per_tick", c.runtime.max_events_per_tick},
            {"intensity_history", c.runtime.intensity_history},
            {"intensity_smoothing", c.runtime.intensity_smoothing},
            {"error_integrity_penalty", c.runtime.error_integrity_penalty},
            {"snapshot_dir", c.runtime.snapshot_dir},
        }},
        {"logging", {
            {"level", c.logging.level},
            {"file", c.logging.file},
            {"structured_file", c.logging.structured_file},
            {"structured_queue_size", c.logging.structured_queue_size},
        }},
    };
}

VitaConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open config file: " + path);

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("config file " + path + " is not valid JSON: " + e.what());
    }

    VitaConfig config = configFromJson(j);
    config.validate();
    return config;
}

} // namespace vita
