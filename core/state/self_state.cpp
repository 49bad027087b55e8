#include "state/self_state.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace vita {

namespace {

double clampTo(double v, double lo, double hi) { return std::max(lo, std::min(hi, v)); }

} // namespace

void SelfState::applyDelta(const std::map<std::string, double>& delta) {
    for (const auto& [field, value] : delta) {
        if (field != "energy" && field != "stability" && field != "integrity" &&
            field != "age" && field != "subjective_time") {
            throw InvalidArgumentError("unknown state field: " + field);
        }
    }

    for (const auto& [field, value] : delta) {
        if (field == "energy") {
            energy = clampTo(energy + value, 0.0, MAX_ENERGY);
        } else if (field == "stability") {
            stability = clampTo(stability + value, 0.0, 1.0);
        } else if (field == "integrity") {
            integrity = clampTo(integrity + value, 0.0, 1.0);
        } else if (field == "age") {
            age = std::max(0.0, age + value);
        } else {
            subjective_time = std::max(0.0, subjective_time + value);
        }
    }
}

void SelfState::noteEvent(const std::string& event_type) {
    recent_events.push_back(event_type);
    while (recent_events.size() > RECENT_EVENTS) recent_events.pop_front();
}

nlohmann::json selfStateToJson(const SelfState& state) {
    nlohmann::json memory = nlohmann::json::array();
    for (const auto& entry : state.memory.retrieve()) {
        memory.push_back(memoryEntryToJson(entry));
    }
    return {
        {"energy", state.energy},
        {"stability", state.stability},
        {"integrity", state.integrity},
        {"ticks", state.ticks},
        {"age", state.age},
        {"subjective_time", state.subjective_time},
        {"pending_actions", state.pending_actions},
        {"last_pattern", toString(state.last_pattern)},
        {"last_significance", state.last_significance},
        {"last_event_intensity", state.last_event_intensity},
        {"recent_events", std::vector<std::string>(state.recent_events.begin(),
                                                   state.recent_events.end())},
        {"memory", memory},
    };
}

SelfState selfStateFromJson(const nlohmann::json& j) {
    SelfState s;
    try {
        s.energy = clampTo(j.value("energy", s.energy), 0.0, SelfState::MAX_ENERGY);
        s.stability = clampTo(j.value("stability", s.stability), 0.0, 1.0);
        s.integrity = clampTo(j.value("integrity", s.integrity), 0.0, 1.0);
        s.ticks = j.value("ticks", uint64_t{0});
        s.age = std::max(0.0, j.value("age", 0.0));
        s.subjective_time = std::max(0.0, j.value("subjective_time", 0.0));
        s.pending_actions = j.value("pending_actions", uint64_t{0});
        s.last_pattern = parseActionPattern(j.value("last_pattern", std::string("ignore")));
        s.last_significance = j.value("last_significance", 0.0);
        s.last_event_intensity = j.value("last_event_intensity", 0.0);
        for (const auto& t : j.value("recent_events", std::vector<std::string>{})) {
            s.noteEvent(t);
        }
        if (j.contains("memory")) {
            for (const auto& e : j.at("memory")) {
                s.memory.append(memoryEntryFromJson(e));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("malformed state document: ") + e.what());
    }
    return s;
}

} // namespace vita
