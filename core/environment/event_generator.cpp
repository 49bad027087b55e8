#include "environment/event_generator.hpp"

namespace vita {

EventGenerator::EventGenerator(uint32_t seed, std::shared_ptr<Clock> clock)
    : rng_(seed), clock_(clock ? std::move(clock) : defaultClock()) {
    setMix(defaultMix());
}

std::vector<EventTypeSpec> EventGenerator::defaultMix() {
    return {
        {"noise", 0.40, -0.3, 0.3},
        {"decay", 0.30, -0.5, 0.0},
        {"recovery", 0.20, 0.0, 0.5},
        {"shock", 0.05, -1.0, 1.0},
        {"idle", 0.05, 0.0, 0.0},
    };
}

void EventGenerator::setMix(std::vector<EventTypeSpec> mix) {
    if (mix.empty()) throw InvalidArgumentError("event mix must not be empty");
    double total = 0.0;
    for (const auto& spec : mix) {
        if (spec.type.empty()) throw InvalidArgumentError("event type must not be empty");
        if (spec.weight < 0.0) {
            throw InvalidArgumentError("negative weight for event type " + spec.type);
        }
        if (spec.intensity_min < -1.0 || spec.intensity_max > 1.0 ||
            spec.intensity_min > spec.intensity_max) {
            throw InvalidArgumentError("bad intensity range for event type " + spec.type);
        }
        total += spec.weight;
    }
    if (total <= 0.0) throw InvalidArgumentError("event mix weights sum to zero");
    mix_ = std::move(mix);
    rebuildDistribution();
}

void EventGenerator::setWeight(const std::string& type, double weight) {
    auto mix = mix_;
    for (auto& spec : mix) {
        if (spec.type == type) {
            spec.weight = weight;
            setMix(std::move(mix));
            return;
        }
    }
    throw InvalidArgumentError("unknown event type: " + type);
}

void EventGenerator::rebuildDistribution() {
    std::vector<double> weights;
    for (const auto& spec : mix_) weights.push_back(spec.weight);
    pick_ = std::discrete_distribution<size_t>(weights.begin(), weights.end());
}

Event EventGenerator::generate() {
    const auto& spec = mix_[pick_(rng_)];
    double intensity = spec.intensity_min;
    if (spec.intensity_max > spec.intensity_min) {
        std::uniform_real_distribution<double> range(spec.intensity_min, spec.intensity_max);
        intensity = range(rng_);
    }
    return Event(spec.type, intensity, clock_->now());
}

std::vector<Event> EventGenerator::generateBatch(size_t n) {
    std::vector<Event> events;
    events.reserve(n);
    for (size_t i = 0; i < n; i++) events.push_back(generate());
    return events;
}

} // namespace vita
