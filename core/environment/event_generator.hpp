#pragma once

#include "common/clock.hpp"
#include "state/event.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace vita {

/// One kind of stimulus: relative weight plus the intensity range it
/// is drawn from.
struct EventTypeSpec {
    std::string type;
    double weight = 1.0;
    double intensity_min = 0.0;
    double intensity_max = 0.0;
};

// ─── EventGenerator ────────────────────────────────────────────
// Seeded random environment. Default mix:
//   noise 0.40 [-0.3, 0.3]   decay 0.30 [-0.5, 0]   recovery 0.20 [0, 0.5]
//   shock 0.05 [-1, 1]       idle  0.05 0

class EventGenerator {
public:
    explicit EventGenerator(uint32_t seed = std::random_device{}(),
                            std::shared_ptr<Clock> clock = defaultClock());

    static std::vector<EventTypeSpec> defaultMix();

    /// Replace the mix. Throws InvalidArgumentError for an empty mix,
    /// negative weights or ranges outside [-1, 1].
    void setMix(std::vector<EventTypeSpec> mix);

    /// Change one type's weight. Throws InvalidArgumentError for unknown types.
    void setWeight(const std::string& type, double weight);

    const std::vector<EventTypeSpec>& mix() const { return mix_; }

    Event generate();
    std::vector<Event> generateBatch(size_t n);

private:
    void rebuildDistribution();

    std::mt19937 rng_;
    std::shared_ptr<Clock> clock_;
    std::vector<EventTypeSpec> mix_;
    std::discrete_distribution<size_t> pick_;
};

} // namespace vita
