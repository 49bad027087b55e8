#include "feedback/feedback_tracker.hpp"
#include "state/self_state.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace vita {

FeedbackTracker::FeedbackTracker(const FeedbackConfig& config, std::shared_ptr<Clock> clock)
    : FeedbackTracker(config, std::random_device{}(), std::move(clock)) {}

FeedbackTracker::FeedbackTracker(const FeedbackConfig& config, uint32_t seed,
                                 std::shared_ptr<Clock> clock)
    : config_(config), clock_(clock ? std::move(clock) : defaultClock()), rng_(seed) {
    if (config_.min_delay_ticks < 1 || config_.min_delay_ticks > config_.max_delay_ticks) {
        throw ConfigurationError("feedback delay window must satisfy 1 <= min <= max");
    }
}

bool FeedbackTracker::registerAction(const std::string& action_id, ActionPattern action_pattern,
                                     const StateVitals& state_before, double timestamp,
                                     const Attributes& context,
                                     std::optional<int> check_after_ticks) {
    if (isPending(action_id)) {
        spdlog::debug("feedback: action '{}' already pending", action_id);
        return false;
    }

    PendingAction p;
    p.action_id = action_id;
    p.action_pattern = action_pattern;
    p.state_before = state_before;
    p.timestamp = timestamp;
    p.context = context;
    if (check_after_ticks) {
        p.check_after_ticks = std::max(1, *check_after_ticks);
    } else {
        std::uniform_int_distribution<int> delay(config_.min_delay_ticks, config_.max_delay_ticks);
        p.check_after_ticks = delay(rng_);
    }
    pending_.push_back(std::move(p));
    stats_.registered++;
    return true;
}

void FeedbackTracker::recordEvent(const std::string& event_type) {
    for (auto& p : pending_) {
        if (p.associated_events.size() < config_.max_associated_events) {
            p.associated_events.push_back(event_type);
        }
    }
}

std::vector<FeedbackRecord> FeedbackTracker::observeConsequences(const SelfState& current) {
    double now = clock_->now();
    std::vector<FeedbackRecord> records;
    std::vector<PendingAction> still_pending;
    still_pending.reserve(pending_.size());

    for (auto& p : pending_) {
        p.ticks_waited++;

        if (p.ticks_waited >= p.check_after_ticks) {
            std::map<std::string, double> delta = {
                {"energy", current.energy - p.state_before.energy},
                {"stability", current.stability - p.state_before.stability},
                {"integrity", current.integrity - p.state_before.integrity},
            };
            double magnitude = 0.0;
            for (const auto& [field, d] : delta) magnitude = std::max(magnitude, std::abs(d));

            if (magnitude < config_.noise_floor) {
                stats_.suppressed++;
                continue;
            }

            FeedbackRecord r;
            r.action_id = p.action_id;
            r.action_pattern = p.action_pattern;
            r.state_delta = std::move(delta);
            r.delay_ticks = p.ticks_waited;
            r.associated_events = p.associated_events;
            r.context = p.context;
            r.timestamp = now;
            records.push_back(std::move(r));
            stats_.resolved++;
            continue;
        }

        if (p.ticks_waited > config_.timeout_ticks) {
            stats_.timed_out++;
            spdlog::warn("feedback: action '{}' timed out after {} ticks",
                         p.action_id, p.ticks_waited);
            continue;
        }

        still_pending.push_back(std::move(p));
    }

    pending_ = std::move(still_pending);
    return records;
}

bool FeedbackTracker::isPending(const std::string& action_id) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](const PendingAction& p) { return p.action_id == action_id; });
}

} // namespace vita
