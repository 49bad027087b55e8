#include "runtime/tick_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace vita {

namespace {

/// Reject a bad config before any member is built from it.
const VitaConfig& validated(const VitaConfig& config) {
    config.validate();
    return config;
}

} // namespace

TickEngine::TickEngine(const VitaConfig& config,
                       std::shared_ptr<EventQueue> queue,
                       std::shared_ptr<MeaningEngine> meaning,
                       std::shared_ptr<MemoryHierarchyManager> memory,
                       std::shared_ptr<SnapshotManager> snapshots,
                       std::shared_ptr<StructuredLog> log,
                       std::shared_ptr<Clock> clock,
                       std::optional<uint32_t> seed)
    : config_(validated(config)),
      queue_(std::move(queue)),
      meaning_(std::move(meaning)),
      memory_(std::move(memory)),
      snapshots_(std::move(snapshots)),
      log_(log ? std::move(log) : std::make_shared<StructuredLog>()),
      clock_(clock ? std::move(clock) : defaultClock()),
      tracker_(seed ? FeedbackTracker(config.feedback, *seed, clock_)
                    : FeedbackTracker(config.feedback, clock_)),
      history_(config.runtime.intensity_history) {
    if (!queue_) throw ConfigurationError("tick engine requires an event queue");
    if (!meaning_) throw ConfigurationError("tick engine requires a meaning engine");
    if (!memory_) {
        memory_ = std::make_shared<MemoryHierarchyManager>(config_, clock_, log_);
    }
    memory_->attachEpisodicMemory(&state_.memory, &state_mutex_);
}

TickEngine::~TickEngine() {
    stop();
    memory_->attachEpisodicMemory(nullptr);
}

// ─── Tick ──────────────────────────────────────────────────────

double TickEngine::processEvent(const Event& event) {
    state_.noteEvent(event.type());
    state_.last_event_intensity = event.intensity();

    Attributes context = {{"event_type", event.type()}};
    Meaning meaning = meaning_->interpret(event, state_);
    if (auto automated = memory_->automatedResponse(context)) {
        meaning.pattern = *automated;
    }
    state_.last_pattern = meaning.pattern;
    state_.last_significance = meaning.significance;

    if (meaning.pattern != ActionPattern::IGNORE && meaning.significance > 0.0) {
        StateVitals before = state_.vitals();

        double scale = 0.0;
        switch (meaning.pattern) {
            case ActionPattern::IGNORE:  scale = 0.0; break;
            case ActionPattern::DAMPEN:  scale = impactScale(ActionPattern::DAMPEN); break;
            case ActionPattern::ABSORB:  scale = impactScale(ActionPattern::ABSORB); break;
            case ActionPattern::AMPLIFY: scale = impactScale(ActionPattern::AMPLIFY); break;
        }
        std::map<std::string, double> scaled;
        for (const auto& [field, value] : meaning.impact) scaled[field] = value * scale;
        state_.applyDelta(scaled);

        std::string action_id = "action_" + std::to_string(state_.ticks) + "_" +
                                toString(meaning.pattern) + "_" + std::to_string(++action_seq_);
        tracker_.registerAction(action_id, meaning.pattern, before, event.timestamp(), context);
    }

    memory_->addSensoryEvent(event);
    tracker_.recordEvent(event.type());
    return std::abs(event.intensity());
}

void TickEngine::resolveFeedback() {
    for (const auto& record : tracker_.observeConsequences(state_)) {
        MemoryEntry entry;
        entry.event_type = "feedback";
        entry.meaning_significance = 0.0;
        entry.timestamp = clock_->now();
        entry.subjective_timestamp = state_.subjective_time;
        entry.feedback_data = record;
        state_.memory.append(entry);

        memory_->learnFromFeedback(record);

        log_->record("feedback_recorded", {
            {"tick", state_.ticks},
            {"action_id", record.action_id},
            {"action_pattern", toString(record.action_pattern)},
            {"delay_ticks", record.delay_ticks},
            {"state_delta", record.state_delta},
        });
    }
    state_.pending_actions = tracker_.pendingCount();
}

void TickEngine::tickBody() {
    double dt = config_.runtime.tick_interval_seconds > 0.0
                    ? config_.runtime.tick_interval_seconds : 1.0;
    state_.ticks++;
    state_.applyDelta({{"age", dt}, {"subjective_time", dt}});

    double peak = 0.0;
    for (const auto& event : queue_->popAll(config_.runtime.max_events_per_tick)) {
        peak = std::max(peak, processEvent(event));
    }
    history_.push(peak);

    resolveFeedback();

    if (state_.ticks % static_cast<uint64_t>(config_.runtime.consolidation_interval_ticks) == 0) {
        ConsolidationResult result = memory_->consolidateMemory(state_);
        if (!result.success) {
            spdlog::warn("tick {}: consolidation failed: {}", state_.ticks, result.error_message);
        }
    }

    if (snapshots_) snapshots_->maybeSnapshot(state_);

    spdlog::trace("tick {}: energy {:.2f} stability {:.3f} integrity {:.3f} smoothed {:.3f}",
                  state_.ticks, state_.energy, state_.stability, state_.integrity,
                  history_.smoothed(config_.runtime.intensity_smoothing));
}

void TickEngine::runTick() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    try {
        tickBody();
    } catch (const std::exception& e) {
        FatalLoopError error(state_.ticks, e.what());
        tick_errors_++;
        state_.applyDelta({{"integrity", -config_.runtime.error_integrity_penalty}});
        spdlog::error("tick error, integrity now {:.3f}: {}", state_.integrity, error.what());
        log_->record("tick_error", {{"tick", error.tick()}, {"error", e.what()}});
    }
}

void TickEngine::runTicks(uint64_t n) {
    for (uint64_t i = 0; i < n; i++) runTick();
}

// ─── Thread ────────────────────────────────────────────────────

void TickEngine::runLoop() {
    auto interval = std::chrono::duration<double>(config_.runtime.tick_interval_seconds);
    while (running_.load()) {
        runTick();
        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

void TickEngine::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    log_->record("tick_engine_started", {{"tick", snapshot().ticks}});
    spdlog::info("tick engine started (interval {}s)", config_.runtime.tick_interval_seconds);
    thread_ = std::thread(&TickEngine::runLoop, this);
}

void TickEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        if (!running_.exchange(false) && !thread_.joinable()) return;
    }
    loop_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    uint64_t ticks = snapshot().ticks;
    log_->record("tick_engine_stopped", {{"tick", ticks}});
    spdlog::info("tick engine stopped at tick {}", ticks);
}

// ─── Accessors ─────────────────────────────────────────────────

SelfState TickEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void TickEngine::restoreState(const SelfState& state) {
    if (running_.load()) throw ConfigurationError("cannot restore state while running");
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = state;
    tracker_.clear();
    state_.pending_actions = 0;
}

double TickEngine::smoothedIntensity() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_.smoothed(config_.runtime.intensity_smoothing);
}

FeedbackStats TickEngine::feedbackStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tracker_.stats();
}

size_t TickEngine::pendingActions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return tracker_.pendingCount();
}

} // namespace vita
