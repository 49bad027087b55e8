#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"
#include "feedback/feedback_tracker.hpp"
#include "memory/hierarchy_manager.hpp"
#include "meaning/meaning.hpp"
#include "runtime/snapshot_manager.hpp"
#include "runtime/structured_log.hpp"
#include "state/event_queue.hpp"
#include "state/intensity_history.hpp"
#include "state/self_state.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace vita {

// ─── TickEngine ────────────────────────────────────────────────
// Top-level driver. One tick:
//
//   1. advance ticks, age, subjective time
//   2. drain the event queue; per event:
//        automated response? else MeaningEngine::interpret
//        pattern != ignore → apply scaled impact, register action
//        push into sensory memory, note for pending actions
//   3. resolve due feedback → episodic entries + procedural learning
//   4. every N ticks consolidate memory
//   5. periodic snapshot
//
// An exception escaping the tick costs integrity and is logged; the
// loop keeps going.

class TickEngine {
public:
    TickEngine(const VitaConfig& config,
               std::shared_ptr<EventQueue> queue,
               std::shared_ptr<MeaningEngine> meaning,
               std::shared_ptr<MemoryHierarchyManager> memory = nullptr,
               std::shared_ptr<SnapshotManager> snapshots = nullptr,
               std::shared_ptr<StructuredLog> log = nullptr,
               std::shared_ptr<Clock> clock = defaultClock(),
               std::optional<uint32_t> seed = std::nullopt);
    ~TickEngine();

    TickEngine(const TickEngine&) = delete;
    TickEngine& operator=(const TickEngine&) = delete;

    /// Run one tick on the calling thread. Never throws.
    void runTick();
    void runTicks(uint64_t n);

    /// Tick on a dedicated thread every `tick_interval_seconds`.
    void start();
    /// Let the current tick finish, then join. Idempotent.
    void stop();
    bool isRunning() const { return running_.load(); }

    /// Consistent copy of the current state.
    SelfState snapshot() const;

    /// Replace the state (e.g. from a snapshot). Not while running.
    void restoreState(const SelfState& state);

    /// Exponentially smoothed per-tick peak intensity.
    double smoothedIntensity() const;

    FeedbackStats feedbackStats() const;
    size_t pendingActions() const;
    uint64_t tickErrors() const { return tick_errors_.load(); }

    std::shared_ptr<MemoryHierarchyManager> memory() const { return memory_; }
    std::shared_ptr<EventQueue> queue() const { return queue_; }

private:
    void tickBody();
    double processEvent(const Event& event);
    void resolveFeedback();
    void runLoop();

    const VitaConfig config_;
    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<MeaningEngine> meaning_;
    std::shared_ptr<MemoryHierarchyManager> memory_;
    std::shared_ptr<SnapshotManager> snapshots_;
    std::shared_ptr<StructuredLog> log_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex state_mutex_;
    SelfState state_;
    FeedbackTracker tracker_;
    IntensityHistory history_;
    uint64_t action_seq_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_errors_{0};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    std::thread thread_;
};

} // namespace vita
