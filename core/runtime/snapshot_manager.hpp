#pragma once

#include "runtime/snapshot_store.hpp"
#include "state/self_state.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vita {

class StructuredLog;

struct SnapshotStatus {
    bool ok = true;
    uint64_t tick = 0;
    std::string message = "no snapshot taken";
};

// ─── SnapshotManager ───────────────────────────────────────────
// Periodic, non-blocking snapshots. The tick thread hands over copies;
// a worker thread writes them. When the queue is full the oldest
// pending copy is dropped. Save failures are logged and recorded,
// never propagated.

class SnapshotManager {
public:
    SnapshotManager(std::shared_ptr<SnapshotStore> store, int period_ticks,
                    size_t queue_capacity = 4,
                    std::shared_ptr<StructuredLog> log = nullptr);
    ~SnapshotManager();

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    /// Queue a snapshot when `state.ticks` is a positive multiple of the
    /// period. Returns true if one was queued.
    bool maybeSnapshot(const SelfState& state);

    /// Queue a snapshot unconditionally.
    void requestSnapshot(const SelfState& state);

    /// Wait until every queued snapshot has been processed.
    void flush();

    /// Drain the queue and join the worker. Idempotent.
    void stop();

    SnapshotStatus lastOperationStatus() const;
    uint64_t savedCount() const;
    uint64_t failedCount() const;
    uint64_t droppedCount() const;
    int periodTicks() const { return period_ticks_; }

private:
    void workerLoop();

    std::shared_ptr<SnapshotStore> store_;
    int period_ticks_;
    size_t queue_capacity_;
    std::shared_ptr<StructuredLog> log_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<SelfState> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    SnapshotStatus status_;
    uint64_t saved_ = 0;
    uint64_t failed_ = 0;
    uint64_t dropped_ = 0;

    std::thread worker_;
};

} // namespace vita
