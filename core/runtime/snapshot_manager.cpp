#include "runtime/snapshot_manager.hpp"
#include "runtime/structured_log.hpp"

#include <spdlog/spdlog.h>

namespace vita {

SnapshotManager::SnapshotManager(std::shared_ptr<SnapshotStore> store, int period_ticks,
                                 size_t queue_capacity, std::shared_ptr<StructuredLog> log)
    : store_(std::move(store)),
      period_ticks_(period_ticks),
      queue_capacity_(queue_capacity > 0 ? queue_capacity : 1),
      log_(log ? std::move(log) : std::make_shared<StructuredLog>()) {
    if (!store_) throw ConfigurationError("snapshot manager requires a store");
    if (period_ticks_ <= 0) throw ConfigurationError("snapshot period must be positive");
    worker_ = std::thread(&SnapshotManager::workerLoop, this);
}

SnapshotManager::~SnapshotManager() {
    stop();
}

bool SnapshotManager::maybeSnapshot(const SelfState& state) {
    if (state.ticks == 0 || state.ticks % static_cast<uint64_t>(period_ticks_) != 0) {
        return false;
    }
    requestSnapshot(state);
    return true;
}

void SnapshotManager::requestSnapshot(const SelfState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        if (queue_.size() >= queue_capacity_) {
            spdlog::warn("snapshot queue full, dropping snapshot of tick {}", queue_.front().ticks);
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(state);
    }
    cv_.notify_one();
}

void SnapshotManager::workerLoop() {
    for (;;) {
        SelfState state;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;     // stopping, nothing left
            state = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        SnapshotStatus result;
        result.tick = state.ticks;
        try {
            store_->saveSnapshot(state);
            result.ok = true;
            result.message = "saved";
        } catch (const std::exception& e) {
            result.ok = false;
            result.message = e.what();
            spdlog::error("snapshot of tick {} failed: {}", state.ticks, e.what());
            log_->record("snapshot_failed", {{"tick", state.ticks}, {"error", e.what()}});
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_ = result;
            if (result.ok) saved_++; else failed_++;
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void SnapshotManager::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void SnapshotManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

SnapshotStatus SnapshotManager::lastOperationStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

uint64_t SnapshotManager::savedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_;
}

uint64_t SnapshotManager::failedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

uint64_t SnapshotManager::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace vita
