#pragma once

#include "state/self_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace vita {

// ─── SnapshotStore ─────────────────────────────────────────────
// Persistence collaborator for SelfState copies.

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /// Persist a copy. Throws on I/O failure.
    virtual void saveSnapshot(const SelfState& state) = 0;

    /// Most recent snapshot. Throws InvalidArgumentError if none exists.
    virtual SelfState loadLatestSnapshot() const = 0;
};

/// One `snapshot_<ticks:06>.json` file per snapshot in a directory.
class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::string directory);

    void saveSnapshot(const SelfState& state) override;
    SelfState loadLatestSnapshot() const override;

    /// Tick of the newest snapshot file, if any.
    std::optional<uint64_t> latestTick() const;

    std::string pathFor(uint64_t ticks) const;
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

} // namespace vita
