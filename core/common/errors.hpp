#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vita {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure the core reports is one of these. Callers that must
// keep running (tick loop, consolidation) catch std::exception at
// the boundary and record the message.

/// Unknown memory level, malformed query params, out-of-range input.
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A single consolidation stage failed. Recorded, never fatal.
class TransientStoreFailure : public std::runtime_error {
public:
    TransientStoreFailure(const std::string& stage, const std::string& what)
        : std::runtime_error(stage + ": " + what), stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

/// Invalid configuration or a missing component dependency.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Unexpected exception escaping the tick body.
class FatalLoopError : public std::runtime_error {
public:
    FatalLoopError(uint64_t tick, const std::string& what)
        : std::runtime_error("tick " + std::to_string(tick) + ": " + what),
          tick_(tick) {}

    uint64_t tick() const { return tick_; }

private:
    uint64_t tick_;
};

} // namespace vita
