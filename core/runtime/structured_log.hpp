#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/thread_pool.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace vita {

// ─── StructuredLog ─────────────────────────────────────────────
// Machine-readable record stream, one JSON object per line:
//   {"event_type": ..., "timestamp": ..., <fields>}
// Written on a private spdlog thread pool; when the queue is full the
// oldest pending record is dropped. record() never throws.

class StructuredLog {
public:
    /// Disabled log: records are counted and discarded.
    StructuredLog() = default;

    /// File-backed log at `config.structured_file`; disabled when empty
    /// or when the file cannot be opened.
    explicit StructuredLog(const LoggingConfig& config);

    /// Log writing into an arbitrary sink (tests use an ostream sink).
    StructuredLog(spdlog::sink_ptr sink, size_t queue_size);

    ~StructuredLog();

    StructuredLog(const StructuredLog&) = delete;
    StructuredLog& operator=(const StructuredLog&) = delete;

    void record(const std::string& event_type,
                const nlohmann::json& fields = nlohmann::json::object()) noexcept;

    /// Ask the worker to flush the sink. Records still queued are written
    /// at the latest when the log is destroyed.
    void flush() noexcept;

    bool enabled() const { return logger_ != nullptr; }
    uint64_t recordCount() const { return records_.load(); }
    uint64_t failureCount() const { return failures_.load(); }

private:
    void open(spdlog::sink_ptr sink, size_t queue_size);

    // Declared before the logger so the pool outlives it
    std::shared_ptr<spdlog::details::thread_pool> pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
    std::atomic<uint64_t> records_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace vita
