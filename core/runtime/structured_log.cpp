#include "runtime/structured_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace vita {

StructuredLog::StructuredLog(const LoggingConfig& config) {
    if (config.structured_file.empty()) return;
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.structured_file);
        open(sink, config.structured_queue_size);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("structured log disabled, cannot open '{}': {}",
                      config.structured_file, e.what());
        logger_.reset();
        pool_.reset();
    }
}

StructuredLog::StructuredLog(spdlog::sink_ptr sink, size_t queue_size) {
    try {
        open(std::move(sink), queue_size);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("structured log disabled: {}", e.what());
        logger_.reset();
        pool_.reset();
    }
}

StructuredLog::~StructuredLog() {
    flush();
}

void StructuredLog::open(spdlog::sink_ptr sink, size_t queue_size) {
    pool_ = std::make_shared<spdlog::details::thread_pool>(queue_size > 0 ? queue_size : 1, 1);
    logger_ = std::make_shared<spdlog::async_logger>(
        "vita.structured", std::move(sink), pool_,
        spdlog::async_overflow_policy::overrun_oldest);
    logger_->set_pattern("%v");
    logger_->set_level(spdlog::level::info);
}

void StructuredLog::record(const std::string& event_type, const nlohmann::json& fields) noexcept {
    records_++;
    if (!logger_) return;
    try {
        nlohmann::json line = {
            {"event_type", event_type},
            {"timestamp", std::chrono::duration<double>(
                              std::chrono::system_clock::now().time_since_epoch()).count()},
        };
        if (fields.is_object()) {
            for (auto it = fields.begin(); it != fields.end(); ++it) {
                line[it.key()] = it.value();
            }
        } else if (!fields.is_null()) {
            line["data"] = fields;
        }
        logger_->info(line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        failures_++;
        spdlog::debug("structured record '{}' dropped: {}", event_type, e.what());
    }
}

void StructuredLog::flush() noexcept {
    if (!logger_) return;
    try {
        logger_->flush();
    } catch (const std::exception& e) {
        failures_++;
        spdlog::debug("structured log flush failed: {}", e.what());
    }
}

} // namespace vita
