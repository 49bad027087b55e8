#pragma once

#include "common/config.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace vita {
namespace logging {

/// Install the process-wide `vita` logger: colour stderr sink plus an
/// optional file sink, level taken from the config. Safe to call again;
/// the previous default logger is replaced.
void init(const LoggingConfig& config);

/// Parse "trace" .. "off". Unknown names throw ConfigurationError.
spdlog::level::level_enum parseLevel(const std::string& name);

} // namespace logging
} // namespace vita
