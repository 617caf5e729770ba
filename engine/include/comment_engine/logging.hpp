#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace comments {

inline constexpr const char* kLoggerName = "comment_engine";

// Engine-wide logger, created on first use (stderr, level warn).
std::shared_ptr<spdlog::logger> engine_logger();

// Applies SPDLOG_LEVEL from the environment, e.g. "comment_engine=debug".
void configure_logging_from_env();

} // namespace comments
