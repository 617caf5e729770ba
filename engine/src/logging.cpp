#include "comment_engine/logging.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace comments {

std::shared_ptr<spdlog::logger> engine_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) return existing;
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return logger;
}

void configure_logging_from_env() {
    // register first so the env levels apply to it
    engine_logger();
    spdlog::cfg::load_env_levels();
}

} // namespace comments
