#include "util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace statebeam {

namespace {
const char* kLoggerName = "statebeam";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(kLoggerName);
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace statebeam
