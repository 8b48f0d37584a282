#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace statebeam {

/// Shared library logger ("statebeam"), created on first use.
/// Writes to stderr; default level is warn.
std::shared_ptr<spdlog::logger> logger();

/// Change the level of the library logger.
void setLogLevel(spdlog::level::level_enum level);

} // namespace statebeam

#define STATEBEAM_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::statebeam::logger(), __VA_ARGS__)
#define STATEBEAM_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::statebeam::logger(), __VA_ARGS__)
#define STATEBEAM_LOG_INFO(...)  SPDLOG_LOGGER_INFO(::statebeam::logger(), __VA_ARGS__)
#define STATEBEAM_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::statebeam::logger(), __VA_ARGS__)
#define STATEBEAM_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::statebeam::logger(), __VA_ARGS__)
