#pragma once

/// @file include/qrank/log.hpp
/// @brief Named spdlog logger shared by all QRank components.
///
/// The library never installs a default logger of its own; it logs through a
/// logger registered under the name "qrank" so that host applications can
/// replace sinks or levels without touching the global spdlog state.

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace qrank::log {

/// Registered logger name.
inline constexpr const char* LOGGER_NAME = "qrank";

/// The "qrank" logger. Created on first use with a colour stdout sink if the
/// host has not registered one under that name. Thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from a spdlog level name ("debug", "info", "warn",
/// "error", "off", ...). Unknown names fall back to "off" as spdlog does.
///
/// The level is shared by every engine in the process. Hosts call this once
/// at startup, typically with EngineConfig::log_level; no library component
/// calls it.
void set_level(std::string_view level_name);

}  // namespace qrank::log
