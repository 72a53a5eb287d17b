/// @file src/core/log.cpp
/// @brief Lazy registration of the "qrank" spdlog logger.

#include "qrank/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace qrank::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex init_mutex;
    std::lock_guard<std::mutex> lock(init_mutex);

    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto created = spdlog::stdout_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::info);
    return created;
}

void set_level(std::string_view level_name) {
    logger()->set_level(spdlog::level::from_str(std::string(level_name)));
}

}  // namespace qrank::log
