/**
 * @file Log.cpp
 * @brief Library logger
 */

#include "strata/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>

namespace strata {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("strata");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("strata");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: '" + level + "'");
    }
    logger()->set_level(parsed);
}

} // namespace strata
