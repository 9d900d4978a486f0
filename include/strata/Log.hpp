/**
 * @file Log.hpp
 * @brief Library logger
 */

#ifndef STRATA_LOG_HPP
#define STRATA_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace strata {

/**
 * @brief The shared "strata" logger (stderr, colored on a tty)
 *
 * Created on first use. Default level is warn.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from a name ("trace" ... "off")
 * @throws std::invalid_argument on an unknown level name
 */
void set_log_level(const std::string& level);

} // namespace strata

#endif // STRATA_LOG_HPP
