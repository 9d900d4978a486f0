/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for environment variables and overrides
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 */

#ifndef STRATA_PARSE_HPP
#define STRATA_PARSE_HPP

#include "strata/Value.hpp"

#include <string>

namespace strata {

/**
 * @brief Parse string value to the matching type
 *
 * ```cpp
 * parse_value("true")         // → true
 * parse_value("8080")         // → 8080
 * parse_value("[\"auth\"]")   // → ["auth"]
 * parse_value("\"prod\"")     // → "prod"
 * parse_value("var/cache")    // → "var/cache"
 * ```
 */
Value parse_value(const std::string& str);

} // namespace strata

#endif // STRATA_PARSE_HPP
