/**
 * @file Routes.hpp
 * @brief Route table compositor
 *
 * A route table maps literal request paths to route entries:
 *
 * ```json
 * {
 *   "/login": {"controller": "Auth\\Login", "action": "show", "methods": ["GET"]},
 *   "regex": [
 *     {"pattern": "/post/{id}", "controller": "Blog\\Post", "action": "show", "methods": ["GET"]}
 *   ]
 * }
 * ```
 *
 * Entries are deep merged per path, last layer wins. The pattern-route
 * list is a list, so a later layer declaring it replaces the whole list.
 */

#ifndef STRATA_ROUTES_HPP
#define STRATA_ROUTES_HPP

#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <vector>

namespace strata {

/// Reserved key holding the ordered pattern-route list.
inline constexpr const char* kPatternRoutesKey = "regex";

/**
 * @brief Merge route layers in order (mergeRoutes)
 *
 * @param layers Route tables in layer order
 * @param origins If non-null, receives for each top-level key the index
 *                of the last layer that declared it
 * @return Merged route table
 * @throws MalformedPayloadError if a layer is not a mapping
 */
Value merge_routes(const std::vector<Value>& layers, Provenance* origins = nullptr);

/// True if @p key is the reserved pattern-route key.
bool is_pattern_routes_key(const std::string& key);

} // namespace strata

#endif // STRATA_ROUTES_HPP
