/**
 * @file Services.hpp
 * @brief Service registry compositor
 *
 * A service registry maps identifiers to definitions. A definition is
 * either a bare class reference or a shape with options:
 *
 * ```json
 * {
 *   "router": "App\\Http\\Router",
 *   "mailer": {"class": "Vendor\\Mailer", "options": {"transport": "smtp"}}
 * }
 * ```
 *
 * Unlike config and routes, registries are combined with a left-wins
 * union applied per layer step. Whole definitions win; options are never
 * merged.
 */

#ifndef STRATA_SERVICES_HPP
#define STRATA_SERVICES_HPP

#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <vector>

namespace strata {

/**
 * @brief Union of two registries keeping @p left on key collision
 * @throws MalformedPayloadError if either operand is not a mapping
 */
Value left_union(const Value& left, const Value& right);

/**
 * @brief Merge service registries (mergeServices)
 *
 * ```
 * acc = baseline
 * for p in providers: acc = p ∪ acc
 * acc = app ∪ acc
 * ```
 *
 * Net effect: last-listed provider beats earlier ones beats baseline;
 * the application beats everything.
 *
 * @param origins If non-null, receives for each identifier the index of
 *                the winning layer (0 = baseline, 1..n = providers,
 *                n + 1 = app)
 */
Value merge_services(const Value& baseline, const std::vector<Value>& providers,
                     const Value& app, Provenance* origins = nullptr);

/**
 * @brief Merge collected service layers
 *
 * Each layer is one union step in list order; the layer kind only
 * matters for sanity (a baseline must come first). Provenance indexes
 * refer to positions in @p layers.
 */
Value merge_services(const std::vector<Layer>& layers, Provenance* origins = nullptr);

} // namespace strata

#endif // STRATA_SERVICES_HPP
