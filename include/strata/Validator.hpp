/**
 * @file Validator.hpp
 * @brief Structural validation of composed artifacts
 *
 * - config: top level is a mapping; nothing opaque anywhere
 * - routes: every entry (and every pattern-route item) has a non-empty
 *   controller, action and methods list
 * - services: every definition resolves to a non-empty class reference;
 *   options hold only scalars, lists and mappings
 * - all kinds: every string and key is valid UTF-8
 *
 * Validation is exhaustive: every violation is collected.
 */

#ifndef STRATA_VALIDATOR_HPP
#define STRATA_VALIDATOR_HPP

#include "strata/Errors.hpp"
#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <vector>

namespace strata {

/**
 * @brief Collect every structural violation in a composed artifact
 *
 * @param kind Artifact kind
 * @param result The composed value
 * @param origins Optional provenance; when given, each violation carries
 *                the position of the layer that supplied the entry
 * @param layers Optional layer list used to translate provenance into
 *               layer order and identity
 * @return All violations (empty if valid)
 */
std::vector<Violation> validate(ArtifactKind kind, const Value& result,
                                const Provenance* origins = nullptr,
                                const std::vector<Layer>* layers = nullptr);

/**
 * @brief Validate and throw the kind-specific error on any violation
 *
 * @throws MissingRouteFieldError for routes
 * @throws UnresolvableServiceDefinitionError for services
 * @throws ValidationError for config
 */
void ensure_valid(ArtifactKind kind, const Value& result,
                  const Provenance* origins = nullptr,
                  const std::vector<Layer>* layers = nullptr);

/**
 * @brief Check that every layer payload is a mapping
 * @throws MalformedPayloadError naming the first offending layer
 */
void check_payload_shapes(ArtifactKind kind, const std::vector<Layer>& layers);

} // namespace strata

#endif // STRATA_VALIDATOR_HPP
