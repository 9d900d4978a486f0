/**
 * @file Builder.hpp
 * @brief Build and warm entry points
 *
 * build:  collect -> check order and shapes -> compose -> validate
 * warm:   build every kind of a mode, then persist all of them
 *
 * A failure in any step aborts before anything is written.
 */

#ifndef STRATA_BUILDER_HPP
#define STRATA_BUILDER_HPP

#include "strata/CacheWriter.hpp"
#include "strata/LayerSource.hpp"
#include "strata/RuntimeLoader.hpp"
#include "strata/Types.hpp"

#include <memory>
#include <vector>

namespace strata {

class Builder {
public:
    /**
     * @param source Layer source; must outlive the builder
     * @param writer Cache writer used by warm(); must outlive the builder
     */
    Builder(const LayerSource& source, CacheWriter& writer);

    /**
     * @brief Compose and validate one artifact (build)
     * @throws LayerResolutionError, MalformedPayloadError, ValidationError
     */
    CompositionResult build(Mode mode, ArtifactKind kind) const;

    /// Build config, routes and services of one mode (buildAll).
    CompositionSet build_all(Mode mode) const;

    /**
     * @brief Build and persist every kind of one mode (warm)
     *
     * All kinds are built and validated before the first write.
     *
     * @param overwrite If false, existing artifacts are kept and skipped
     * @param invalidate_external_cache Signal the invalidator after swaps
     * @return Artifacts actually written
     * @throws CompositionError on any build or write failure
     */
    std::vector<CacheArtifact> warm(Mode mode, bool overwrite,
                                    bool invalidate_external_cache) const;

    /// warm() for both modes; both are built before either is written.
    std::vector<CacheArtifact> warm_all(bool overwrite, bool invalidate_external_cache) const;

private:
    const LayerSource& source_;
    CacheWriter& writer_;

    std::vector<CacheArtifact> persist_set(const std::vector<CompositionResult>& results,
                                           bool overwrite, bool invalidate) const;
};

} // namespace strata

#endif // STRATA_BUILDER_HPP
