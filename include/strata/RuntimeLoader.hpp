/**
 * @file RuntimeLoader.hpp
 * @brief Boot-time loading of persisted artifacts
 *
 * Reads canonical artifacts only. Never merges, never rebuilds, never
 * falls back to an empty structure.
 */

#ifndef STRATA_RUNTIME_LOADER_HPP
#define STRATA_RUNTIME_LOADER_HPP

#include "strata/Types.hpp"

#include <string>

namespace strata {

/**
 * @brief The three results of one mode
 */
struct CompositionSet {
    CompositionResult config;
    CompositionResult routes;
    CompositionResult services;
};

class RuntimeLoader {
public:
    explicit RuntimeLoader(std::string cache_dir);

    /**
     * @brief Load one canonical artifact (load)
     * @throws ArtifactNotFoundError if the artifact is absent
     * @throws ArtifactCorruptError if it cannot be parsed or its header
     *         does not match the requested kind and mode
     */
    CompositionResult load(ArtifactKind kind, Mode mode) const;

    /// Load config, routes and services of one mode.
    CompositionSet load_all(Mode mode) const;

    const std::string& cache_dir() const noexcept { return cache_dir_; }

private:
    std::string cache_dir_;
};

} // namespace strata

#endif // STRATA_RUNTIME_LOADER_HPP
