/**
 * @file Builder.cpp
 * @brief Build and warm orchestration
 */

#include "strata/Builder.hpp"
#include "strata/Errors.hpp"
#include "strata/Log.hpp"
#include "strata/Merge.hpp"
#include "strata/Routes.hpp"
#include "strata/Services.hpp"
#include "strata/Validator.hpp"

namespace strata {

Builder::Builder(const LayerSource& source, CacheWriter& writer)
    : source_(source), writer_(writer) {}

CompositionResult Builder::build(Mode mode, ArtifactKind kind) const {
    logger()->info("building {} {}", to_string(mode), to_string(kind));

    const std::vector<Layer> layers = source_.collect_layers(mode, kind);
    check_layer_order(kind, layers);
    check_payload_shapes(kind, layers);

    for (const auto& layer : layers) {
        logger()->debug("  layer {} {} {}", layer.order, to_string(layer.kind), layer.identity);
    }

    Provenance origins;
    Value composed;
    switch (kind) {
        case ArtifactKind::Config:
            composed = merge_config(payloads_of(layers), &origins);
            break;
        case ArtifactKind::Routes:
            composed = merge_routes(payloads_of(layers), &origins);
            break;
        case ArtifactKind::Services:
            composed = merge_services(layers, &origins);
            break;
    }

    ensure_valid(kind, composed, &origins, &layers);

    logger()->info("built {} {} from {} layer(s), {} top-level key(s)",
                   to_string(mode), to_string(kind), layers.size(), composed.size());
    return CompositionResult(kind, mode, std::move(composed));
}

CompositionSet Builder::build_all(Mode mode) const {
    return CompositionSet{
        build(mode, ArtifactKind::Config),
        build(mode, ArtifactKind::Routes),
        build(mode, ArtifactKind::Services),
    };
}

std::vector<CacheArtifact> Builder::persist_set(const std::vector<CompositionResult>& results,
                                                bool overwrite, bool invalidate) const {
    std::vector<CacheArtifact> written;
    const CompositionResult* current = nullptr;

    try {
        for (const auto& result : results) {
            if (!overwrite && writer_.exists(result.kind(), result.mode())) {
                logger()->info("keeping existing {} {} artifact",
                               to_string(result.mode()), to_string(result.kind()));
                continue;
            }
            current = &result;
            written.push_back(writer_.write(result.kind(), result.mode(), result.data()));
        }
    } catch (const CacheWriteError& e) {
        // Artifacts swapped before the failure are live, and so is the
        // failing one if its rename committed; keep external caches
        // consistent with them before reporting.
        if (e.swapped() && current != nullptr) {
            written.push_back(CacheWriter::swapped_artifact(current->kind(), current->mode(),
                                                            e.path()));
        }
        if (invalidate) {
            writer_.invalidate(written);
        }
        throw;
    }

    if (invalidate) {
        writer_.invalidate(written);
    }
    return written;
}

std::vector<CacheArtifact> Builder::warm(Mode mode, bool overwrite,
                                         bool invalidate_external_cache) const {
    CompositionSet set = build_all(mode);
    return persist_set({set.config, set.routes, set.services},
                       overwrite, invalidate_external_cache);
}

std::vector<CacheArtifact> Builder::warm_all(bool overwrite, bool invalidate_external_cache) const {
    std::vector<CompositionResult> results;
    for (Mode mode : kAllModes) {
        CompositionSet set = build_all(mode);
        results.push_back(set.config);
        results.push_back(set.routes);
        results.push_back(set.services);
    }
    return persist_set(results, overwrite, invalidate_external_cache);
}

} // namespace strata
