/**
 * @file Types.cpp
 * @brief Enum conversions and layer order checks
 */

#include "strata/Types.hpp"
#include "strata/Errors.hpp"

#include <stdexcept>

namespace strata {

std::string to_string(Mode mode) {
    switch (mode) {
        case Mode::Http: return "http";
        case Mode::Cli: return "cli";
    }
    return "unknown";
}

std::string to_string(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Config: return "config";
        case ArtifactKind::Routes: return "routes";
        case ArtifactKind::Services: return "services";
    }
    return "unknown";
}

std::string to_string(LayerKind kind) {
    switch (kind) {
        case LayerKind::Baseline: return "baseline";
        case LayerKind::Provider: return "provider";
        case LayerKind::AppBase: return "app_base";
        case LayerKind::AppEnv: return "app_env";
    }
    return "unknown";
}

Mode parse_mode(const std::string& token) {
    if (token == "http") return Mode::Http;
    if (token == "cli") return Mode::Cli;
    throw std::invalid_argument("Unknown mode: '" + token + "' (expected http or cli)");
}

ArtifactKind parse_artifact_kind(const std::string& token) {
    if (token == "config") return ArtifactKind::Config;
    if (token == "routes") return ArtifactKind::Routes;
    if (token == "services") return ArtifactKind::Services;
    throw std::invalid_argument("Unknown artifact kind: '" + token +
                                "' (expected config, routes or services)");
}

void check_layer_order(ArtifactKind kind, const std::vector<Layer>& layers) {
    for (std::size_t i = 0; i < layers.size(); ++i) {
        const Layer& layer = layers[i];
        if (i == 0) {
            continue;
        }
        const Layer& prev = layers[i - 1];
        if (layer.order <= prev.order) {
            throw LayerResolutionError(kind, layer.order, layer.identity,
                                       "order position already taken by '" + prev.identity + "'");
        }
        if (static_cast<int>(layer.kind) < static_cast<int>(prev.kind)) {
            throw LayerResolutionError(kind, layer.order, layer.identity,
                                       to_string(layer.kind) + " layer placed after " +
                                       to_string(prev.kind) + " layer");
        }
        if (layer.kind == prev.kind && layer.kind != LayerKind::Provider) {
            throw LayerResolutionError(kind, layer.order, layer.identity,
                                       "more than one " + to_string(layer.kind) + " layer");
        }
    }
}

std::vector<Value> payloads_of(const std::vector<Layer>& layers) {
    std::vector<Value> out;
    out.reserve(layers.size());
    for (const auto& layer : layers) {
        out.push_back(layer.payload);
    }
    return out;
}

} // namespace strata
