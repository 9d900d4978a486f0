/**
 * @file LayerSource.cpp
 * @brief In-memory and on-disk layer sources
 */

#include "strata/LayerSource.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"

#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace strata {

// ============================================================================
// LayerSlots
// ============================================================================

LayerSlots& LayerSlots::set(Mode mode, ArtifactKind kind, Value payload) {
    slots_[{mode, kind}] = std::move(payload);
    return *this;
}

const Value* LayerSlots::find(Mode mode, ArtifactKind kind) const {
    auto it = slots_.find({mode, kind});
    return it == slots_.end() ? nullptr : &it->second;
}

// ============================================================================
// StaticLayerSource
// ============================================================================

void StaticLayerSource::register_provider(const std::string& name, LayerSlots slots) {
    packages_[name] = std::move(slots);
}

void StaticLayerSource::set_provider_list(std::vector<std::string> names) {
    provider_list_ = std::move(names);
}

std::vector<Layer> StaticLayerSource::collect_layers(Mode mode, ArtifactKind kind) const {
    std::vector<Layer> layers;
    std::size_t order = 0;

    auto take = [&](LayerKind layer_kind, const LayerSlots& slots, const std::string& identity) {
        if (const Value* payload = slots.find(mode, kind)) {
            layers.push_back(Layer{layer_kind, order, identity, *payload});
        }
        ++order;
    };

    take(LayerKind::Baseline, baseline_, "baseline");

    std::set<std::string> seen;
    for (const auto& name : provider_list_) {
        auto it = packages_.find(name);
        if (it == packages_.end()) {
            throw LayerResolutionError(kind, order, name, "provider is not registered");
        }
        if (!seen.insert(name).second) {
            throw LayerResolutionError(kind, order, name, "provider listed more than once");
        }
        take(LayerKind::Provider, it->second, "provider:" + name);
    }

    take(LayerKind::AppBase, app_base_, "app");
    if (kind != ArtifactKind::Services) {
        take(LayerKind::AppEnv, app_env_, "app:env");
    }

    return layers;
}

// ============================================================================
// DirectoryLayerSource
// ============================================================================

DirectoryLayerSource::DirectoryLayerSource(DirectoryLayout layout)
    : layout_(std::move(layout)) {}

std::string DirectoryLayerSource::slot_stem(Mode mode, ArtifactKind kind,
                                            const std::string& environment) {
    std::string stem = to_string(mode) + "_" + to_string(kind);
    if (!environment.empty()) {
        stem += "." + environment;
    }
    return stem;
}

std::string DirectoryLayerSource::resolve_provider_dir(const std::string& ref) const {
    fs::path p(ref);
    if (p.is_relative() && !layout_.providers_root.empty()) {
        p = fs::path(layout_.providers_root) / p;
    }
    return p.lexically_normal().string();
}

std::optional<Layer> DirectoryLayerSource::read_slot(ArtifactKind kind, LayerKind layer_kind,
                                                     std::size_t order, const std::string& dir,
                                                     const std::string& stem) const {
    const fs::path base = fs::path(dir) / stem;
    const std::string json_path = base.string() + ".json";
    const std::string toml_path = base.string() + ".toml";

    const bool has_json = file_exists(json_path);
    const bool has_toml = file_exists(toml_path);

    if (has_json && has_toml) {
        throw MalformedPayloadError(kind, order, base.string() + ".{json,toml}", "",
                                    "both a JSON and a TOML slot exist");
    }
    if (!has_json && !has_toml) {
        logger()->debug("{} slot {} absent at {}", to_string(layer_kind), stem, dir);
        return std::nullopt;
    }

    const std::string path = has_json ? json_path : toml_path;
    Layer layer;
    layer.kind = layer_kind;
    layer.order = order;
    layer.identity = path;
    try {
        layer.payload = load_payload_file(path);
    } catch (const ParseError& e) {
        throw MalformedPayloadError(kind, order, path, "", e.details());
    } catch (const FileNotFoundError& e) {
        throw LayerResolutionError(kind, order, path, e.what());
    }

    logger()->debug("{} layer {} read from {}", to_string(layer_kind), order, path);
    return layer;
}

std::vector<Layer> DirectoryLayerSource::collect_layers(Mode mode, ArtifactKind kind) const {
    std::vector<Layer> layers;
    std::size_t order = 0;
    const std::string stem = slot_stem(mode, kind);

    auto take = [&](LayerKind layer_kind, const std::string& dir, const std::string& slot) {
        if (auto layer = read_slot(kind, layer_kind, order, dir, slot)) {
            layers.push_back(std::move(*layer));
        }
        ++order;
    };

    if (!layout_.baseline_dir.empty()) {
        take(LayerKind::Baseline, layout_.baseline_dir, stem);
    } else {
        ++order;
    }

    std::set<std::string> seen;
    for (const auto& ref : layout_.providers) {
        const std::string dir = resolve_provider_dir(ref);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            throw LayerResolutionError(kind, order, ref, "no provider directory at " + dir);
        }
        if (!seen.insert(dir).second) {
            throw LayerResolutionError(kind, order, ref, "provider listed more than once");
        }
        take(LayerKind::Provider, dir, stem);
    }

    if (!layout_.app_dir.empty()) {
        take(LayerKind::AppBase, layout_.app_dir, stem);
        if (kind != ArtifactKind::Services && !layout_.environment.empty()) {
            take(LayerKind::AppEnv, layout_.app_dir, slot_stem(mode, kind, layout_.environment));
        }
    }

    return layers;
}

} // namespace strata
