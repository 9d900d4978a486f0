/**
 * @file LayerSource.hpp
 * @brief Layer source readers
 *
 * A layer source returns, for one mode and artifact kind, the payloads
 * in the fixed order:
 *
 *   baseline, providers (in listed order), app base, app env
 *
 * Absent slots are omitted. No merging happens here.
 */

#ifndef STRATA_LAYER_SOURCE_HPP
#define STRATA_LAYER_SOURCE_HPP

#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {

/**
 * @brief Interface of a layer source reader (collectLayers)
 */
class LayerSource {
public:
    virtual ~LayerSource() = default;

    /**
     * @brief Retrieve the ordered layers for one mode and kind
     * @throws LayerResolutionError if a listed provider cannot be resolved
     * @throws MalformedPayloadError if a slot exists but cannot be read
     */
    virtual std::vector<Layer> collect_layers(Mode mode, ArtifactKind kind) const = 0;
};

/**
 * @brief Slots of one layer: one optional payload per (mode, kind)
 */
class LayerSlots {
public:
    LayerSlots& set(Mode mode, ArtifactKind kind, Value payload);

    const Value* find(Mode mode, ArtifactKind kind) const;

private:
    std::map<std::pair<Mode, ArtifactKind>, Value> slots_;
};

/**
 * @brief In-memory layer source
 *
 * Provider packages are registered by name; the application then lists
 * the ones it uses, in order.
 *
 * ```cpp
 * StaticLayerSource src;
 * src.baseline().set(Mode::Http, ArtifactKind::Config, {{"a", 1}});
 * src.register_provider("auth", auth_slots);
 * src.set_provider_list({"auth"});
 * src.app_base().set(Mode::Http, ArtifactKind::Config, {{"a", 2}});
 * auto layers = src.collect_layers(Mode::Http, ArtifactKind::Config);
 * ```
 */
class StaticLayerSource : public LayerSource {
public:
    LayerSlots& baseline() { return baseline_; }
    LayerSlots& app_base() { return app_base_; }
    LayerSlots& app_env() { return app_env_; }

    void register_provider(const std::string& name, LayerSlots slots);
    void set_provider_list(std::vector<std::string> names);

    std::vector<Layer> collect_layers(Mode mode, ArtifactKind kind) const override;

private:
    LayerSlots baseline_;
    LayerSlots app_base_;
    LayerSlots app_env_;
    std::map<std::string, LayerSlots> packages_;
    std::vector<std::string> provider_list_;
};

/**
 * @brief On-disk layout of the layers
 */
struct DirectoryLayout {
    /// Directory holding the baseline slots.
    std::string baseline_dir;

    /// Provider directories (absolute, or relative to providers_root).
    std::vector<std::string> providers;

    /// Base for relative provider references; empty = as given.
    std::string providers_root;

    /// Directory holding the app base and env overlay slots.
    std::string app_dir;

    /// Environment name selecting the overlay; empty = no overlay.
    std::string environment;
};

/**
 * @brief Layer source reading slot files from directories
 *
 * Slot file names: `<mode>_<kind>.json` or `<mode>_<kind>.toml`; the app
 * environment overlay is `<mode>_<kind>.<environment>.json|toml`.
 * Services have no environment overlay.
 */
class DirectoryLayerSource : public LayerSource {
public:
    explicit DirectoryLayerSource(DirectoryLayout layout);

    const DirectoryLayout& layout() const noexcept { return layout_; }

    std::vector<Layer> collect_layers(Mode mode, ArtifactKind kind) const override;

    /**
     * @brief Slot file base name without extension, e.g. "http_routes"
     * @param environment Environment suffix, empty for base slots
     */
    static std::string slot_stem(Mode mode, ArtifactKind kind,
                                 const std::string& environment = "");

private:
    DirectoryLayout layout_;

    std::string resolve_provider_dir(const std::string& ref) const;

    std::optional<Layer> read_slot(ArtifactKind kind, LayerKind layer_kind,
                                   std::size_t order, const std::string& dir,
                                   const std::string& stem) const;
};

} // namespace strata

#endif // STRATA_LAYER_SOURCE_HPP
