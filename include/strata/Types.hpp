/**
 * @file Types.hpp
 * @brief Modes, artifact kinds and the Layer record
 */

#ifndef STRATA_TYPES_HPP
#define STRATA_TYPES_HPP

#include "strata/Value.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Execution mode
 *
 * The two modes are independent universes: layers of one mode are never
 * merged with layers of the other.
 */
enum class Mode {
    Http,
    Cli
};

/// Kind of composed artifact.
enum class ArtifactKind {
    Config,
    Routes,
    Services
};

/// Position class of a layer in the fixed ordering.
enum class LayerKind {
    Baseline,
    Provider,
    AppBase,
    AppEnv
};

constexpr std::array<Mode, 2> kAllModes = {Mode::Http, Mode::Cli};
constexpr std::array<ArtifactKind, 3> kAllKinds = {
    ArtifactKind::Config, ArtifactKind::Routes, ArtifactKind::Services};

std::string to_string(Mode mode);
std::string to_string(ArtifactKind kind);
std::string to_string(LayerKind kind);

/**
 * @brief Parse a mode token ("http" | "cli")
 * @throws std::invalid_argument on unknown token
 */
Mode parse_mode(const std::string& token);

/**
 * @brief Parse an artifact kind token ("config" | "routes" | "services")
 * @throws std::invalid_argument on unknown token
 */
ArtifactKind parse_artifact_kind(const std::string& token);

/**
 * @brief One ordered source of partial configuration, routes or services.
 */
struct Layer {
    LayerKind kind = LayerKind::Baseline;

    /// Position in the ordered list (0 = baseline).
    std::size_t order = 0;

    /// Stable handle for diagnostics (file path or "provider:<name>").
    std::string identity;

    Value payload = Value::object();
};

/**
 * @brief Immutable merged structure for one kind and mode
 *
 * Copies share the same tree; it is never mutated, only replaced by a
 * later build.
 */
class CompositionResult {
public:
    CompositionResult(ArtifactKind kind, Mode mode, Value data)
        : kind_(kind)
        , mode_(mode)
        , data_(std::make_shared<const Value>(std::move(data)))
    {}

    ArtifactKind kind() const noexcept { return kind_; }
    Mode mode() const noexcept { return mode_; }
    const Value& data() const noexcept { return *data_; }

private:
    ArtifactKind kind_;
    Mode mode_;
    std::shared_ptr<const Value> data_;
};

/**
 * @brief Index of the layer whose value won, per top-level key.
 *
 * Keys are route paths, the pattern-route key, or service identifiers.
 */
using Provenance = std::map<std::string, std::size_t>;

/**
 * @brief Check the fixed layer ordering
 *
 * Orders must be strictly increasing, the first layer must be the
 * baseline, providers precede the app base, and the environment overlay
 * (if present) is last.
 *
 * @throws LayerResolutionError naming the first misplaced position
 */
void check_layer_order(ArtifactKind kind, const std::vector<Layer>& layers);

/// Extract payloads in layer order.
std::vector<Value> payloads_of(const std::vector<Layer>& layers);

} // namespace strata

#endif // STRATA_TYPES_HPP
