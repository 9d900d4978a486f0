/**
 * @file Errors.hpp
 * @brief Exception types for strata
 *
 * Error taxonomy:
 * - StrataError: Base class
 *   - CompositionError: Base of everything a build or load can raise
 *     - LayerResolutionError: A listed layer cannot be located
 *     - MalformedPayloadError: A payload is not a mapping where required
 *     - ValidationError: Structural violations in a composed artifact
 *       - MissingRouteFieldError
 *       - UnresolvableServiceDefinitionError
 *     - CacheWriteError: Atomic write-then-swap did not complete
 *     - ArtifactNotFoundError: No canonical artifact at runtime load
 *     - ArtifactCorruptError: Canonical artifact cannot be used
 *   - FileNotFoundError, ParseError: Settings and payload files
 *   - KeyError, TypeError: Dot-path traversal
 *   - MissingMandatoryConfig: Mandatory settings keys absent
 */

#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include "strata/Types.hpp"

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

/**
 * @brief Base class for all strata exceptions
 */
class StrataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for build and load failures
 */
class CompositionError : public StrataError {
public:
    using StrataError::StrataError;
};

/**
 * @brief A single structural problem found in a composed artifact
 */
struct Violation {
    ArtifactKind kind = ArtifactKind::Config;

    /// Position of the layer that supplied the offending value, if known.
    std::optional<std::size_t> layer_index;

    /// Identity of that layer, if known.
    std::string layer_identity;

    /// Offending route path / pattern index / service id / config key.
    std::string location;

    std::string message;

    /// One line: "routes: layer 2 (app/http_routes.json) at '/x': ..."
    std::string to_string() const {
        std::ostringstream oss;
        oss << strata::to_string(kind) << ":";
        if (layer_index.has_value()) {
            oss << " layer " << *layer_index;
            if (!layer_identity.empty()) oss << " (" << layer_identity << ")";
        }
        if (!location.empty()) oss << " at '" << location << "'";
        oss << ": " << message;
        return oss.str();
    }
};

/**
 * @brief A listed layer cannot be resolved to a payload source
 */
class LayerResolutionError : public CompositionError {
public:
    /**
     * @param kind Artifact kind being collected
     * @param position Position of the layer in the ordered list
     * @param reference The provider name or path that failed
     * @param reason Short explanation
     */
    LayerResolutionError(ArtifactKind kind, std::size_t position,
                         std::string reference, const std::string& reason)
        : CompositionError(strata::to_string(kind) + ": cannot resolve layer " +
                           std::to_string(position) + " '" + reference + "': " + reason)
        , kind_(kind)
        , position_(position)
        , reference_(std::move(reference))
    {}

    ArtifactKind kind() const noexcept { return kind_; }
    std::size_t position() const noexcept { return position_; }
    const std::string& reference() const noexcept { return reference_; }

private:
    ArtifactKind kind_;
    std::size_t position_;
    std::string reference_;
};

/**
 * @brief A payload is not a mapping where one is required
 */
class MalformedPayloadError : public CompositionError {
public:
    MalformedPayloadError(ArtifactKind kind, std::optional<std::size_t> layer_index,
                          std::string identity, std::string location,
                          const std::string& details)
        : CompositionError(format_message(kind, layer_index, identity, location, details))
        , kind_(kind)
        , layer_index_(layer_index)
        , identity_(std::move(identity))
        , location_(std::move(location))
    {}

    ArtifactKind kind() const noexcept { return kind_; }
    const std::optional<std::size_t>& layer_index() const noexcept { return layer_index_; }
    const std::string& identity() const noexcept { return identity_; }
    const std::string& location() const noexcept { return location_; }

private:
    ArtifactKind kind_;
    std::optional<std::size_t> layer_index_;
    std::string identity_;
    std::string location_;

    static std::string format_message(ArtifactKind kind,
                                      const std::optional<std::size_t>& layer_index,
                                      const std::string& identity,
                                      const std::string& location,
                                      const std::string& details) {
        Violation v;
        v.kind = kind;
        v.layer_index = layer_index;
        v.layer_identity = identity;
        v.location = location;
        v.message = "malformed payload: " + details;
        return v.to_string();
    }
};

/**
 * @brief One or more structural violations in a composed artifact
 *
 * Holds every violation found, not just the first.
 */
class ValidationError : public CompositionError {
public:
    ValidationError(ArtifactKind kind, std::vector<Violation> violations)
        : CompositionError(format_message(kind, violations))
        , kind_(kind)
        , violations_(std::move(violations))
    {}

    ArtifactKind kind() const noexcept { return kind_; }

    const std::vector<Violation>& violations() const noexcept {
        return violations_;
    }

private:
    ArtifactKind kind_;
    std::vector<Violation> violations_;

    static std::string format_message(ArtifactKind kind,
                                      const std::vector<Violation>& violations) {
        std::ostringstream oss;
        oss << strata::to_string(kind) << " failed validation with "
            << violations.size() << " violation(s)";
        for (const auto& v : violations) {
            oss << "\n  " << v.to_string();
        }
        return oss.str();
    }
};

/**
 * @brief Route entries lack controller, action or methods
 */
class MissingRouteFieldError : public ValidationError {
public:
    explicit MissingRouteFieldError(std::vector<Violation> violations)
        : ValidationError(ArtifactKind::Routes, std::move(violations))
    {}
};

/**
 * @brief Service definitions lack a class or carry disallowed options
 */
class UnresolvableServiceDefinitionError : public ValidationError {
public:
    explicit UnresolvableServiceDefinitionError(std::vector<Violation> violations)
        : ValidationError(ArtifactKind::Services, std::move(violations))
    {}
};

/**
 * @brief The atomic write-then-swap could not complete
 *
 * The previous artifact at path() is intact when this is raised before
 * the swap. When swapped() is true the new artifact is live and its
 * identity still needs invalidating.
 */
class CacheWriteError : public CompositionError {
public:
    CacheWriteError(std::string path, std::string details, bool swapped = false)
        : CompositionError("Cannot write artifact '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
        , swapped_(swapped)
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& details() const noexcept { return details_; }

    /// True if the new content was already renamed onto path().
    bool swapped() const noexcept { return swapped_; }

private:
    std::string path_;
    std::string details_;
    bool swapped_;
};

/**
 * @brief Runtime load found no canonical artifact
 */
class ArtifactNotFoundError : public CompositionError {
public:
    ArtifactNotFoundError(ArtifactKind kind, Mode mode, std::string path)
        : CompositionError("No " + strata::to_string(mode) + " " + strata::to_string(kind) +
                           " artifact at '" + path + "' (run warm first)")
        , kind_(kind)
        , mode_(mode)
        , path_(std::move(path))
    {}

    ArtifactKind kind() const noexcept { return kind_; }
    Mode mode() const noexcept { return mode_; }
    const std::string& path() const noexcept { return path_; }

private:
    ArtifactKind kind_;
    Mode mode_;
    std::string path_;
};

/**
 * @brief Canonical artifact exists but is unreadable or inconsistent
 */
class ArtifactCorruptError : public CompositionError {
public:
    ArtifactCorruptError(std::string path, std::string details)
        : CompositionError("Corrupt artifact '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public StrataError {
public:
    explicit FileNotFoundError(std::string path)
        : StrataError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML syntax error in a file
 */
class ParseError : public StrataError {
public:
    ParseError(std::string file, std::string details)
        : StrataError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public StrataError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "cache.dir")
     * @param segment The specific segment that doesn't exist (e.g., "dir")
     */
    KeyError(std::string path, std::string segment)
        : StrataError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Attempt to traverse into a non-container during dot-path access
 */
class TypeError : public StrataError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : StrataError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Mandatory settings keys are missing after loading
 */
class MissingMandatoryConfig : public StrataError {
public:
    /**
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : StrataError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace strata

#endif // STRATA_ERRORS_HPP
