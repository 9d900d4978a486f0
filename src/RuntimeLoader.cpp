/**
 * @file RuntimeLoader.cpp
 * @brief Boot-time artifact loading
 */

#include "strata/RuntimeLoader.hpp"
#include "strata/CacheWriter.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"

#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace strata {

namespace {

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string header_field(const Value& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // anonymous namespace

RuntimeLoader::RuntimeLoader(std::string cache_dir)
    : cache_dir_(std::move(cache_dir)) {}

CompositionResult RuntimeLoader::load(ArtifactKind kind, Mode mode) const {
    const std::string path = artifact_path(cache_dir_, kind, mode);

    if (!path_exists(path)) {
        logger()->critical("missing {} {} artifact at {}", to_string(mode), to_string(kind), path);
        throw ArtifactNotFoundError(kind, mode, path);
    }
    if (!file_exists(path)) {
        throw ArtifactCorruptError(path, "not a regular file");
    }

    Value doc;
    try {
        doc = Value::parse(read_file(path));
    } catch (const nlohmann::json::parse_error& e) {
        throw ArtifactCorruptError(path, e.what());
    } catch (const FileNotFoundError&) {
        // Either removed between the existence check and the read, or
        // present but unreadable.
        if (!path_exists(path)) {
            throw ArtifactNotFoundError(kind, mode, path);
        }
        throw ArtifactCorruptError(path, "unreadable");
    }

    if (!doc.is_object()) {
        throw ArtifactCorruptError(path, "document is not an object");
    }

    auto format = doc.find("format");
    if (format == doc.end() || !format->is_number_integer() ||
        format->get<std::int64_t>() != kArtifactFormat) {
        throw ArtifactCorruptError(path, "unsupported artifact format");
    }
    if (header_field(doc, "kind") != to_string(kind)) {
        throw ArtifactCorruptError(path, "artifact is not a " + to_string(kind) + " artifact");
    }
    if (header_field(doc, "mode") != to_string(mode)) {
        throw ArtifactCorruptError(path, "artifact is not for mode " + to_string(mode));
    }

    auto payload = doc.find("payload");
    if (payload == doc.end() || !payload->is_object()) {
        throw ArtifactCorruptError(path, "payload missing or not an object");
    }

    logger()->debug("loaded {} {} artifact from {}", to_string(mode), to_string(kind), path);
    return CompositionResult(kind, mode, std::move(*payload));
}

CompositionSet RuntimeLoader::load_all(Mode mode) const {
    return CompositionSet{
        load(ArtifactKind::Config, mode),
        load(ArtifactKind::Routes, mode),
        load(ArtifactKind::Services, mode),
    };
}

} // namespace strata
