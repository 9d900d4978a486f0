/**
 * @file CacheWriter.cpp
 * @brief Atomic artifact persistence and external cache invalidation
 *
 * POSIX sequence: temp file + fsync(file) + rename + fsync(dir).
 */

#include "strata/CacheWriter.hpp"
#include "strata/Errors.hpp"
#include "strata/Loader.hpp"
#include "strata/Log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

namespace {

bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// Best effort: a directory that cannot be synced still holds the rename.
void fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) {
        logger()->warn("cannot open {} for fsync: {}", dir_path, std::strerror(errno));
        return;
    }
    if (!fsync_fd(dir_fd)) {
        logger()->warn("fsync of {} failed: {}", dir_path, std::strerror(errno));
    }
    close(dir_fd);
}

std::string make_temp_filename(const std::string& base) {
    static const char hex_chars[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }
    return base + ".tmp." + suffix;
}

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

void notify(const FaultHook& hook, WriteStage stage, const std::string& path) {
    if (hook) {
        hook(stage, path);
    }
}

std::chrono::system_clock::time_point modification_time(const std::string& path) {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

} // anonymous namespace

std::string artifact_path(const std::string& cache_dir, ArtifactKind kind, Mode mode) {
    return (fs::path(cache_dir) / (to_string(mode) + "_" + to_string(kind) + ".json")).string();
}

std::string serialize_artifact(ArtifactKind kind, Mode mode, const Value& payload) {
    Value doc = Value::object();
    doc["format"] = kArtifactFormat;
    doc["kind"] = to_string(kind);
    doc["mode"] = to_string(mode);
    doc["payload"] = payload;
    return doc.dump(2) + "\n";
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    const FaultHook& hook) {
    AtomicWriteResult result;
    const std::string dir_path = fs::path(path).parent_path().string();
    const std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(std::strerror(errno));
        return result;
    }

    if (!write_all(fd, content)) {
        result.error = "failed to write content: " + std::string(std::strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = "failed to fsync temp file: " + std::string(std::strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }
    close(fd);

    try {
        notify(hook, WriteStage::TempWritten, temp_path);
        notify(hook, WriteStage::BeforeSwap, path);
    } catch (const std::exception& e) {
        unlink(temp_path.c_str());
        result.error = std::string("interrupted before swap: ") + e.what();
        return result;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(std::strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    result.swapped = true;

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    // The swap has committed; a failure from here on leaves the new file
    // in place.
    try {
        notify(hook, WriteStage::AfterSwap, path);
    } catch (const std::exception& e) {
        result.error = std::string("interrupted after swap: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// GenerationFileInvalidator
// ============================================================================

GenerationFileInvalidator::GenerationFileInvalidator(std::string cache_dir)
    : path_((fs::path(cache_dir) / "invalidate.json").string()) {}

std::uint64_t GenerationFileInvalidator::generation() const {
    if (!file_exists(path_)) {
        return 0;
    }
    try {
        Value doc = Value::parse(read_file(path_));
        return doc.value("generation", std::uint64_t{0});
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("unreadable invalidation file {}: {}", path_, e.what());
        return 0;
    }
}

void GenerationFileInvalidator::invalidate(const std::vector<std::string>& identities) {
    Value doc = Value::object();
    doc["generation"] = generation() + 1;
    doc["identities"] = identities;

    auto result = atomic_write_file(path_, doc.dump(2) + "\n");
    if (!result.swapped) {
        throw CacheWriteError(path_, result.error);
    }
    logger()->info("invalidation generation {} published for {} artifact(s)",
                   doc["generation"].get<std::uint64_t>(), identities.size());
}

// ============================================================================
// CacheWriter
// ============================================================================

CacheWriter::CacheWriter(std::string cache_dir, std::shared_ptr<CacheInvalidator> invalidator)
    : cache_dir_(std::move(cache_dir))
    , invalidator_(std::move(invalidator)) {
    if (!invalidator_) {
        invalidator_ = std::make_shared<NullInvalidator>();
    }
}

bool CacheWriter::exists(ArtifactKind kind, Mode mode) const {
    return file_exists(artifact_path(cache_dir_, kind, mode));
}

CacheArtifact CacheWriter::write(ArtifactKind kind, Mode mode, const Value& result) {
    const std::string path = artifact_path(cache_dir_, kind, mode);

    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        throw CacheWriteError(path, "cannot create cache directory: " + ec.message());
    }

    std::string content;
    try {
        content = serialize_artifact(kind, mode, result);
    } catch (const nlohmann::json::type_error& e) {
        throw CacheWriteError(path, std::string("cannot serialize result: ") + e.what());
    }

    auto written = atomic_write_file(path, content, hook_);
    if (!written.ok) {
        throw CacheWriteError(path, written.error, written.swapped);
    }

    CacheArtifact artifact;
    artifact.kind = kind;
    artifact.mode = mode;
    artifact.identity = path;
    artifact.written_at = modification_time(path);
    artifact.size = content.size();

    logger()->info("wrote {} {} artifact {} ({} bytes)",
                   to_string(mode), to_string(kind), path, artifact.size);
    return artifact;
}

void CacheWriter::invalidate(const std::vector<CacheArtifact>& artifacts) {
    if (artifacts.empty()) {
        return;
    }
    std::vector<std::string> identities;
    identities.reserve(artifacts.size());
    for (const auto& a : artifacts) {
        identities.push_back(a.identity);
    }
    invalidator_->invalidate(identities);
}

CacheArtifact CacheWriter::persist(ArtifactKind kind, Mode mode, const Value& result) {
    CacheArtifact artifact;
    try {
        artifact = write(kind, mode, result);
    } catch (const CacheWriteError& e) {
        if (e.swapped()) {
            invalidate({swapped_artifact(kind, mode, e.path())});
        }
        throw;
    }
    invalidate({artifact});
    return artifact;
}

CacheArtifact CacheWriter::swapped_artifact(ArtifactKind kind, Mode mode, const std::string& path) {
    CacheArtifact artifact;
    artifact.kind = kind;
    artifact.mode = mode;
    artifact.identity = path;
    artifact.written_at = modification_time(path);
    return artifact;
}

} // namespace strata
