/**
 * @file CacheWriter.hpp
 * @brief Atomic persistence of composition results
 *
 * Each artifact is written to `<identity>.tmp.<random>`, fsynced, then
 * renamed onto the canonical identity `<cache_dir>/<mode>_<kind>.json`.
 * Readers see either the previous or the new file, never a torn one.
 * External cache invalidation runs only after the rename.
 */

#ifndef STRATA_CACHE_WRITER_HPP
#define STRATA_CACHE_WRITER_HPP

#include "strata/Types.hpp"
#include "strata/Value.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace strata {

/// Version of the artifact document layout.
inline constexpr int kArtifactFormat = 1;

/**
 * @brief A persisted composition result
 */
struct CacheArtifact {
    ArtifactKind kind = ArtifactKind::Config;
    Mode mode = Mode::Http;

    /// Canonical path; also the key for external cache invalidation.
    std::string identity;

    std::chrono::system_clock::time_point written_at;

    /// Size of the artifact document in bytes.
    std::uintmax_t size = 0;
};

/// Canonical artifact path for a kind and mode.
std::string artifact_path(const std::string& cache_dir, ArtifactKind kind, Mode mode);

/**
 * @brief Serialize a composition result into its artifact document
 *
 * Deterministic: equal inputs give equal bytes.
 */
std::string serialize_artifact(ArtifactKind kind, Mode mode, const Value& payload);

/**
 * @brief Result of an atomic file write
 */
struct AtomicWriteResult {
    /// The whole sequence completed.
    bool ok = false;
    /// The rename onto the target committed (also set when a later step failed).
    bool swapped = false;
    std::string error;
};

/// Steps of the write-then-swap sequence, reported to the fault hook.
enum class WriteStage {
    TempWritten,
    BeforeSwap,
    AfterSwap
};

using FaultHook = std::function<void(WriteStage, const std::string& path)>;

/**
 * @brief Write @p content to @p path via temp file, fsync and rename
 *
 * @param hook Optional; called at each stage. An exception thrown before
 *             the swap removes the temp file and leaves @p path intact.
 */
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    const FaultHook& hook = {});

/**
 * @brief Signals an external compiled cache that an identity changed
 */
class CacheInvalidator {
public:
    virtual ~CacheInvalidator() = default;

    /**
     * @brief Invalidate everything keyed to the given identities
     * @throws CacheWriteError if the signal cannot be delivered
     */
    virtual void invalidate(const std::vector<std::string>& identities) = 0;
};

/// Invalidator that does nothing.
class NullInvalidator : public CacheInvalidator {
public:
    void invalidate(const std::vector<std::string>&) override {}
};

/**
 * @brief Publishes invalidations through a generation file
 *
 * Atomically rewrites `<cache_dir>/invalidate.json`:
 * `{"generation": N, "identities": [...]}` with N incremented on every
 * call. An external cache that sees a new generation drops compiled
 * output for the listed identities.
 */
class GenerationFileInvalidator : public CacheInvalidator {
public:
    explicit GenerationFileInvalidator(std::string cache_dir);

    void invalidate(const std::vector<std::string>& identities) override;

    /// Current generation number (0 if never invalidated).
    std::uint64_t generation() const;

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Writes artifacts into a cache directory (persist)
 */
class CacheWriter {
public:
    explicit CacheWriter(std::string cache_dir,
                         std::shared_ptr<CacheInvalidator> invalidator =
                             std::make_shared<NullInvalidator>());

    const std::string& cache_dir() const noexcept { return cache_dir_; }

    /**
     * @brief Persist one result and invalidate its old identity
     * @throws CacheWriteError if the write or swap fails
     */
    CacheArtifact persist(ArtifactKind kind, Mode mode, const Value& result);

    /**
     * @brief Persist one result without signalling invalidation
     *
     * Used when several artifacts are swapped and invalidated together.
     */
    CacheArtifact write(ArtifactKind kind, Mode mode, const Value& result);

    /// Invalidate the given artifacts' identities (after their swap).
    void invalidate(const std::vector<CacheArtifact>& artifacts);

    /// True if the canonical artifact exists.
    bool exists(ArtifactKind kind, Mode mode) const;

    /// Artifact record for an identity swapped in by a write that then failed.
    static CacheArtifact swapped_artifact(ArtifactKind kind, Mode mode, const std::string& path);

    /// Install a fault hook for failure injection.
    void set_fault_hook(FaultHook hook) { hook_ = std::move(hook); }

private:
    std::string cache_dir_;
    std::shared_ptr<CacheInvalidator> invalidator_;
    FaultHook hook_;
};

} // namespace strata

#endif // STRATA_CACHE_WRITER_HPP
