#pragma once

#include "strata/cache_backend.hpp"
#include "strata/domain.hpp"
#include "strata/utility.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace strata {

struct CacheStats {
    size_t entries = 0;
    size_t bytes = 0;
};

struct EntryInfo {
    Fingerprint fingerprint;
    size_t size = 0;
    uint64_t last_access = 0;
    std::chrono::system_clock::time_point created;
};

/**
 * @brief Chooses which cache entries to evict.
 *
 * `candidates` holds the evictable entries, least recently used first; entries
 * pinned by an in-flight read are never offered. `stats` covers every entry,
 * pinned or not.
 */
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;
    virtual std::vector<Fingerprint> select(std::span<const EntryInfo> candidates, const CacheStats &stats) const = 0;
};

/** @brief Keeps at most `max_entries` entries, dropping the least recently used. */
class LruEntryLimit final : public EvictionPolicy {
public:
    explicit LruEntryLimit(size_t max_entries) : max_entries_(max_entries) {
    }
    std::vector<Fingerprint> select(std::span<const EntryInfo> candidates, const CacheStats &stats) const override;

private:
    size_t max_entries_;
};

/** @brief Keeps total payload bytes at or below `max_bytes`, dropping the least recently used. */
class SizeLimit final : public EvictionPolicy {
public:
    explicit SizeLimit(size_t max_bytes) : max_bytes_(max_bytes) {
    }
    std::vector<Fingerprint> select(std::span<const EntryInfo> candidates, const CacheStats &stats) const override;

private:
    size_t max_bytes_;
};

/**
 * @brief Fingerprint-keyed artifact cache.
 *
 * A fingerprint maps to exactly one artifact. All operations are thread-safe
 * and the store may be shared by concurrent builds. Writers of one fingerprint
 * are serialized; writers of different fingerprints never wait on each other's
 * backend I/O.
 */
class CacheStore {
public:
    explicit CacheStore(std::unique_ptr<CacheBackend> backend = std::make_unique<MemoryBackend>());

    /** @brief Creates a store over `backend` and indexes the entries it already holds. */
    static Result<std::unique_ptr<CacheStore>> open(std::unique_ptr<CacheBackend> backend);

    CacheStore(const CacheStore &) = delete;
    CacheStore &operator=(const CacheStore &) = delete;

    bool has(const Fingerprint &fp) const;

    /** @return The committed artifact, or `CacheMiss` / `BackendFailure`. */
    Result<std::shared_ptr<const Artifact>> get(const Fingerprint &fp);

    /**
     * @brief Commits an artifact.
     *
     * Committing byte-identical content again is a no-op. Committing different
     * content under an existing fingerprint fails with `CacheCorruption` and
     * leaves the original entry untouched.
     */
    Result<void> put(const Fingerprint &fp, const Artifact &artifact);

    /** @return Number of entries removed. */
    Result<size_t> evict(const EvictionPolicy &policy);

    /** @brief Removes one entry; `CacheBusy` while it is being read. */
    Result<void> invalidate(const Fingerprint &fp);

    CacheStats stats() const;

private:
    struct Entry {
        size_t size = 0;
        std::chrono::system_clock::time_point created;
        uint64_t last_access = 0;
        size_t pins = 0;
    };

    class WriterLock;
    class Pin;

    Result<void> load_index();
    Result<void> remove_entry(const Fingerprint &fp);

    std::unique_ptr<CacheBackend> backend_;
    mutable std::mutex mtx_;
    std::unordered_map<Fingerprint, Entry> entries_;
    std::unordered_map<Fingerprint, std::shared_ptr<std::mutex>> writer_locks_;
    uint64_t tick_ = 0;
};

} // namespace strata
