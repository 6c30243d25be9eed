#pragma once

#include "strata/domain.hpp"
#include "strata/utility.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace strata {

struct StoredEntry {
    Fingerprint fingerprint;
    size_t size = 0;
    std::chrono::system_clock::time_point created;
};

/**
 * @brief Medium that persists cache entries.
 *
 * Implementations must be safe to call from several threads at once for
 * different fingerprints. The CacheStore never issues concurrent writes for the
 * same fingerprint.
 */
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    /** @return The artifact, std::nullopt if absent, or `BackendFailure`. */
    virtual Result<std::optional<Artifact>> load(const Fingerprint &fp) = 0;

    virtual Result<void> store(const Fingerprint &fp, const Artifact &artifact) = 0;

    /** @brief Removes an entry. Removing an absent entry succeeds. */
    virtual Result<void> remove(const Fingerprint &fp) = 0;

    /** @brief Everything currently persisted, used to rebuild the store index. */
    virtual Result<std::vector<StoredEntry>> list() = 0;
};

class MemoryBackend final : public CacheBackend {
public:
    Result<std::optional<Artifact>> load(const Fingerprint &fp) override;
    Result<void> store(const Fingerprint &fp, const Artifact &artifact) override;
    Result<void> remove(const Fingerprint &fp) override;
    Result<std::vector<StoredEntry>> list() override;

private:
    std::mutex mtx_;
    std::map<Fingerprint, Artifact> entries_;
};

/**
 * @brief One file per entry under `<root>/<2 hex>/<64 hex>`.
 *
 * Writes go to a temporary file that is renamed into place, so a reader never
 * observes a partially written entry.
 */
class DiskBackend final : public CacheBackend {
public:
    explicit DiskBackend(std::filesystem::path root);

    Result<std::optional<Artifact>> load(const Fingerprint &fp) override;
    Result<void> store(const Fingerprint &fp, const Artifact &artifact) override;
    Result<void> remove(const Fingerprint &fp) override;
    Result<std::vector<StoredEntry>> list() override;

    std::filesystem::path entry_path(const Fingerprint &fp) const;

private:
    std::filesystem::path root_;
};

} // namespace strata
