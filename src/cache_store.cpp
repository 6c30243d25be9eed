#include "strata/cache_store.hpp"

#include <algorithm>

namespace strata {

std::vector<Fingerprint> LruEntryLimit::select(std::span<const EntryInfo> candidates, const CacheStats &stats) const {
    std::vector<Fingerprint> out;
    size_t remaining = stats.entries;
    for (const auto &info : candidates) {
        if (remaining <= max_entries_)
            break;
        out.push_back(info.fingerprint);
        --remaining;
    }
    return out;
}

std::vector<Fingerprint> SizeLimit::select(std::span<const EntryInfo> candidates, const CacheStats &stats) const {
    std::vector<Fingerprint> out;
    size_t bytes = stats.bytes;
    for (const auto &info : candidates) {
        if (bytes <= max_bytes_)
            break;
        out.push_back(info.fingerprint);
        bytes -= info.size;
    }
    return out;
}

// Serializes writers (put, evict, invalidate) of a single fingerprint. The slot
// is dropped from the table once its last holder releases it.
class CacheStore::WriterLock {
public:
    WriterLock(CacheStore &store, const Fingerprint &fp) : store_(store), fp_(fp) {
        {
            std::lock_guard lock(store_.mtx_);
            auto &slot = store_.writer_locks_[fp];
            if (!slot)
                slot = std::make_shared<std::mutex>();
            mtx_ = slot;
        }
        mtx_->lock();
    }

    ~WriterLock() {
        mtx_->unlock();
        std::lock_guard lock(store_.mtx_);
        mtx_.reset();
        if (auto it = store_.writer_locks_.find(fp_); it != store_.writer_locks_.end() && it->second.use_count() == 1)
            store_.writer_locks_.erase(it);
    }

    WriterLock(const WriterLock &) = delete;
    WriterLock &operator=(const WriterLock &) = delete;

private:
    CacheStore &store_;
    Fingerprint fp_;
    std::shared_ptr<std::mutex> mtx_;
};

// Keeps an indexed entry from being evicted while its bytes are read from the
// backend. Pinning an entry also counts as an access.
class CacheStore::Pin {
public:
    Pin(CacheStore &store, const Fingerprint &fp) : store_(store), fp_(fp) {
        std::lock_guard lock(store_.mtx_);
        if (auto it = store_.entries_.find(fp); it != store_.entries_.end()) {
            ++it->second.pins;
            it->second.last_access = ++store_.tick_;
            pinned_ = true;
        }
    }

    ~Pin() {
        if (!pinned_)
            return;
        std::lock_guard lock(store_.mtx_);
        if (auto it = store_.entries_.find(fp_); it != store_.entries_.end())
            --it->second.pins;
    }

    bool pinned() const {
        return pinned_;
    }

    Pin(const Pin &) = delete;
    Pin &operator=(const Pin &) = delete;

private:
    CacheStore &store_;
    Fingerprint fp_;
    bool pinned_ = false;
};

CacheStore::CacheStore(std::unique_ptr<CacheBackend> backend) : backend_(std::move(backend)) {
}

Result<std::unique_ptr<CacheStore>> CacheStore::open(std::unique_ptr<CacheBackend> backend) {
    auto store = std::make_unique<CacheStore>(std::move(backend));
    if (auto res = store->load_index(); !res)
        return std::unexpected(res.error());
    return store;
}

Result<void> CacheStore::load_index() {
    auto listed = backend_->list();
    if (!listed)
        return std::unexpected(listed.error());

    // Oldest entries count as least recently used.
    std::ranges::sort(*listed, [](const StoredEntry &a, const StoredEntry &b) { return a.created < b.created; });

    std::lock_guard lock(mtx_);
    for (const auto &stored : *listed) {
        entries_.insert_or_assign(stored.fingerprint, Entry{stored.size, stored.created, ++tick_, 0});
    }
    return {};
}

bool CacheStore::has(const Fingerprint &fp) const {
    std::lock_guard lock(mtx_);
    return entries_.contains(fp);
}

Result<std::shared_ptr<const Artifact>> CacheStore::get(const Fingerprint &fp) {
    Pin pin(*this, fp);
    if (!pin.pinned()) {
        return make_error(ErrorCode::CacheMiss, "no entry for {}", fp.to_hex());
    }

    auto loaded = backend_->load(fp);
    if (!loaded)
        return std::unexpected(loaded.error());
    if (!loaded->has_value()) {
        // A put() may have re-committed the entry since the load; it holds the
        // writer lock until both the medium and the index are updated.
        WriterLock writer(*this, fp);
        loaded = backend_->load(fp);
        if (!loaded)
            return std::unexpected(loaded.error());
        if (!loaded->has_value()) {
            // The medium lost the entry behind our back; forget it.
            std::lock_guard lock(mtx_);
            if (auto it = entries_.find(fp); it != entries_.end() && it->second.pins == 1)
                entries_.erase(it);
            return make_error(ErrorCode::CacheMiss, "entry {} vanished from the backing store", fp.to_hex());
        }
    }
    return std::make_shared<const Artifact>(std::move(**loaded));
}

Result<void> CacheStore::put(const Fingerprint &fp, const Artifact &artifact) {
    WriterLock writer(*this, fp);
    Pin pin(*this, fp);

    // Another process sharing the medium may have committed the entry without
    // this store indexing it, so the medium is the source of truth here.
    auto existing = backend_->load(fp);
    if (!existing)
        return std::unexpected(existing.error());

    if (existing->has_value()) {
        const Artifact &committed = **existing;
        if (committed.payload != artifact.payload) {
            return make_error(ErrorCode::CacheCorruption,
                              "fingerprint {} already maps to a different artifact (stage '{}', {} bytes; new: stage "
                              "'{}', {} bytes)",
                              fp.to_hex(),
                              committed.stage,
                              committed.size(),
                              artifact.stage,
                              artifact.size());
        }
        std::lock_guard lock(mtx_);
        if (!entries_.contains(fp))
            entries_.emplace(fp, Entry{committed.size(), committed.created, ++tick_, 0});
        return {};
    }

    if (auto res = backend_->store(fp, artifact); !res)
        return res;

    std::lock_guard lock(mtx_);
    if (auto it = entries_.find(fp); it != entries_.end()) {
        // Indexed but missing from the medium; the pin above still holds it.
        it->second.size = artifact.size();
        it->second.created = artifact.created;
        it->second.last_access = ++tick_;
    } else {
        entries_.emplace(fp, Entry{artifact.size(), artifact.created, ++tick_, 0});
    }
    return {};
}

Result<void> CacheStore::remove_entry(const Fingerprint &fp) {
    WriterLock writer(*this, fp);
    {
        std::lock_guard lock(mtx_);
        auto it = entries_.find(fp);
        if (it != entries_.end()) {
            if (it->second.pins > 0)
                return make_error(ErrorCode::CacheBusy, "entry {} is being read", fp.to_hex());
            entries_.erase(it);
        }
    }
    return backend_->remove(fp);
}

Result<size_t> CacheStore::evict(const EvictionPolicy &policy) {
    std::vector<EntryInfo> candidates;
    CacheStats stats;
    {
        std::lock_guard lock(mtx_);
        for (const auto &[fp, entry] : entries_) {
            ++stats.entries;
            stats.bytes += entry.size;
            if (entry.pins == 0)
                candidates.push_back({fp, entry.size, entry.last_access, entry.created});
        }
    }
    std::ranges::sort(candidates, [](const EntryInfo &a, const EntryInfo &b) { return a.last_access < b.last_access; });

    size_t removed = 0;
    for (const auto &fp : policy.select(candidates, stats)) {
        bool present = false;
        {
            std::lock_guard lock(mtx_);
            auto it = entries_.find(fp);
            present = it != entries_.end() && it->second.pins == 0;
        }
        if (!present)
            continue;
        auto res = remove_entry(fp);
        if (!res) {
            if (res.error().code == ErrorCode::CacheBusy)
                continue; // pinned after selection
            return std::unexpected(res.error());
        }
        ++removed;
    }
    return removed;
}

Result<void> CacheStore::invalidate(const Fingerprint &fp) {
    return remove_entry(fp);
}

CacheStats CacheStore::stats() const {
    std::lock_guard lock(mtx_);
    CacheStats stats;
    for (const auto &[fp, entry] : entries_) {
        ++stats.entries;
        stats.bytes += entry.size;
    }
    return stats;
}

} // namespace strata
