#include "strata/cache_backend.hpp"

#include "strata/mmap.hpp"

#include <atomic>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string_view>

#include <unistd.h>

namespace fs = std::filesystem;

namespace strata {

Result<std::optional<Artifact>> MemoryBackend::load(const Fingerprint &fp) {
    std::lock_guard lock(mtx_);
    if (auto it = entries_.find(fp); it != entries_.end())
        return it->second;
    return std::nullopt;
}

Result<void> MemoryBackend::store(const Fingerprint &fp, const Artifact &artifact) {
    std::lock_guard lock(mtx_);
    entries_.insert_or_assign(fp, artifact);
    return {};
}

Result<void> MemoryBackend::remove(const Fingerprint &fp) {
    std::lock_guard lock(mtx_);
    entries_.erase(fp);
    return {};
}

Result<std::vector<StoredEntry>> MemoryBackend::list() {
    std::lock_guard lock(mtx_);
    std::vector<StoredEntry> out;
    out.reserve(entries_.size());
    for (const auto &[fp, artifact] : entries_) {
        out.push_back({fp, artifact.size(), artifact.created});
    }
    return out;
}

namespace {

constexpr char ENTRY_MAGIC[8] = {'S', 'T', 'R', 'A', 'T', 'A', '0', '1'};

struct EntryHeader {
    char magic[8];
    uint64_t payload_size;
    int64_t created_ns;
    uint64_t stage_size;
};

int64_t to_ns(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_ns(int64_t ns) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
}

Result<EntryHeader> parse_header(std::string_view content, const fs::path &path) {
    EntryHeader header;
    if (content.size() < sizeof(EntryHeader)) {
        return make_error(ErrorCode::BackendFailure, "Malformed cache entry {}: too small for header", path.string());
    }
    std::memcpy(&header, content.data(), sizeof(EntryHeader));
    if (std::memcmp(header.magic, ENTRY_MAGIC, sizeof(ENTRY_MAGIC)) != 0) {
        return make_error(ErrorCode::BackendFailure, "Invalid magic or version in cache entry {}", path.string());
    }
    if (header.stage_size > content.size() - sizeof(EntryHeader) ||
        header.payload_size != content.size() - sizeof(EntryHeader) - header.stage_size) {
        return make_error(ErrorCode::BackendFailure, "Malformed cache entry {}: size mismatch", path.string());
    }
    return header;
}

std::atomic<uint64_t> tmp_counter{0};

} // namespace

DiskBackend::DiskBackend(fs::path root) : root_(std::move(root)) {
}

fs::path DiskBackend::entry_path(const Fingerprint &fp) const {
    std::string hex = fp.to_hex();
    return root_ / hex.substr(0, 2) / hex;
}

Result<std::optional<Artifact>> DiskBackend::load(const Fingerprint &fp) {
    fs::path path = entry_path(fp);
    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;

    try {
        MappedFile file{path};
        std::string_view content = file.content();
        auto header = parse_header(content, path);
        if (!header)
            return std::unexpected(header.error());

        content.remove_prefix(sizeof(EntryHeader));
        Artifact artifact;
        artifact.stage = std::string(content.substr(0, header->stage_size));
        artifact.payload = std::string(content.substr(header->stage_size));
        artifact.created = from_ns(header->created_ns);
        return artifact;
    } catch (const std::exception &e) {
        // Removed between the exists() check and the open.
        if (!fs::exists(path, ec))
            return std::nullopt;
        return make_error(ErrorCode::BackendFailure, "{}", e.what());
    }
}

Result<void> DiskBackend::store(const Fingerprint &fp, const Artifact &artifact) {
    fs::path final_path = entry_path(fp);
    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        return make_error(ErrorCode::BackendFailure,
                          "Failed to create {}: {}",
                          final_path.parent_path().string(),
                          ec.message());
    }

    fs::path tmp_path = final_path;
    tmp_path += std::format(".tmp.{}.{}", ::getpid(), tmp_counter.fetch_add(1));

    EntryHeader header;
    std::memcpy(header.magic, ENTRY_MAGIC, sizeof(ENTRY_MAGIC));
    header.payload_size = artifact.payload.size();
    header.created_ns = to_ns(artifact.created);
    header.stage_size = artifact.stage.size();

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error(ErrorCode::BackendFailure, "Failed to open {} for writing", tmp_path.string());
        }
        out.write(reinterpret_cast<const char *>(&header), sizeof(EntryHeader));
        out.write(artifact.stage.data(), static_cast<std::streamsize>(artifact.stage.size()));
        out.write(artifact.payload.data(), static_cast<std::streamsize>(artifact.payload.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp_path, ec);
            return make_error(ErrorCode::BackendFailure, "Failed to write {}", tmp_path.string());
        }
    }

    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return make_error(ErrorCode::BackendFailure, "Failed to commit {}: {}", final_path.string(), ec.message());
    }
    return {};
}

Result<void> DiskBackend::remove(const Fingerprint &fp) {
    std::error_code ec;
    fs::remove(entry_path(fp), ec);
    if (ec) {
        return make_error(ErrorCode::BackendFailure, "Failed to remove {}: {}", entry_path(fp).string(), ec.message());
    }
    return {};
}

Result<std::vector<StoredEntry>> DiskBackend::list() {
    std::vector<StoredEntry> out;
    std::error_code ec;
    if (!fs::exists(root_, ec))
        return out;

    for (auto it = fs::recursive_directory_iterator(root_, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        auto fp = Fingerprint::from_hex(it->path().filename().string());
        if (!fp)
            continue; // temporary files and strangers

        std::ifstream in(it->path(), std::ios::binary);
        EntryHeader header;
        if (!in.read(reinterpret_cast<char *>(&header), sizeof(EntryHeader)) ||
            std::memcmp(header.magic, ENTRY_MAGIC, sizeof(ENTRY_MAGIC)) != 0) {
            continue;
        }
        out.push_back({*fp, header.payload_size, from_ns(header.created_ns)});
    }
    if (ec) {
        return make_error(ErrorCode::BackendFailure, "Failed to scan {}: {}", root_.string(), ec.message());
    }
    return out;
}

} // namespace strata
