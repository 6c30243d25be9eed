#include "strata/cache_backend.hpp"
#include "strata/cache_store.hpp"
#include "strata/fingerprint.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace strata;
using namespace strata::testing;

namespace fs = std::filesystem;

class DiskBackendTest : public ::testing::Test {
protected:
    static Artifact artifact_of(std::string payload, std::string stage) {
        Artifact artifact;
        artifact.payload = std::move(payload);
        artifact.stage = std::move(stage);
        return artifact;
    }

    static void write_file(const fs::path &path, std::string_view content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    TempDir dir;
    fs::path root = dir.path() / "cache";
    Fingerprint fp = digest("entry");
};

TEST_F(DiskBackendTest, EntryPathIsShardedByPrefix) {
    DiskBackend backend{root};
    std::string hex = fp.to_hex();
    EXPECT_EQ(backend.entry_path(fp), root / hex.substr(0, 2) / hex);
}

TEST_F(DiskBackendTest, StoreAndLoad) {
    DiskBackend backend{root};
    Artifact stored = artifact_of(std::string("binary\0payload", 14), "Compile");
    ASSERT_TRUE(backend.store(fp, stored).has_value());
    EXPECT_TRUE(fs::exists(backend.entry_path(fp)));

    auto loaded = backend.load(fp);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().describe();
    ASSERT_TRUE(loaded->has_value());
    EXPECT_EQ((*loaded)->payload, stored.payload);
    EXPECT_EQ((*loaded)->stage, "Compile");
    EXPECT_EQ((*loaded)->created, stored.created);
}

TEST_F(DiskBackendTest, EmptyPayload) {
    DiskBackend backend{root};
    ASSERT_TRUE(backend.store(fp, artifact_of("", "Touch")).has_value());
    auto loaded = backend.load(fp);
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->has_value());
    EXPECT_TRUE((*loaded)->payload.empty());
}

TEST_F(DiskBackendTest, LoadAbsent) {
    DiskBackend backend{root};
    auto loaded = backend.load(fp);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->has_value());
}

TEST_F(DiskBackendTest, RemoveDeletesEntryFile) {
    DiskBackend backend{root};
    ASSERT_TRUE(backend.store(fp, artifact_of("x", "s")).has_value());
    ASSERT_TRUE(backend.remove(fp).has_value());
    EXPECT_FALSE(fs::exists(backend.entry_path(fp)));
    EXPECT_TRUE(backend.remove(fp).has_value());
}

TEST_F(DiskBackendTest, ListSkipsStrayFiles) {
    DiskBackend backend{root};
    Fingerprint other = digest("other");
    ASSERT_TRUE(backend.store(fp, artifact_of("12345", "a")).has_value());
    ASSERT_TRUE(backend.store(other, artifact_of("67", "b")).has_value());
    write_file(root / "tmp" / "scratch-1", "leftover");
    write_file(backend.entry_path(digest("garbage")), "not a cache entry");

    auto listed = backend.list();
    ASSERT_TRUE(listed.has_value()) << listed.error().describe();
    ASSERT_EQ(listed->size(), 2u);

    size_t bytes = 0;
    for (const auto &entry : *listed) {
        EXPECT_TRUE(entry.fingerprint == fp || entry.fingerprint == other);
        bytes += entry.size;
    }
    EXPECT_EQ(bytes, 7u);
}

TEST_F(DiskBackendTest, ListOfMissingRootIsEmpty) {
    DiskBackend backend{root / "never-created"};
    auto listed = backend.list();
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
}

TEST_F(DiskBackendTest, MalformedEntryIsBackendFailure) {
    DiskBackend backend{root};
    write_file(backend.entry_path(fp), "STRATA01 but truncated");

    auto loaded = backend.load(fp);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::BackendFailure);
}

TEST_F(DiskBackendTest, StorePersistsAcrossStoreInstances) {
    {
        auto store = CacheStore::open(std::make_unique<DiskBackend>(root));
        ASSERT_TRUE(store.has_value());
        ASSERT_TRUE((*store)->put(fp, artifact_of("persisted", "Package")).has_value());
    }

    auto reopened = CacheStore::open(std::make_unique<DiskBackend>(root));
    ASSERT_TRUE(reopened.has_value()) << reopened.error().describe();
    EXPECT_TRUE((*reopened)->has(fp));
    EXPECT_EQ((*reopened)->stats().entries, 1u);

    auto got = (*reopened)->get(fp);
    ASSERT_TRUE(got.has_value()) << got.error().describe();
    EXPECT_EQ((*got)->payload, "persisted");
    EXPECT_EQ((*got)->stage, "Package");
}

TEST_F(DiskBackendTest, EntryDeletedBehindTheStoreIsAMiss) {
    auto store = CacheStore::open(std::make_unique<DiskBackend>(root));
    ASSERT_TRUE(store.has_value());
    ASSERT_TRUE((*store)->put(fp, artifact_of("gone soon", "s")).has_value());

    DiskBackend external{root};
    ASSERT_TRUE(external.remove(fp).has_value());

    auto got = (*store)->get(fp);
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::CacheMiss);
    EXPECT_FALSE((*store)->has(fp));
}
