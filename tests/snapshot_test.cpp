#include "persistence/snapshot.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace tierkv::persistence {

// ── Fixture ──────────────────────────────────────────────────────────────────

class SnapshotTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("tierkv_snapshot_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    // Two shards: shard 0 with `n` entries, shard 1 empty.
    std::filesystem::path write_snapshot(int n, uint64_t wal_position) {
        SnapshotWriter writer(test_dir_);
        EXPECT_FALSE(writer.begin());
        writer.begin_shard(0);
        for (int i = 0; i < n; ++i) {
            std::optional<int64_t> expiry;
            if (i % 2 == 0) expiry = int64_t{1'000'000} + i;
            writer.add_entry("k" + std::to_string(i), Value{i}, expiry, static_cast<uint64_t>(i + 1));
        }
        EXPECT_FALSE(writer.end_shard(wal_position));
        writer.begin_shard(1);
        EXPECT_FALSE(writer.end_shard(wal_position - 1));

        std::filesystem::path path;
        EXPECT_FALSE(writer.commit(wal_position, path));
        return path;
    }

    std::filesystem::path test_dir_;
};

// ── Write / load ─────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, WrittenSnapshotLoads) {
    auto path = write_snapshot(5, 100);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(path.extension(), ".snap");

    SnapshotContents contents;
    ASSERT_FALSE(load_snapshot(path, contents));
    EXPECT_EQ(contents.header.version, kSnapshotVersion);
    EXPECT_EQ(contents.header.shard_count, 2u);
    EXPECT_EQ(contents.header.total_entries, 5u);
    EXPECT_EQ(contents.header.wal_position, 100u);

    ASSERT_EQ(contents.shards.size(), 2u);
    EXPECT_EQ(contents.shards[0].id, 0u);
    EXPECT_EQ(contents.shards[0].last_lsn, 100u);
    EXPECT_EQ(contents.shards[1].last_lsn, 99u);
    ASSERT_EQ(contents.shards[0].entries.size(), 5u);

    const auto& [key, entry] = contents.shards[0].entries[2];
    EXPECT_EQ(key, "k2");
    EXPECT_EQ(entry.value, Value{2});
    EXPECT_EQ(entry.version, 3u);
    ASSERT_TRUE(entry.expires_at.has_value());
    EXPECT_EQ(*entry.expires_at, 1'000'002);
    EXPECT_FALSE(contents.shards[0].entries[1].second.expires_at.has_value());
}

TEST_F(SnapshotTest, HeaderIsFortyEightBytesWithMagic) {
    auto path = write_snapshot(1, 10);
    std::ifstream in(path, std::ios::binary);
    char magic[8];
    in.read(magic, 8);
    EXPECT_EQ(std::string(magic, 8), "KVSNAP01");

    SnapshotHeader header;
    ASSERT_FALSE(read_snapshot_header(path, header));
    EXPECT_EQ(header.wal_position, 10u);
    EXPECT_GT(std::filesystem::file_size(path), kSnapshotHeaderSize);
}

TEST_F(SnapshotTest, NoTmpFileLeftAfterCommit) {
    write_snapshot(3, 5);
    for (const auto& e : std::filesystem::directory_iterator(test_dir_)) {
        EXPECT_NE(e.path().extension(), ".tmp") << e.path();
    }
}

TEST_F(SnapshotTest, AbortRemovesTmpFile) {
    {
        SnapshotWriter writer(test_dir_);
        ASSERT_FALSE(writer.begin());
        writer.begin_shard(0);
        writer.add_entry("k", Value{1}, std::nullopt, 1);
        ASSERT_FALSE(writer.end_shard(1));
        // Destroyed without commit().
    }
    EXPECT_TRUE(std::filesystem::is_empty(test_dir_));
    EXPECT_TRUE(list_snapshots(test_dir_).empty());
}

// ── Validation ───────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, CorruptedBodyFailsChecksum) {
    auto path = write_snapshot(5, 100);
    {
        std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
        f.seekp(static_cast<std::streamoff>(kSnapshotHeaderSize + 20));
        char c = 0x5A;
        f.write(&c, 1);
    }
    SnapshotContents contents;
    EXPECT_TRUE(load_snapshot(path, contents));
}

TEST_F(SnapshotTest, TruncatedFileRejected) {
    auto path = write_snapshot(5, 100);
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 4);
    SnapshotContents contents;
    EXPECT_TRUE(load_snapshot(path, contents));
}

TEST_F(SnapshotTest, LatestValidSnapshotWins) {
    auto older = write_snapshot(2, 10);
    auto newer = write_snapshot(4, 20);
    ASSERT_NE(older, newer);

    auto latest = load_latest_snapshot(test_dir_);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->first, newer);
    EXPECT_EQ(latest->second.header.wal_position, 20u);

    // Corrupt the newest: the older one is used instead.
    std::filesystem::resize_file(newer, kSnapshotHeaderSize + 3);
    latest = load_latest_snapshot(test_dir_);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->first, older);
}

TEST_F(SnapshotTest, NoSnapshotInEmptyDir) {
    EXPECT_FALSE(load_latest_snapshot(test_dir_).has_value());
}

// ── Retention ────────────────────────────────────────────────────────────────

TEST_F(SnapshotTest, PruneKeepsNewestAndReportsOldestPosition) {
    write_snapshot(1, 10);
    write_snapshot(1, 20);
    write_snapshot(1, 30);
    write_snapshot(1, 40);
    std::ofstream(test_dir_ / "snapshot-1.snap.tmp") << "stale";

    EXPECT_EQ(prune_snapshots(test_dir_, 2), 30u);

    auto left = list_snapshots(test_dir_);
    ASSERT_EQ(left.size(), 2u);
    SnapshotHeader h;
    ASSERT_FALSE(read_snapshot_header(left[0], h));
    EXPECT_EQ(h.wal_position, 30u);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "snapshot-1.snap.tmp"));
}

TEST_F(SnapshotTest, ListIgnoresForeignFiles) {
    write_snapshot(1, 10);
    std::ofstream(test_dir_ / "snapshot-abc.snap") << "x";
    std::ofstream(test_dir_ / "notes.txt") << "x";
    EXPECT_EQ(list_snapshots(test_dir_).size(), 1u);
}

} // namespace tierkv::persistence
