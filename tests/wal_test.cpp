#include "persistence/wal.hpp"

#include "common/clock.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace tierkv::persistence {

using namespace std::chrono_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────

class WalTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a unique temp directory for each test.
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("tierkv_wal_test_" + std::string(info->name()));
        // Clean up any stale directory from a previous crashed run.
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static WalRecord rec(uint64_t lsn, MutationOp op) {
        return WalRecord{lsn, unix_now_ns(), std::move(op)};
    }

    std::vector<WalRecord> read_all(const std::filesystem::path& path, WalReadStats& stats) {
        std::vector<WalRecord> out;
        auto ec = read_wal_file(path, [&](WalRecord&& r) { out.push_back(std::move(r)); }, stats);
        EXPECT_FALSE(ec) << ec.message();
        return out;
    }

    static std::vector<uint8_t> slurp(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static void dump(const std::filesystem::path& p, const std::vector<uint8_t>& bytes) {
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    std::filesystem::path test_dir_;
};

// ── Open / header ────────────────────────────────────────────────────────────

TEST_F(WalTest, OpenWritesHeader) {
    WalWriter wal(test_dir_);
    ASSERT_FALSE(wal.open(42));
    EXPECT_TRUE(wal.is_open());
    EXPECT_EQ(wal.size(), kWalHeaderSize);

    WalHeader header;
    ASSERT_FALSE(read_wal_header(wal.current_path(), header));
    EXPECT_EQ(header.version, kWalVersion);
    EXPECT_EQ(header.first_lsn, 42u);

    auto bytes = slurp(wal.current_path());
    ASSERT_GE(bytes.size(), kWalMagicSize);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + kWalMagicSize), "KVWAL001");
}

TEST_F(WalTest, ReopenSealsLeftoverCurrentFile) {
    {
        WalWriter wal(test_dir_);
        ASSERT_FALSE(wal.open(1));
        ASSERT_FALSE(wal.append(rec(1, DeleteOp{"a"})));
    }
    WalWriter wal(test_dir_);
    ASSERT_FALSE(wal.open(2));

    auto files = list_wal_files(test_dir_);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_NE(files[0].filename(), kWalCurrentName);
    EXPECT_EQ(files[1].filename(), kWalCurrentName);

    WalReadStats stats;
    auto sealed = read_all(files[0], stats);
    ASSERT_EQ(sealed.size(), 1u);
    EXPECT_EQ(sealed[0].lsn, 1u);
}

// ── Records ──────────────────────────────────────────────────────────────────

TEST_F(WalTest, RecordLengthCoversTimestampThroughCrc) {
    auto bytes = encode_record(rec(7, DeleteOp{"key"}));
    ASSERT_GE(bytes.size(), 4u);
    uint32_t length = (uint32_t{bytes[0]} << 24) | (uint32_t{bytes[1]} << 16) |
                      (uint32_t{bytes[2]} << 8) | uint32_t{bytes[3]};
    EXPECT_EQ(length, bytes.size() - 4);
    // timestamp(8) + op(1) + lsn(8) + key(2+3) + crc(4)
    EXPECT_EQ(length, 8u + 1 + 8 + 5 + 4);
    EXPECT_EQ(bytes[4 + 8], static_cast<uint8_t>(OpType::Delete));
}

TEST_F(WalTest, EveryOpTypeReadsBack) {
    std::vector<MutationOp> ops = {
        SetOp{"s", Value{"v"}, 1500ms},
        DeleteOp{"d"},
        IncrOp{"i", 5},
        DecrOp{"i", -2},
        MSetOp{{{"a", Value{1}}, {"b", Value{Value::List{Value{true}, Value{}}}}}, std::nullopt},
        MDelOp{{"a", "b"}},
        SetNxOp{"n", Value{2.5}, std::nullopt},
        LockOp{"l", "owner", 3000ms, 1'700'000'000'000},
        UnlockOp{"l", "owner"},
        ExtendLockOp{"l", "owner", 4000ms},
    };

    {
        WalWriter wal(test_dir_);
        ASSERT_FALSE(wal.open(1));
        for (std::size_t i = 0; i < ops.size(); ++i) {
            ASSERT_FALSE(wal.append(rec(i + 1, ops[i])));
        }
        ASSERT_FALSE(wal.flush());
    }

    WalReadStats stats;
    auto got = read_all(test_dir_ / kWalCurrentName, stats);
    ASSERT_EQ(got.size(), ops.size());
    EXPECT_EQ(stats.corrupted, 0u);
    EXPECT_FALSE(stats.truncated);

    for (std::size_t i = 0; i < ops.size(); ++i) {
        EXPECT_EQ(got[i].lsn, i + 1);
        EXPECT_EQ(got[i].op.index(), ops[i].index());
    }

    const auto& set = std::get<SetOp>(got[0].op);
    EXPECT_EQ(set.key, "s");
    EXPECT_EQ(set.value, Value{"v"});
    ASSERT_TRUE(set.ttl.has_value());
    EXPECT_EQ(*set.ttl, 1500ms);

    const auto& mset = std::get<MSetOp>(got[4].op);
    ASSERT_EQ(mset.pairs.size(), 2u);
    EXPECT_FALSE(mset.ttl.has_value());
    EXPECT_EQ(mset.pairs[1].second.as_list().size(), 2u);

    const auto& lock = std::get<LockOp>(got[7].op);
    EXPECT_EQ(lock.owner, "owner");
    EXPECT_EQ(lock.ttl, 3000ms);
    EXPECT_EQ(lock.acquired_at_ms, 1'700'000'000'000);
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(WalTest, CorruptedRecordIsSkipped) {
    std::size_t second_offset = 0;
    {
        WalWriter wal(test_dir_);
        ASSERT_FALSE(wal.open(1));
        ASSERT_FALSE(wal.append(rec(1, SetOp{"a", Value{1}, std::nullopt})));
        second_offset = wal.size();
        ASSERT_FALSE(wal.append(rec(2, SetOp{"b", Value{2}, std::nullopt})));
        ASSERT_FALSE(wal.append(rec(3, SetOp{"c", Value{3}, std::nullopt})));
    }

    auto path = test_dir_ / kWalCurrentName;
    auto bytes = slurp(path);
    bytes[second_offset + 20] ^= 0xFF;   // inside the second record's body
    dump(path, bytes);

    WalReadStats stats;
    auto got = read_all(path, stats);
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].lsn, 1u);
    EXPECT_EQ(got[1].lsn, 3u);
    EXPECT_EQ(stats.corrupted, 1u);
}

TEST_F(WalTest, TruncatedTailEndsScan) {
    {
        WalWriter wal(test_dir_);
        ASSERT_FALSE(wal.open(1));
        ASSERT_FALSE(wal.append(rec(1, DeleteOp{"a"})));
        ASSERT_FALSE(wal.append(rec(2, DeleteOp{"b"})));
    }

    auto path = test_dir_ / kWalCurrentName;
    auto bytes = slurp(path);
    bytes.resize(bytes.size() - 3);   // crash mid-append
    dump(path, bytes);

    WalReadStats stats;
    auto got = read_all(path, stats);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_TRUE(stats.truncated);
}

TEST_F(WalTest, BadHeaderIsAnError) {
    auto path = test_dir_ / kWalCurrentName;
    dump(path, std::vector<uint8_t>(kWalHeaderSize, 0x00));

    WalReadStats stats;
    auto ec = read_wal_file(path, [](WalRecord&&) {}, stats);
    EXPECT_TRUE(ec);
}

// ── Rotation / pruning ───────────────────────────────────────────────────────

TEST_F(WalTest, RotateStartsFreshFileAtNextLsn) {
    WalWriter wal(test_dir_);
    ASSERT_FALSE(wal.open(1));
    ASSERT_FALSE(wal.append(rec(1, DeleteOp{"a"})));
    ASSERT_FALSE(wal.append(rec(2, DeleteOp{"b"})));
    ASSERT_FALSE(wal.rotate(3));
    EXPECT_EQ(wal.size(), kWalHeaderSize);

    WalHeader header;
    ASSERT_FALSE(read_wal_header(wal.current_path(), header));
    EXPECT_EQ(header.first_lsn, 3u);

    auto files = list_wal_files(test_dir_);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files.back().filename(), kWalCurrentName);
}

TEST_F(WalTest, PruneKeepsFilesStillNeeded) {
    WalWriter wal(test_dir_);
    ASSERT_FALSE(wal.open(1));
    ASSERT_FALSE(wal.append(rec(1, DeleteOp{"a"})));
    ASSERT_FALSE(wal.rotate(2));         // file A: [1, 2)
    ASSERT_FALSE(wal.append(rec(2, DeleteOp{"b"})));
    ASSERT_FALSE(wal.append(rec(3, DeleteOp{"c"})));
    ASSERT_FALSE(wal.rotate(4));         // file B: [2, 4)
    ASSERT_FALSE(wal.append(rec(4, DeleteOp{"d"})));

    // LSN 3 is still needed: only A may go.
    EXPECT_EQ(prune_wal_files(test_dir_, 3), 1u);
    EXPECT_EQ(list_wal_files(test_dir_).size(), 2u);

    // Everything below 4 is covered: B goes too; the live file never does.
    EXPECT_EQ(prune_wal_files(test_dir_, 4), 1u);
    auto files = list_wal_files(test_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename(), kWalCurrentName);
}

TEST_F(WalTest, ListOrdersRotatedFilesByTimestamp) {
    WalWriter wal(test_dir_);
    ASSERT_FALSE(wal.open(1));
    for (uint64_t i = 1; i <= 3; ++i) {
        ASSERT_FALSE(wal.append(rec(i, DeleteOp{"k"})));
        ASSERT_FALSE(wal.rotate(i + 1));
    }

    auto files = list_wal_files(test_dir_);
    ASSERT_EQ(files.size(), 4u);
    uint64_t prev = 0;
    for (std::size_t i = 0; i + 1 < files.size(); ++i) {
        WalHeader h;
        ASSERT_FALSE(read_wal_header(files[i], h));
        EXPECT_GT(h.first_lsn, prev);
        prev = h.first_lsn;
    }
}

} // namespace tierkv::persistence
