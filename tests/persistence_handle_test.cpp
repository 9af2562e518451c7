#include "persistence/persistence_handle.hpp"

#include "persistence/snapshot.hpp"
#include "persistence/wal.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace tierkv::persistence {

using namespace std::chrono_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────

class PersistenceHandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("tierkv_persistence_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);

        EngineOptions eopts;
        eopts.num_shards = 4;
        engine_ = std::make_unique<Engine>(eopts);

        options_.dir = test_dir_;
        options_.flush_interval = 5ms;
        options_.snapshot_ops = 0;
        options_.snapshot_interval = std::chrono::hours{1};
    }

    void TearDown() override {
        engine_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    PersistenceHandle& attach(uint64_t last_lsn = 0) {
        auto handle = std::make_unique<PersistenceHandle>(*engine_, options_, last_lsn);
        handle->start();
        handle_ = handle.get();
        engine_->attach_persistence(std::move(handle));
        return *handle_;
    }

    // Every record in every WAL file, in replay order.
    std::vector<WalRecord> read_wal() const {
        std::vector<WalRecord> out;
        for (const auto& path : list_wal_files(test_dir_)) {
            WalReadStats stats;
            auto ec = read_wal_file(path, [&](WalRecord&& r) { out.push_back(std::move(r)); }, stats);
            EXPECT_FALSE(ec) << ec.message();
        }
        return out;
    }

    template <typename Pred>
    static bool wait_for(Pred pred, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }

    std::filesystem::path test_dir_;
    std::unique_ptr<Engine> engine_;
    PersistenceOptions options_;
    PersistenceHandle* handle_ = nullptr;
};

// ── Sequencing ───────────────────────────────────────────────────────────────

TEST_F(PersistenceHandleTest, LsnsStartAfterRecoveredPosition) {
    auto& handle = attach(41);
    EXPECT_EQ(handle.current_lsn(), 41u);
    engine_->set("a", Value{1});
    engine_->set("b", Value{2});
    EXPECT_EQ(handle.current_lsn(), 43u);

    ASSERT_TRUE(handle.flush_now());
    auto records = read_wal();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].lsn, 42u);
    EXPECT_EQ(records[1].lsn, 43u);
}

TEST_F(PersistenceHandleTest, ReadsAndFailedWritesAreNotLogged) {
    auto& handle = attach();
    engine_->set("s", Value{"x"});
    (void)engine_->get("s");
    (void)engine_->exists("s");
    EXPECT_FALSE(engine_->del("missing"));
    EXPECT_FALSE(engine_->cas("s", Value{"other"}, Value{"y"}));
    EXPECT_FALSE(engine_->setnx("s", Value{"z"}));
    EXPECT_THROW(engine_->incr("s"), EngineError);
    EXPECT_EQ(handle.current_lsn(), 1u);
}

TEST_F(PersistenceHandleTest, StopDrainsEverything) {
    attach();
    for (int i = 0; i < 500; ++i) {
        engine_->set("k" + std::to_string(i), Value{i});
    }
    engine_->detach_persistence();   // stops the worker

    auto records = read_wal();
    ASSERT_EQ(records.size(), 500u);
    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].lsn, i + 1);
    }
}

TEST_F(PersistenceHandleTest, BackpressureDoesNotDropRecords) {
    options_.channel_capacity = 2;
    attach();

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                engine_->incr("c" + std::to_string(t));
            }
        });
    }
    for (auto& t : threads) t.join();
    engine_->detach_persistence();

    EXPECT_EQ(read_wal().size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// ── Flush / rotation ─────────────────────────────────────────────────────────

TEST_F(PersistenceHandleTest, FlushIntervalMakesRecordsDurable) {
    attach();
    engine_->set("a", Value{1});
    EXPECT_TRUE(wait_for([&] { return read_wal().size() == 1; }));
}

TEST_F(PersistenceHandleTest, RotatesPastSizeLimit) {
    options_.wal_max_bytes = 512;
    attach();
    for (int i = 0; i < 100; ++i) {
        engine_->set("key" + std::to_string(i), Value{std::string(32, 'v')});
    }
    ASSERT_TRUE(handle_->flush_now());
    engine_->detach_persistence();

    EXPECT_GT(list_wal_files(test_dir_).size(), 1u);
    auto records = read_wal();
    ASSERT_EQ(records.size(), 100u);
    for (std::size_t i = 1; i < records.size(); ++i) {
        EXPECT_EQ(records[i].lsn, records[i - 1].lsn + 1);
    }
}

// ── Snapshots ────────────────────────────────────────────────────────────────

TEST_F(PersistenceHandleTest, SnapshotNowWritesAllEntries) {
    auto& handle = attach();
    for (int i = 0; i < 50; ++i) {
        engine_->set("k" + std::to_string(i), Value{i});
    }
    ASSERT_TRUE(handle.snapshot_now());

    auto latest = load_latest_snapshot(test_dir_);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->second.header.total_entries, 50u);
    EXPECT_EQ(latest->second.header.shard_count, 4u);
    EXPECT_EQ(latest->second.header.wal_position, 51u);
}

TEST_F(PersistenceHandleTest, OpCountTriggersSnapshot) {
    options_.snapshot_ops = 20;
    attach();
    for (int i = 0; i < 25; ++i) {
        engine_->set("k" + std::to_string(i), Value{i});
    }
    EXPECT_TRUE(wait_for([&] { return !list_snapshots(test_dir_).empty(); }));
}

TEST_F(PersistenceHandleTest, IntervalTriggersSnapshotOnlyAfterWrites) {
    options_.snapshot_interval = std::chrono::seconds{0};
    attach();
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(list_snapshots(test_dir_).empty());

    engine_->set("a", Value{1});
    EXPECT_TRUE(wait_for([&] { return !list_snapshots(test_dir_).empty(); }));
}

TEST_F(PersistenceHandleTest, RetentionPrunesOldSnapshots) {
    options_.snapshot_retention = 2;
    auto& handle = attach();
    for (int round = 0; round < 4; ++round) {
        engine_->set("k", Value{round});
        ASSERT_TRUE(handle.snapshot_now());
    }
    EXPECT_EQ(list_snapshots(test_dir_).size(), 2u);
}

// ── Failure ──────────────────────────────────────────────────────────────────

TEST_F(PersistenceHandleTest, WorkerFailureDegradesWithoutBlocking) {
    options_.wal_max_bytes = 256;
    options_.channel_capacity = 4;
    auto& handle = attach();
    EXPECT_EQ(engine_->persistence_mode(), PersistenceMode::Enabled);

    // Rotation renames inside the directory; without it the worker fails.
    std::filesystem::remove_all(test_dir_);

    for (int i = 0; i < 200; ++i) {
        engine_->set("k" + std::to_string(i), Value{std::string(64, 'x')});
    }
    EXPECT_TRUE(wait_for([&] { return handle.degraded(); }));
    EXPECT_EQ(engine_->persistence_mode(), PersistenceMode::Degraded);

    // Writes keep working in memory and never block.
    for (int i = 0; i < 100; ++i) {
        engine_->set("after" + std::to_string(i), Value{i});
    }
    EXPECT_EQ(engine_->get("after99"), Value{99});
    EXPECT_FALSE(handle.snapshot_now());
    EXPECT_NE(format_info(engine_->info()).find("persistence: degraded"), std::string::npos);
}

TEST_F(PersistenceHandleTest, StartFailsOnUnusableDirectory) {
    std::filesystem::create_directories(test_dir_);
    std::ofstream(test_dir_ / "file") << "x";
    options_.dir = test_dir_ / "file" / "sub";

    PersistenceHandle handle(*engine_, options_, 0);
    EXPECT_THROW(handle.start(), std::runtime_error);
}

} // namespace tierkv::persistence
