#include "storage/shard.hpp"

#include "common/clock.hpp"
#include "common/logger.hpp"
#include "storage/engine_error.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace tierkv {

using namespace std::chrono_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────

class ShardTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("tierkv_shard_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        shard_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    // Charge of one entry of the shape used by fill(), measured on an
    // untiered shard.
    std::size_t entry_charge() {
        Shard untiered(99, clock_, ShardOptions{}, make_component_logger("shard-test"));
        untiered.set("key-000", Value{std::string(100, 'v')}, std::nullopt);
        return untiered.stats().hot_bytes;
    }

    Shard& make_shard(std::size_t budget, double threshold = 0.5) {
        ShardOptions opts;
        opts.memory_budget = budget;
        opts.cold_dir = test_dir_;
        opts.compaction_threshold = threshold;
        shard_ = std::make_unique<Shard>(0, clock_, opts, make_component_logger("shard-test"));
        return *shard_;
    }

    static std::string key(int i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "key-%03d", i);
        return buf;
    }

    void fill(Shard& shard, int n) {
        for (int i = 0; i < n; ++i) {
            shard.set(key(i), Value{std::string(100, static_cast<char>('a' + i % 26))}, std::nullopt);
        }
    }

    MockClock clock_;
    std::filesystem::path test_dir_;
    std::unique_ptr<Shard> shard_;
};

// ── Basic reads and writes ───────────────────────────────────────────────────

TEST_F(ShardTest, SetGetDelete) {
    auto& shard = make_shard(0);
    shard.set("a", Value{1}, std::nullopt);
    EXPECT_EQ(shard.get("a"), Value{1});
    EXPECT_TRUE(shard.exists("a"));
    EXPECT_TRUE(shard.del("a"));
    EXPECT_FALSE(shard.get("a").has_value());
    EXPECT_FALSE(shard.del("a"));
}

TEST_F(ShardTest, IncrOnMissingKeyStartsAtZero) {
    auto& shard = make_shard(0);
    EXPECT_EQ(shard.incr("n", 5), 5);
    EXPECT_EQ(shard.decr("n", 2), 3);
}

TEST_F(ShardTest, IncrSaturates) {
    auto& shard = make_shard(0);
    shard.set("n", Value{std::numeric_limits<int64_t>::max() - 1}, std::nullopt);
    EXPECT_EQ(shard.incr("n", 10), std::numeric_limits<int64_t>::max());
}

TEST_F(ShardTest, IncrOnStringThrowsAndLeavesValue) {
    auto& shard = make_shard(0);
    shard.set("s", Value{"text"}, std::nullopt);
    try {
        shard.incr("s", 1);
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), EngineErrc::TypeMismatch);
    }
    EXPECT_EQ(shard.get("s"), Value{"text"});
}

TEST_F(ShardTest, IncrKeepsTtl) {
    auto& shard = make_shard(0);
    shard.set("n", Value{1}, 10'000ms);
    shard.incr("n", 1);
    auto ttl = shard.ttl("n");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_EQ(*ttl, 10'000);
}

// ── TTL ──────────────────────────────────────────────────────────────────────

TEST_F(ShardTest, ExpiredEntryIsAbsent) {
    auto& shard = make_shard(0);
    shard.set("t", Value{"v"}, 100ms);
    clock_.advance(99ms);
    EXPECT_TRUE(shard.exists("t"));
    clock_.advance(1ms);
    EXPECT_FALSE(shard.exists("t"));
    EXPECT_FALSE(shard.get("t").has_value());
    EXPECT_FALSE(shard.ttl("t").has_value());
}

TEST_F(ShardTest, TtlReportsRemainingOrMinusOne) {
    auto& shard = make_shard(0);
    shard.set("p", Value{1}, std::nullopt);
    EXPECT_EQ(shard.ttl("p"), -1);

    shard.set("t", Value{1}, 5'000ms);
    clock_.advance(1'500ms);
    EXPECT_EQ(shard.ttl("t"), 3'500);
}

TEST_F(ShardTest, HugeTtlIsClampedInsteadOfWrapping) {
    auto& shard = make_shard(0);
    const std::chrono::milliseconds huge{10'000'000'000'000};

    shard.set("s", Value{"v"}, huge);
    EXPECT_TRUE(shard.exists("s"));
    EXPECT_EQ(shard.ttl("s"), kMaxTtl.count());

    shard.set("e", Value{"v"}, std::nullopt);
    EXPECT_TRUE(shard.expire("e", std::chrono::milliseconds::max()));
    EXPECT_EQ(shard.ttl("e"), kMaxTtl.count());

    EXPECT_TRUE(shard.lock("l", "me", huge));
    EXPECT_TRUE(shard.exists("l"));
    EXPECT_TRUE(shard.extend_lock("l", "me", huge));
    EXPECT_EQ(shard.ttl("l"), kMaxTtl.count());

    EXPECT_TRUE(shard.expire("s", std::chrono::milliseconds::min()));
    EXPECT_FALSE(shard.exists("s"));
}

TEST_F(ShardTest, SetWithoutTtlClearsTtl) {
    auto& shard = make_shard(0);
    shard.set("k", Value{1}, 100ms);
    shard.set("k", Value{2}, std::nullopt);
    clock_.advance(1s);
    EXPECT_EQ(shard.get("k"), Value{2});
}

TEST_F(ShardTest, SweepRemovesExpired) {
    auto& shard = make_shard(0);
    shard.set("a", Value{1}, 10ms);
    shard.set("b", Value{2}, std::nullopt);
    clock_.advance(20ms);
    EXPECT_EQ(shard.sweep_expired(), 1u);
    EXPECT_EQ(shard.stats().hot_entries, 1u);
}

// ── CAS / SETNX / locks ──────────────────────────────────────────────────────

TEST_F(ShardTest, CasComparesWholeValue) {
    auto& shard = make_shard(0);
    EXPECT_FALSE(shard.cas("c", Value{}, Value{1}, std::nullopt));  // absent never matches
    shard.set("c", Value{1}, std::nullopt);
    EXPECT_FALSE(shard.cas("c", Value{2}, Value{3}, std::nullopt));
    EXPECT_TRUE(shard.cas("c", Value{1}, Value{3}, std::nullopt));
    EXPECT_EQ(shard.get("c"), Value{3});
}

TEST_F(ShardTest, SetNxOnlyWhenAbsentOrExpired) {
    auto& shard = make_shard(0);
    EXPECT_TRUE(shard.setnx("n", Value{1}, 50ms));
    EXPECT_FALSE(shard.setnx("n", Value{2}, std::nullopt));
    clock_.advance(50ms);
    EXPECT_TRUE(shard.setnx("n", Value{3}, std::nullopt));
    EXPECT_EQ(shard.get("n"), Value{3});
}

TEST_F(ShardTest, LockOwnership) {
    auto& shard = make_shard(0);
    EXPECT_TRUE(shard.lock("l", "alice", 1'000ms));
    EXPECT_FALSE(shard.lock("l", "bob", 1'000ms));
    EXPECT_THROW(shard.unlock("l", "bob"), EngineError);
    EXPECT_THROW(shard.extend_lock("l", "bob", 1'000ms), EngineError);
    EXPECT_TRUE(shard.extend_lock("l", "alice", 5'000ms));
    EXPECT_EQ(shard.ttl("l"), 5'000);
    EXPECT_TRUE(shard.unlock("l", "alice"));
    EXPECT_FALSE(shard.unlock("l", "alice"));
}

TEST_F(ShardTest, LockRecordHoldsOwner) {
    auto& shard = make_shard(0);
    ASSERT_TRUE(shard.lock("l", "alice", 1'000ms));
    auto v = shard.get("l");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->as_map().at("owner"), Value{"alice"});
    EXPECT_TRUE(v->as_map().at("acquired_at").is_int());
}

TEST_F(ShardTest, ExpiredLockCanBeRetaken) {
    auto& shard = make_shard(0);
    ASSERT_TRUE(shard.lock("l", "alice", 100ms));
    clock_.advance(100ms);
    EXPECT_TRUE(shard.lock("l", "bob", 100ms));
}

// ── Tiering ──────────────────────────────────────────────────────────────────

TEST_F(ShardTest, EvictionKeepsHotBytesWithinBudget) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 4);
    fill(shard, 20);

    auto s = shard.stats();
    EXPECT_LE(s.hot_bytes, charge * 4);
    EXPECT_EQ(s.hot_entries + s.cold_entries, 20u);
    EXPECT_GE(s.evictions, 16u);
    EXPECT_GE(s.data_files, 1u);
}

TEST_F(ShardTest, ColdReadPromotesTransparently) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 4);
    fill(shard, 20);

    // Every key, hot or cold, reads back its own value.
    for (int i = 0; i < 20; ++i) {
        auto v = shard.get(key(i));
        ASSERT_TRUE(v.has_value()) << key(i);
        EXPECT_EQ(*v, Value{std::string(100, static_cast<char>('a' + i % 26))});
        EXPECT_LE(shard.stats().hot_bytes, charge * 4);
    }
    EXPECT_GT(shard.stats().promotions, 0u);
}

TEST_F(ShardTest, KeyLivesInExactlyOneTier) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 3);
    fill(shard, 10);
    for (int i = 0; i < 10; ++i) {
        (void)shard.get(key(i));
    }
    auto s = shard.stats();
    EXPECT_EQ(s.hot_entries + s.cold_entries, 10u);
}

TEST_F(ShardTest, OverwriteOfColdKeyDropsColdCopy) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 2);
    fill(shard, 6);

    for (int i = 0; i < 6; ++i) {
        shard.set(key(i), Value{i}, std::nullopt);
    }
    auto s = shard.stats();
    EXPECT_EQ(s.hot_entries + s.cold_entries, 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(shard.get(key(i)), Value{i});
    }
}

TEST_F(ShardTest, DeleteOfColdKey) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 2);
    fill(shard, 6);
    for (int i = 0; i < 6; ++i) {
        EXPECT_TRUE(shard.del(key(i))) << key(i);
    }
    auto s = shard.stats();
    EXPECT_EQ(s.hot_entries, 0u);
    EXPECT_EQ(s.cold_entries, 0u);
    EXPECT_EQ(s.hot_bytes, 0u);
}

TEST_F(ShardTest, ColdEntryTtlStillApplies) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 2);
    for (int i = 0; i < 8; ++i) {
        shard.set(key(i), Value{std::string(100, 'a')}, 1'000ms);
    }
    ASSERT_GT(shard.stats().cold_entries, 0u);

    clock_.advance(1'000ms);
    for (int i = 0; i < 8; ++i) {
        EXPECT_FALSE(shard.exists(key(i))) << key(i);
    }
}

TEST_F(ShardTest, CompactionRewritesWastefulFiles) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 2, 0.25);
    fill(shard, 30);

    // Delete most of the cold keys so their data files are mostly dead.
    for (int i = 0; i < 25; ++i) {
        shard.del(key(i));
    }
    EXPECT_GT(shard.compact(), 0u);
    EXPECT_GT(shard.stats().compactions, 0u);

    for (int i = 25; i < 30; ++i) {
        EXPECT_TRUE(shard.get(key(i)).has_value()) << key(i);
    }
}

// ── Visiting ─────────────────────────────────────────────────────────────────

TEST_F(ShardTest, VisitCoversBothTiersAndSkipsExpired) {
    const auto charge = entry_charge();
    auto& shard = make_shard(charge * 3);
    fill(shard, 10);
    shard.set("short", Value{1}, 10ms);
    clock_.advance(10ms);

    std::vector<std::string> seen;
    uint64_t lsn = 0;
    shard.visit([&](const std::string& k, const Entry&) { seen.push_back(k); }, lsn);
    EXPECT_EQ(seen.size(), 10u);
}

TEST_F(ShardTest, SetLastLsnOnlyMovesForward) {
    auto& shard = make_shard(0);
    shard.set_last_lsn(10);
    shard.set_last_lsn(5);
    EXPECT_EQ(shard.stats().last_lsn, 10u);
}

} // namespace tierkv
