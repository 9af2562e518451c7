#include "storage/engine.hpp"

#include "common/clock.hpp"
#include "storage/engine_error.hpp"
#include "storage/value_codec.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace tierkv {

using namespace std::chrono_literals;

// ── Fixture ──────────────────────────────────────────────────────────────────

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("tierkv_engine_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
    }

    void TearDown() override {
        engine_.reset();
        std::filesystem::remove_all(test_dir_);
    }

    Engine& make_engine(std::size_t shards = 16, std::size_t budget = 0) {
        EngineOptions opts;
        opts.num_shards = shards;
        opts.shard_memory_bytes = budget;
        opts.cold_dir = test_dir_ / "cold";
        opts.max_value_bytes = 1024;
        engine_ = std::make_unique<Engine>(opts, clock_);
        return *engine_;
    }

    MockClock clock_;
    std::filesystem::path test_dir_;
    std::unique_ptr<Engine> engine_;
};

// ── Basic operations ─────────────────────────────────────────────────────────

TEST_F(EngineTest, SetThenGet) {
    auto& e = make_engine();
    e.set("k", Value{"v"});
    EXPECT_EQ(e.get("k"), Value{"v"});
    EXPECT_TRUE(e.exists("k"));
    EXPECT_FALSE(e.get("missing").has_value());
}

TEST_F(EngineTest, TtlScenarioSixtySeconds) {
    auto& e = make_engine();
    e.set("tmp", Value{"hello"}, 60s);
    EXPECT_EQ(e.get("tmp"), Value{"hello"});
    clock_.advance(61s);
    EXPECT_FALSE(e.get("tmp").has_value());
}

TEST_F(EngineTest, ExpireAndTtl) {
    auto& e = make_engine();
    EXPECT_FALSE(e.expire("nope", 1s));
    e.set("k", Value{1});
    EXPECT_EQ(e.ttl("k"), -1);
    EXPECT_TRUE(e.expire("k", 2s));
    EXPECT_EQ(e.ttl("k"), 2'000);
    clock_.advance(2s);
    EXPECT_FALSE(e.ttl("k").has_value());
}

TEST_F(EngineTest, IncrDecr) {
    auto& e = make_engine();
    EXPECT_EQ(e.incr("c"), 1);
    EXPECT_EQ(e.incr("c", 10), 11);
    EXPECT_EQ(e.decr("c", 3), 8);
    EXPECT_EQ(e.get("c"), Value{8});
}

TEST_F(EngineTest, TypeMismatchLeavesValueUnchanged) {
    auto& e = make_engine();
    e.set("s", Value{"abc"});
    EXPECT_THROW(e.incr("s"), EngineError);
    EXPECT_THROW(e.decr("s"), EngineError);
    EXPECT_EQ(e.get("s"), Value{"abc"});
}

// ── Validation ───────────────────────────────────────────────────────────────

TEST_F(EngineTest, EmptyKeyRejected) {
    auto& e = make_engine();
    try {
        e.set("", Value{1});
        FAIL() << "expected EngineError";
    } catch (const EngineError& err) {
        EXPECT_EQ(err.code(), EngineErrc::EmptyKey);
    }
}

TEST_F(EngineTest, LongKeyRejected) {
    auto& e = make_engine();
    std::string key(kMaxKeyBytes + 1, 'k');
    EXPECT_THROW(e.set(key, Value{1}), EngineError);
    EXPECT_NO_THROW(e.set(std::string(kMaxKeyBytes, 'k'), Value{1}));
}

TEST_F(EngineTest, OversizedValueRejected) {
    auto& e = make_engine();
    try {
        e.set("big", Value{std::string(2048, 'x')});
        FAIL() << "expected EngineError";
    } catch (const EngineError& err) {
        EXPECT_EQ(err.code(), EngineErrc::ValueTooLarge);
    }
    EXPECT_FALSE(e.exists("big"));
}

// Runs `call` and returns the code of the EngineError it throws.
static EngineErrc rejection_code(const std::function<void()>& call) {
    try {
        call();
    } catch (const EngineError& err) {
        return err.code();
    }
    ADD_FAILURE() << "expected EngineError";
    return EngineErrc::EmptyKey;
}

static Value nested_list(std::size_t depth) {
    Value v{1};
    for (std::size_t i = 0; i < depth; ++i) {
        v = Value{Value::List{std::move(v)}};
    }
    return v;
}

TEST_F(EngineTest, TtlAboveCapRejected) {
    auto& e = make_engine();
    const std::chrono::milliseconds huge{10'000'000'000'000};

    EXPECT_EQ(rejection_code([&] { e.set("k", Value{"v"}, huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_EQ(rejection_code([&] { e.setnx("k", Value{"v"}, huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_EQ(rejection_code([&] { e.mset({{"k", Value{"v"}}}, huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_EQ(rejection_code([&] { e.lock("l", "me", huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_FALSE(e.exists("k"));
    EXPECT_FALSE(e.exists("l"));

    e.set("k", Value{"v"});
    EXPECT_EQ(rejection_code([&] { e.expire("k", huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_EQ(rejection_code([&] { e.cas("k", Value{"v"}, Value{"w"}, huge); }), EngineErrc::TtlOutOfRange);
    EXPECT_EQ(e.get("k"), Value{"v"});
    EXPECT_EQ(e.ttl("k"), -1);

    e.set("k", Value{"v"}, kMaxTtl);
    EXPECT_EQ(e.ttl("k"), kMaxTtl.count());
}

TEST_F(EngineTest, ValueNestedPastDecodeLimitRejected) {
    auto& e = make_engine();
    EXPECT_NO_THROW(e.set("ok", nested_list(kMaxValueDepth)));
    EXPECT_EQ(e.get("ok"), nested_list(kMaxValueDepth));

    EXPECT_EQ(rejection_code([&] { e.set("deep", nested_list(kMaxValueDepth + 1)); }),
              EngineErrc::InvalidValue);
    EXPECT_FALSE(e.exists("deep"));
}

TEST_F(EngineTest, ShortStringOverU16LengthRejected) {
    EngineOptions opts;
    opts.max_value_bytes = 1 << 20;
    Engine e(opts, clock_);

    Value::Map m;
    m.emplace(std::string(70'000, 'k'), Value{1});
    EXPECT_EQ(rejection_code([&] { e.set("map", Value{std::move(m)}); }), EngineErrc::InvalidValue);
    EXPECT_EQ(rejection_code([&] { e.set("dec", Value{Decimal{std::string(70'000, '9')}}); }),
              EngineErrc::InvalidValue);
    EXPECT_FALSE(e.exists("map"));
    EXPECT_FALSE(e.exists("dec"));

    Value::Map fits;
    fits.emplace(std::string(0xFFFF, 'k'), Value{1});
    EXPECT_NO_THROW(e.set("map", Value{std::move(fits)}));
}

// ── Batch operations ─────────────────────────────────────────────────────────

TEST_F(EngineTest, MGetMatchesIndividualGets) {
    auto& e = make_engine();
    for (int i = 0; i < 50; i += 2) {
        e.set("k" + std::to_string(i), Value{i});
    }

    std::vector<std::string> keys;
    for (int i = 0; i < 50; ++i) keys.push_back("k" + std::to_string(i));

    auto batch = e.mget(keys);
    ASSERT_EQ(batch.size(), keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        EXPECT_EQ(batch[i], e.get(keys[i])) << keys[i];
    }
}

TEST_F(EngineTest, MSetMDelMExists) {
    auto& e = make_engine();
    e.mset({{"a", Value{1}}, {"b", Value{2}}, {"c", Value{3}}}, 10s);
    EXPECT_EQ(e.mexists({"a", "b", "x"}), (std::vector<bool>{true, true, false}));
    EXPECT_EQ(e.ttl("b"), 10'000);

    EXPECT_EQ(e.mdel({"a", "c", "x"}), 2u);
    EXPECT_EQ(e.mexists({"a", "b", "c"}), (std::vector<bool>{false, true, false}));
}

TEST_F(EngineTest, BatchValidatesBeforeApplying) {
    auto& e = make_engine();
    EXPECT_THROW(e.mset({{"ok", Value{1}}, {"", Value{2}}}), EngineError);
    EXPECT_FALSE(e.exists("ok"));
}

// ── Concurrency ──────────────────────────────────────────────────────────────

TEST_F(EngineTest, CasRaceExactlyOneWins) {
    auto& e = make_engine();
    for (int round = 0; round < 200; ++round) {
        const std::string key = "race" + std::to_string(round);
        e.set(key, Value{"X"});

        std::atomic<int> wins{0};
        std::atomic<bool> go{false};
        auto attempt = [&](const char* desired) {
            while (!go.load()) {}
            if (e.cas(key, Value{"X"}, Value{desired})) ++wins;
        };
        std::thread t1(attempt, "Y1");
        std::thread t2(attempt, "Y2");
        go = true;
        t1.join();
        t2.join();

        ASSERT_EQ(wins.load(), 1) << key;
        auto v = e.get(key);
        ASSERT_TRUE(v.has_value());
        EXPECT_TRUE(*v == Value{"Y1"} || *v == Value{"Y2"});
    }
}

TEST_F(EngineTest, LockExclusivityUnderContention) {
    auto& e = make_engine();
    constexpr int kThreads = 8;

    std::atomic<int> acquired{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load()) {}
            if (e.lock("resource", "owner-" + std::to_string(t), 30s)) ++acquired;
        });
    }
    go = true;
    for (auto& t : threads) t.join();
    EXPECT_EQ(acquired.load(), 1);

    // Released only by TTL expiry here.
    EXPECT_FALSE(e.lock("resource", "late", 30s));
    clock_.advance(30s);
    EXPECT_TRUE(e.lock("resource", "late", 30s));
}

TEST_F(EngineTest, ConcurrentIncrementsAreNotLost) {
    auto& e = make_engine(4);
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) e.incr("counter");
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(e.get("counter"), Value{kThreads * kPerThread});
}

// ── Sharding ─────────────────────────────────────────────────────────────────

TEST_F(EngineTest, ShardOccupancyIsBalanced) {
    auto& e = make_engine(256);
    constexpr int kKeys = 100'000;

    std::vector<std::size_t> counts(256, 0);
    for (int i = 0; i < kKeys; ++i) {
        ++counts[e.shard_index("key-" + std::to_string(i))];
    }

    const double mean = static_cast<double>(kKeys) / 256.0;
    auto [lo, hi] = std::minmax_element(counts.begin(), counts.end());
    EXPECT_GT(static_cast<double>(*lo), mean * 0.85);
    EXPECT_LT(static_cast<double>(*hi), mean * 1.15);
}

TEST_F(EngineTest, HashIsStable) {
    // Routing must survive restarts, so the hash is pinned.
    EXPECT_EQ(hash_key(""), 0xcbf29ce484222325ull);
    EXPECT_EQ(hash_key("a"), 0xaf63dc4c8601ec8cull);
}

// ── Tiering through the engine ───────────────────────────────────────────────

TEST_F(EngineTest, BudgetHoldsAfterEveryOperation) {
    constexpr std::size_t kBudget = 2048;
    auto& e = make_engine(2, kBudget);

    for (int i = 0; i < 200; ++i) {
        e.set("k" + std::to_string(i), Value{std::string(64, 'v')});
        if (i % 3 == 0) (void)e.get("k" + std::to_string(i / 2));
        for (std::size_t s = 0; s < e.num_shards(); ++s) {
            ASSERT_LE(e.shard(s).stats().hot_bytes, kBudget) << "after op " << i;
        }
    }

    auto info = e.info();
    EXPECT_EQ(info.entries, 200u);
    EXPECT_GT(info.cold_entries, 0u);
    EXPECT_GT(info.evictions, 0u);
}

TEST_F(EngineTest, PromotionIsTransparent) {
    auto& e = make_engine(1, 1024);
    std::vector<Value> written;
    for (int i = 0; i < 40; ++i) {
        Value::Map m;
        m.emplace("i", Value{i});
        m.emplace("name", Value{"item-" + std::to_string(i)});
        written.emplace_back(std::move(m));
        e.set("obj" + std::to_string(i), written.back());
    }
    ASSERT_GT(e.info().cold_entries, 0u);

    for (int round = 0; round < 2; ++round) {
        for (int i = 0; i < 40; ++i) {
            EXPECT_EQ(e.get("obj" + std::to_string(i)), written[i]);
        }
    }
    EXPECT_GT(e.info().promotions, 0u);
}

TEST_F(EngineTest, StaleDataFilesWipedAtStartup) {
    std::filesystem::create_directories(test_dir_ / "cold");
    {
        std::ofstream(test_dir_ / "cold" / "shard-0-7.dat") << "junk";
    }
    make_engine(1, 1024);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "cold" / "shard-0-7.dat"));
}

TEST_F(EngineTest, BudgetWithoutColdDirRejected) {
    EngineOptions opts;
    opts.shard_memory_bytes = 1024;
    EXPECT_THROW({ Engine engine(opts, clock_); }, std::invalid_argument);
}

// ── Info ─────────────────────────────────────────────────────────────────────

TEST_F(EngineTest, InfoCountsEntries) {
    auto& e = make_engine(8);
    for (int i = 0; i < 10; ++i) e.set("k" + std::to_string(i), Value{i});
    auto info = e.info();
    EXPECT_EQ(info.num_shards, 8u);
    EXPECT_EQ(info.entries, 10u);
    EXPECT_EQ(info.persistence, PersistenceMode::Disabled);

    auto text = format_info(info);
    EXPECT_NE(text.find("entries: 10"), std::string::npos);
    EXPECT_NE(text.find("persistence: disabled"), std::string::npos);
}

TEST_F(EngineTest, SweepExpiredAcrossShards) {
    auto& e = make_engine(8);
    for (int i = 0; i < 20; ++i) e.set("t" + std::to_string(i), Value{i}, 1s);
    e.set("keep", Value{1});
    clock_.advance(1s);
    EXPECT_EQ(e.sweep_expired(), 20u);
    EXPECT_EQ(e.info().entries, 1u);
}

} // namespace tierkv
