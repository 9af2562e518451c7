#include "client/client.hpp"
#include "client/client_pool.hpp"
#include "network/server.hpp"
#include "storage/engine.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tierkv::client {

using namespace std::chrono_literals;

// ── parse_address ────────────────────────────────────────────────────────────

TEST(ParseAddress, HostAndPort) {
    auto addr = parse_address("127.0.0.1:6380");
    EXPECT_EQ(addr.host, "127.0.0.1");
    EXPECT_EQ(addr.port, 6380);
    EXPECT_TRUE(addr.ns.empty());
}

TEST(ParseAddress, Namespace) {
    auto addr = parse_address("localhost:7000/tasks");
    EXPECT_EQ(addr.host, "localhost");
    EXPECT_EQ(addr.port, 7000);
    EXPECT_EQ(addr.ns, "tasks");
}

TEST(ParseAddress, NamespaceMayContainSlashes) {
    EXPECT_EQ(parse_address("h:1/prod/cache").ns, "prod/cache");
}

TEST(ParseAddress, Malformed) {
    for (const char* bad : {"", "localhost", ":6380", "host:", "host:0", "host:65536",
                            "host:12ab", "host:6380/"}) {
        EXPECT_THROW(parse_address(bad), std::invalid_argument) << bad;
    }
}

// ── Fixture ──────────────────────────────────────────────────────────────────

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineOptions eopts;
        eopts.num_shards = 8;
        engine_ = std::make_unique<Engine>(eopts);

        network::ServerOptions sopts;
        sopts.host = "127.0.0.1";
        sopts.port = 0;
        sopts.threads = 2;
        sopts.handle_signals = false;
        sopts.session.max_payload_bytes = 4096;
        server_ = std::make_unique<network::Server>(sopts, *engine_);
        server_thread_ = std::thread([this] { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

    std::string address(const std::string& ns = "") const {
        auto a = "127.0.0.1:" + std::to_string(server_->port());
        return ns.empty() ? a : a + "/" + ns;
    }

    std::unique_ptr<Engine> engine_;
    std::unique_ptr<network::Server> server_;
    std::thread server_thread_;
};

// ── Client ───────────────────────────────────────────────────────────────────

TEST_F(ClientTest, ConnectFailureIsConnectionError) {
    // Port 1 on loopback is never listening in the test environment.
    try {
        Client client("127.0.0.1:1");
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ClientError::Kind::Connection);
    }
}

TEST_F(ClientTest, NamespacePrefixesKeys) {
    Client scoped(address("tasks"));
    EXPECT_EQ(scoped.ns(), "tasks");
    scoped.set("job", Value{"run"});

    EXPECT_EQ(engine_->get("tasks:job"), Value{"run"});
    EXPECT_FALSE(engine_->get("job").has_value());
    EXPECT_EQ(scoped.get("job"), Value{"run"});
}

TEST_F(ClientTest, NamespacesAreIsolated) {
    Client a(address("a"));
    Client b(address("b"));
    a.set("k", Value{1});
    b.set("k", Value{2});
    EXPECT_EQ(a.get("k"), Value{1});
    EXPECT_EQ(b.get("k"), Value{2});

    a.mset({{"x", Value{10}}, {"y", Value{20}}});
    auto seen = b.mexists({"x", "y"});
    EXPECT_EQ(seen, (std::vector<bool>{false, false}));
    EXPECT_EQ(a.mdel({"x", "y", "z"}), 2u);
}

TEST_F(ClientTest, ServerErrorKeepsConnection) {
    Client client(address());
    client.set("s", Value{"text"});
    try {
        client.incr("s");
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ClientError::Kind::Server);
    }
    EXPECT_TRUE(client.is_open());
    EXPECT_EQ(client.ping(), "PONG");
}

TEST_F(ClientTest, InvalidRequestReported) {
    Client client(address());
    // Larger than the server's payload limit: drained and rejected.
    try {
        client.set("big", Value{std::string(8192, 'x')});
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ClientError::Kind::Invalid);
    }
    EXPECT_TRUE(client.is_open());
    EXPECT_FALSE(client.exists("big"));
}

TEST_F(ClientTest, UnframeableRequestRejectedBeforeSending) {
    Client client(address());
    auto expect_local_invalid = [](const std::function<void()>& call, const std::string& needle) {
        try {
            call();
            FAIL() << "expected ClientError";
        } catch (const ClientError& e) {
            EXPECT_EQ(e.kind(), ClientError::Kind::Invalid);
            EXPECT_NE(std::string(e.what()).find(needle), std::string::npos) << e.what();
        }
    };

    std::vector<std::string> keys(70'000, "k");
    std::vector<std::pair<std::string, Value>> pairs(70'000, {"k", Value{1}});
    expect_local_invalid([&] { (void)client.mget(keys); }, "batch of 70000 keys");
    expect_local_invalid([&] { (void)client.mdel(keys); }, "batch of 70000 keys");
    expect_local_invalid([&] { (void)client.mexists(keys); }, "batch of 70000 keys");
    expect_local_invalid([&] { client.mset(pairs); }, "batch of 70000 keys");
    expect_local_invalid([&] { client.set("k", Value{1}, std::chrono::milliseconds{10'000'000'000'000}); },
                         "ttl");

    // Nothing reached the server, so the connection is still in step.
    EXPECT_TRUE(client.is_open());
    EXPECT_EQ(client.ping(), "PONG");
    EXPECT_FALSE(client.exists("k"));
}

TEST_F(ClientTest, ClosedClientRefusesCalls) {
    Client client(address());
    client.close();
    EXPECT_FALSE(client.is_open());
    try {
        (void)client.get("k");
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ClientError::Kind::Connection);
    }
}

// ── ClientPool ───────────────────────────────────────────────────────────────

TEST_F(ClientTest, PoolWarmsMinSize) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 3;
    opts.max_size = 5;
    auto pool = ClientPool::create(opts);
    EXPECT_EQ(pool->idle_count(), 3u);
    EXPECT_EQ(pool->active_count(), 0u);
}

TEST_F(ClientTest, PoolLeaseReturnsOnScopeExit) {
    PoolOptions opts;
    opts.address = address("ns");
    opts.min_size = 1;
    opts.max_size = 2;
    auto pool = ClientPool::create(opts);
    EXPECT_EQ(pool->ns(), "ns");

    {
        auto lease = pool->acquire();
        EXPECT_EQ(pool->idle_count(), 0u);
        EXPECT_EQ(pool->active_count(), 1u);
        lease->set("k", Value{"v"});
    }
    EXPECT_EQ(pool->idle_count(), 1u);
    EXPECT_EQ(pool->active_count(), 0u);
    EXPECT_EQ(engine_->get("ns:k"), Value{"v"});
}

TEST_F(ClientTest, PoolReusesIdleConnection) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 1;
    opts.max_size = 1;
    auto pool = ClientPool::create(opts);

    Client* first = nullptr;
    {
        auto lease = pool->acquire();
        first = &*lease;
    }
    auto lease = pool->acquire();
    EXPECT_EQ(&*lease, first);
}

TEST_F(ClientTest, PoolAcquireTimesOutAtMaxSize) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 0;
    opts.max_size = 1;
    opts.acquire_timeout = 50ms;
    auto pool = ClientPool::create(opts);

    auto held = pool->acquire();
    auto start = std::chrono::steady_clock::now();
    try {
        auto second = pool->acquire();
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind(), ClientError::Kind::Timeout);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(ClientTest, PoolWaiterGetsReleasedConnection) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 1;
    opts.max_size = 1;
    opts.acquire_timeout = 5000ms;
    auto pool = ClientPool::create(opts);

    auto held = std::make_unique<Lease>(pool->acquire());
    std::atomic<bool> got{false};
    std::thread waiter([&] {
        auto lease = pool->acquire();
        got = true;
        EXPECT_EQ(lease->ping(), "PONG");
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(got.load());
    held.reset();
    waiter.join();
    EXPECT_TRUE(got.load());
}

TEST_F(ClientTest, PoolDropsBrokenConnection) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 1;
    opts.max_size = 2;
    auto pool = ClientPool::create(opts);

    {
        auto lease = pool->acquire();
        lease->close();
    }
    EXPECT_EQ(pool->idle_count(), 0u);
    EXPECT_EQ(pool->active_count(), 0u);

    // A fresh connection replaces it.
    auto lease = pool->acquire();
    EXPECT_EQ(lease->ping(), "PONG");
}

TEST_F(ClientTest, PoolClosesConnectionsIdlePastTimeout) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 2;
    opts.max_size = 2;
    opts.idle_timeout = std::chrono::seconds{0};
    auto pool = ClientPool::create(opts);
    std::this_thread::sleep_for(5ms);

    auto lease = pool->acquire();
    EXPECT_EQ(pool->idle_count(), 0u);
    EXPECT_EQ(lease->ping(), "PONG");
}

TEST_F(ClientTest, PoolSharedAcrossThreads) {
    PoolOptions opts;
    opts.address = address();
    opts.min_size = 2;
    opts.max_size = 4;
    auto pool = ClientPool::create(opts);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto lease = pool->acquire();
                lease->incr("shared");
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(engine_->get("shared"), Value{400});
    EXPECT_LE(pool->idle_count(), 4u);
}

} // namespace tierkv::client
