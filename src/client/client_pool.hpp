#pragma once

#include "client/client.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace tierkv::client {

struct PoolOptions {
    std::string address = "127.0.0.1:6380";   // host:port[/namespace]
    std::size_t min_size = 2;                  // connections opened up front
    std::size_t max_size = 10;
    std::chrono::seconds idle_timeout{300};    // idle connections older than this are closed
    std::chrono::milliseconds acquire_timeout{5000};
};

class ClientPool;

// ── Lease ────────────────────────────────────────────────────────────────────
//
// Exclusive use of one pooled Client.  Returned to the pool on destruction,
// unless the connection broke while leased, in which case it is dropped.

class Lease {
public:
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    ~Lease();

    Client& operator*() const noexcept { return *client_; }
    Client* operator->() const noexcept { return client_.get(); }

private:
    friend class ClientPool;
    Lease(std::shared_ptr<ClientPool> pool, std::unique_ptr<Client> client);

    std::shared_ptr<ClientPool> pool_;
    std::unique_ptr<Client> client_;
};

// ── ClientPool ───────────────────────────────────────────────────────────────
//
// Thread-safe pool of at most max_size connections to one server.
// acquire() hands out an idle connection, opens a new one while under the
// limit, or waits up to acquire_timeout for a lease to come back.
//
// Always held by shared_ptr (see create()) so outstanding leases keep the
// pool alive.

class ClientPool : public std::enable_shared_from_this<ClientPool> {
public:
    // Opens min_size connections.  Throws ClientError if any fails.
    [[nodiscard]] static std::shared_ptr<ClientPool> create(PoolOptions options);

    ClientPool(const ClientPool&) = delete;
    ClientPool& operator=(const ClientPool&) = delete;

    // Throws ClientError (Timeout or Connection).
    [[nodiscard]] Lease acquire();

    [[nodiscard]] std::size_t idle_count() const;
    [[nodiscard]] std::size_t active_count() const;
    [[nodiscard]] const std::string& ns() const noexcept { return address_.ns; }

private:
    explicit ClientPool(PoolOptions options);

    friend class Lease;
    void release(std::unique_ptr<Client> client);

    struct IdleEntry {
        std::unique_ptr<Client> client;
        std::chrono::steady_clock::time_point last_used;
    };

    const PoolOptions options_;
    const Address address_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<IdleEntry> idle_;     // most recently used at the back
    std::size_t active_ = 0;         // leased + being connected
};

} // namespace tierkv::client
