#include "client/client_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace tierkv::client {

// ── Lease ────────────────────────────────────────────────────────────────────

Lease::Lease(std::shared_ptr<ClientPool> pool, std::unique_ptr<Client> client)
    : pool_(std::move(pool)), client_(std::move(client)) {}

Lease::Lease(Lease&& other) noexcept
    : pool_(std::move(other.pool_)), client_(std::move(other.client_)) {}

Lease::~Lease() {
    if (pool_ && client_) {
        pool_->release(std::move(client_));
    }
}

// ── ClientPool ───────────────────────────────────────────────────────────────

ClientPool::ClientPool(PoolOptions options)
    : options_(std::move(options)), address_(parse_address(options_.address)) {
    if (options_.max_size == 0) {
        throw std::invalid_argument("pool max_size must be > 0");
    }
}

std::shared_ptr<ClientPool> ClientPool::create(PoolOptions options) {
    std::shared_ptr<ClientPool> pool(new ClientPool(std::move(options)));

    const auto now = std::chrono::steady_clock::now();
    const auto warm = std::min(pool->options_.min_size, pool->options_.max_size);
    for (std::size_t i = 0; i < warm; ++i) {
        pool->idle_.push_back(IdleEntry{std::make_unique<Client>(pool->address_), now});
    }
    return pool;
}

Lease ClientPool::acquire() {
    std::unique_lock lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;

    for (;;) {
        const auto now = std::chrono::steady_clock::now();

        // Oldest idle connections sit at the front.
        while (!idle_.empty() && now - idle_.front().last_used > options_.idle_timeout) {
            idle_.pop_front();
        }

        if (!idle_.empty()) {
            auto client = std::move(idle_.back().client);
            idle_.pop_back();
            ++active_;
            return Lease(shared_from_this(), std::move(client));
        }

        if (active_ + idle_.size() < options_.max_size) {
            ++active_;
            lock.unlock();
            try {
                auto client = std::make_unique<Client>(address_);
                return Lease(shared_from_this(), std::move(client));
            } catch (...) {
                lock.lock();
                --active_;
                available_.notify_one();
                throw;
            }
        }

        if (available_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && active_ >= options_.max_size) {
            throw ClientError(ClientError::Kind::Timeout,
                              fmt::format("no connection available within {} ms",
                                          options_.acquire_timeout.count()));
        }
    }
}

void ClientPool::release(std::unique_ptr<Client> client) {
    {
        std::lock_guard lock(mutex_);
        --active_;
        if (client->is_open()) {
            idle_.push_back(IdleEntry{std::move(client), std::chrono::steady_clock::now()});
        }
    }
    available_.notify_one();
}

std::size_t ClientPool::idle_count() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

std::size_t ClientPool::active_count() const {
    std::lock_guard lock(mutex_);
    return active_;
}

} // namespace tierkv::client
