#include "persistence/persistence_handle.hpp"

#include "common/logger.hpp"
#include "persistence/snapshot.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace tierkv::persistence {

PersistenceHandle::PersistenceHandle(Engine& engine, PersistenceOptions options, uint64_t last_lsn)
    : engine_(engine),
      options_(std::move(options)),
      logger_(make_component_logger("persistence")),
      wal_(options_.dir),
      last_lsn_(last_lsn),
      written_lsn_(last_lsn) {}

PersistenceHandle::~PersistenceHandle() {
    stop();
}

void PersistenceHandle::start() {
    if (running_) return;

    if (auto ec = wal_.open(written_lsn_ + 1)) {
        throw std::runtime_error(fmt::format("cannot open WAL in {}: {}",
                                             options_.dir.string(), ec.message()));
    }

    last_snapshot_ = std::chrono::steady_clock::now();
    running_ = true;
    worker_ = std::thread([this] { run(); });

    logger_->info("persistence started in {} (flush every {} ms, next lsn {})",
                  options_.dir.string(), options_.flush_interval.count(), written_lsn_ + 1);
}

void PersistenceHandle::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_ || stopping_) return;
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    logger_->info("persistence stopped at lsn {}", written_lsn_);
}

// ── Producer side ────────────────────────────────────────────────────────────

uint64_t PersistenceHandle::record(std::size_t /*shard*/, MutationOp op) {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [this] {
        return queue_.size() < options_.channel_capacity || degraded_ || stopping_;
    });

    uint64_t lsn = last_lsn_.load(std::memory_order_relaxed) + 1;
    last_lsn_.store(lsn, std::memory_order_release);

    if (!degraded_ && running_) {
        queue_.push_back(WalRecord{lsn, unix_now_ns(), std::move(op)});
        lock.unlock();
        not_empty_.notify_one();
    }
    return lsn;
}

uint64_t PersistenceHandle::current_lsn() const {
    return last_lsn_.load(std::memory_order_acquire);
}

bool PersistenceHandle::degraded() const {
    return degraded_.load();
}

bool PersistenceHandle::snapshot_now() {
    std::future<bool> done;
    {
        std::lock_guard lock(mutex_);
        if (!running_ || stopping_ || degraded_) return false;
        requests_.push_back(Request{RequestKind::Snapshot, {}});
        done = requests_.back().done.get_future();
    }
    not_empty_.notify_one();
    return done.get();
}

bool PersistenceHandle::flush_now() {
    std::future<bool> done;
    {
        std::lock_guard lock(mutex_);
        if (!running_ || stopping_ || degraded_) return false;
        requests_.push_back(Request{RequestKind::Flush, {}});
        done = requests_.back().done.get_future();
    }
    not_empty_.notify_one();
    return done.get();
}

// ── Worker ───────────────────────────────────────────────────────────────────

void PersistenceHandle::write_batch(std::deque<WalRecord>& batch) {
    for (const auto& rec : batch) {
        if (auto ec = wal_.append(rec)) {
            throw std::system_error(ec, "WAL append");
        }
        written_lsn_ = rec.lsn;
        ++ops_since_snapshot_;
    }
    batch.clear();
}

std::size_t PersistenceHandle::drain() {
    std::deque<WalRecord> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(queue_);
    }
    not_full_.notify_all();

    std::size_t n = batch.size();
    write_batch(batch);
    return n;
}

void PersistenceHandle::run() {
    auto next_flush = std::chrono::steady_clock::now() + options_.flush_interval;

    try {
        while (true) {
            std::deque<WalRecord> batch;
            std::vector<Request> requests;
            bool stopping = false;
            {
                std::unique_lock lock(mutex_);
                not_empty_.wait_until(lock, next_flush, [this] {
                    return !queue_.empty() || !requests_.empty() || stopping_;
                });
                batch.swap(queue_);
                requests.swap(requests_);
                stopping = stopping_;
            }
            not_full_.notify_all();

            write_batch(batch);

            auto now = std::chrono::steady_clock::now();
            if (now >= next_flush || stopping) {
                if (auto ec = wal_.flush()) {
                    throw std::system_error(ec, "WAL flush");
                }
                next_flush = now + options_.flush_interval;
            }

            if (wal_.size() >= options_.wal_max_bytes) {
                if (auto ec = wal_.rotate(written_lsn_ + 1)) {
                    throw std::system_error(ec, "WAL rotate");
                }
            }

            for (auto& req : requests) {
                if (req.kind == RequestKind::Snapshot) {
                    req.done.set_value(take_snapshot());
                } else {
                    auto ec = wal_.flush();
                    req.done.set_value(!ec);
                    if (ec) throw std::system_error(ec, "WAL flush");
                }
            }

            bool ops_due = options_.snapshot_ops > 0 && ops_since_snapshot_ >= options_.snapshot_ops;
            bool time_due = ops_since_snapshot_ > 0 &&
                            now - last_snapshot_ >= options_.snapshot_interval;
            if (!stopping && (ops_due || time_due)) {
                if (!take_snapshot()) {
                    // Retry on the next trigger rather than on every loop.
                    last_snapshot_ = std::chrono::steady_clock::now();
                    ops_since_snapshot_ = 0;
                }
            }

            if (stopping) {
                std::lock_guard lock(mutex_);
                if (queue_.empty()) break;
            }
        }

        if (auto ec = wal_.flush()) {
            throw std::system_error(ec, "WAL final flush");
        }
        wal_.close();
    } catch (const std::exception& e) {
        fail(e.what());
    }

    std::lock_guard lock(mutex_);
    for (auto& req : requests_) {
        req.done.set_value(false);
    }
    requests_.clear();
}

bool PersistenceHandle::take_snapshot() {
    SnapshotWriter writer(options_.dir);
    if (auto ec = writer.begin()) {
        logger_->error("snapshot failed to start: {}", ec.message());
        return false;
    }

    const auto clock_now = engine_.clock().now();
    const int64_t unix_now = unix_now_ns();
    uint64_t position = std::numeric_limits<uint64_t>::max();

    for (std::size_t i = 0; i < engine_.num_shards(); ++i) {
        writer.begin_shard(static_cast<uint32_t>(i));

        auto add = [&](const std::string& key, const Entry& entry) {
            std::optional<int64_t> expires;
            if (entry.expires_at) {
                expires = unix_now + std::chrono::duration_cast<std::chrono::nanoseconds>(
                    *entry.expires_at - clock_now).count();
            }
            writer.add_entry(key, entry.value, expires, entry.version);
        };

        // A writer holding this shard may be waiting for channel space.
        uint64_t lsn = 0;
        while (!engine_.shard(i).try_visit(add, lsn)) {
            if (drain() == 0) {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        }

        if (auto ec = writer.end_shard(lsn)) {
            logger_->error("snapshot failed writing shard {}: {}", i, ec.message());
            return false;
        }
        position = std::min(position, lsn);
    }

    // Every record at or below `position` is reflected in every shard block.
    std::filesystem::path path;
    if (auto ec = writer.commit(position + 1, path)) {
        logger_->error("snapshot commit failed: {}", ec.message());
        return false;
    }

    ops_since_snapshot_ = 0;
    last_snapshot_ = std::chrono::steady_clock::now();

    uint64_t oldest_needed = prune_snapshots(options_.dir, options_.snapshot_retention);
    if (oldest_needed > 0) {
        prune_wal_files(options_.dir, oldest_needed);
    }
    return true;
}

void PersistenceHandle::fail(const std::string& what) {
    logger_->error("persistence worker failed: {}; continuing UNPERSISTED", what);

    std::lock_guard lock(mutex_);
    degraded_ = true;
    queue_.clear();
    not_full_.notify_all();
}

} // namespace tierkv::persistence
