#pragma once

#include "persistence/wal.hpp"
#include "storage/engine.hpp"
#include "storage/mutation.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace tierkv::persistence {

struct PersistenceOptions {
    std::filesystem::path dir;
    std::chrono::milliseconds flush_interval{100};
    uint64_t wal_max_bytes = 1ull << 30;
    std::chrono::seconds snapshot_interval{300};
    uint64_t snapshot_ops = 100'000;       // 0 disables the op-count trigger
    std::size_t snapshot_retention = 3;
    std::size_t channel_capacity = 10'000;
};

// ── PersistenceHandle ────────────────────────────────────────────────────────
//
// The engine's MutationSink.  record() numbers each mutation and pushes it
// onto a bounded channel; one background worker drains the channel into
// the WAL, fsyncs on the flush interval, rotates the WAL past its size
// limit, and writes snapshots on the time / op-count triggers.
//
// record() blocks while the channel is full.  If the worker fails it marks
// the handle degraded: from then on record() still hands out sequence
// numbers but drops the mutation, and never blocks.
//
// Snapshotting reads the shards under their shared locks.  A writer blocked
// in record() holds its shard's exclusive lock, so the worker only ever
// *tries* the shared lock and drains the channel between attempts.
//
// Lifecycle: start() opens the WAL and spawns the worker; stop() (also run
// by the destructor) lets it drain the channel, flushes, and joins it.

class PersistenceHandle final : public MutationSink {
public:
    // `last_lsn` is the highest sequence number recovery saw.
    PersistenceHandle(Engine& engine, PersistenceOptions options, uint64_t last_lsn);
    ~PersistenceHandle() override;

    PersistenceHandle(const PersistenceHandle&) = delete;
    PersistenceHandle& operator=(const PersistenceHandle&) = delete;

    // Open the WAL and start the worker.  Throws std::runtime_error if the
    // WAL cannot be opened.
    void start();

    void stop();

    uint64_t record(std::size_t shard, MutationOp op) override;
    [[nodiscard]] uint64_t current_lsn() const override;
    [[nodiscard]] bool degraded() const override;

    // Ask the worker for a snapshot now and wait for the outcome.
    [[nodiscard]] bool snapshot_now();

    // Ask the worker for an fsync now and wait for it.
    [[nodiscard]] bool flush_now();

private:
    enum class RequestKind { Snapshot, Flush };

    struct Request {
        RequestKind kind;
        std::promise<bool> done;
    };

    void run();

    // Move everything queued into the WAL.  Returns the number of records.
    std::size_t drain();
    void write_batch(std::deque<WalRecord>& batch);

    [[nodiscard]] bool take_snapshot();
    void fail(const std::string& what);

    Engine& engine_;
    const PersistenceOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    WalWriter wal_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<WalRecord> queue_;
    std::vector<Request> requests_;
    bool stopping_ = false;

    std::atomic<uint64_t> last_lsn_;
    std::atomic<bool> degraded_{false};
    std::atomic<bool> running_{false};

    // Worker-only state.
    uint64_t written_lsn_ = 0;
    uint64_t ops_since_snapshot_ = 0;
    std::chrono::steady_clock::time_point last_snapshot_;

    std::thread worker_;
};

} // namespace tierkv::persistence
