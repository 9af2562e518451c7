#pragma once

#include "common/clock.hpp"
#include "storage/data_file.hpp"
#include "storage/mutation.hpp"
#include "storage/value_codec.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace tierkv {

struct ShardOptions {
    // Hot-tier budget in bytes; 0 disables tiering (everything stays hot).
    std::size_t memory_budget = 0;

    // Directory for this shard's cold data files.  Required when
    // memory_budget > 0.
    std::filesystem::path cold_dir;

    // Waste ratio at which a data file is rewritten by compact().
    double compaction_threshold = 0.5;

    // Active data file is sealed once it grows past this size.
    uint64_t max_data_file_bytes = 64ull * 1024 * 1024;
};

struct ShardStats {
    std::size_t hot_entries = 0;
    std::size_t cold_entries = 0;
    std::size_t hot_bytes = 0;
    std::size_t data_files = 0;
    uint64_t evictions = 0;
    uint64_t promotions = 0;
    uint64_t compactions = 0;
    uint64_t last_lsn = 0;
};

// ── Shard ────────────────────────────────────────────────────────────────────
//
// One partition of the keyspace: hot map, clock ring for approximate-LRU
// eviction, cold index into append-only data files, and the hot-bytes
// counter.  Everything is guarded by one reader-writer lock.
//
// Invariants (hold whenever the lock is free):
//   - a key lives in at most one of hot_ / cold_;
//   - hot_bytes_ == sum of hot_[*].charge;
//   - hot_bytes_ <= memory_budget (when a budget is set and disk I/O works).
//
// Reads take the shared lock and only upgrade (release, then take the
// exclusive lock and re-check) when a cold hit needs promoting.  Every
// mutating call holds the exclusive lock for its whole duration, including
// eviction, and reports itself to the MutationSink before releasing it.

class Shard {
public:
    using Visitor = std::function<void(const std::string& key, const Entry& entry)>;

    Shard(std::size_t id,
          const Clock& clock,
          ShardOptions options,
          std::shared_ptr<spdlog::logger> logger);

    Shard(const Shard&) = delete;
    Shard& operator=(const Shard&) = delete;

    void attach_sink(MutationSink* sink) noexcept { sink_ = sink; }

    // ── Reads ────────────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<Value> get(const std::string& key);
    [[nodiscard]] bool exists(const std::string& key);

    // Remaining TTL: nullopt if the key is absent, -1 if it has no TTL,
    // otherwise milliseconds left (rounded up).
    [[nodiscard]] std::optional<int64_t> ttl(const std::string& key);

    // ── Writes ───────────────────────────────────────────────────────────────

    void set(const std::string& key, Value value, Ttl ttl);
    bool del(const std::string& key);
    int64_t incr(const std::string& key, int64_t delta);
    int64_t decr(const std::string& key, int64_t delta);
    bool cas(const std::string& key, const Value& expected, Value desired, Ttl ttl);
    bool setnx(const std::string& key, Value value, Ttl ttl);
    bool expire(const std::string& key, std::chrono::milliseconds ttl);

    // Batch variants for the subset of keys routed to this shard.  Each is
    // reported to the sink as a single mutation.
    void mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl);
    std::size_t mdel(const std::vector<std::string>& keys);

    bool lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);
    bool unlock(const std::string& key, const std::string& owner);
    bool extend_lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);

    // ── Maintenance ──────────────────────────────────────────────────────────

    // Remove expired entries from both tiers.  Not reported to the sink:
    // expiry is a function of the stored deadline, so replay reaches the
    // same logical state.
    std::size_t sweep_expired();

    // Rewrite data files whose waste ratio crossed the threshold.  Returns
    // the number of files rewritten.  Disk I/O runs without the lock; only
    // the final location swap takes it exclusively.
    std::size_t compact();

    // ── Persistence hooks ────────────────────────────────────────────────────

    // Apply a replayed mutation without reporting it to the sink.
    void apply(const MutationOp& op);

    // Insert an entry loaded from a snapshot verbatim (version preserved).
    void import_entry(const std::string& key, Entry entry);

    // Visit every live entry in both tiers under the shared lock.
    // `last_lsn` receives a sequence number such that every mutation of this
    // shard numbered at or below it is reflected in the visited state, and
    // none above it is.
    void visit(const Visitor& fn, uint64_t& last_lsn) const;

    // As visit(), but gives up immediately if the shared lock is not free.
    [[nodiscard]] bool try_visit(const Visitor& fn, uint64_t& last_lsn) const;

    void set_last_lsn(uint64_t lsn);

    [[nodiscard]] ShardStats stats() const;
    [[nodiscard]] std::size_t id() const noexcept { return id_; }

private:
    struct HotEntry {
        Entry entry;
        std::size_t charge = 0;
        uint64_t seq = 0;
        mutable std::atomic<bool> referenced{true};
    };

    struct ColdLocation {
        uint32_t file_id = 0;
        uint64_t offset = 0;
        uint32_t length = 0;
        uint64_t version = 0;
        std::optional<Clock::time_point> expires_at;
    };

    // All *_locked helpers require the exclusive lock.

    // Version the next write of `key` gets: one past the live entry's, or 1.
    [[nodiscard]] uint64_t next_version_locked(const std::string& key) const;

    [[nodiscard]] bool is_live_locked(const std::string& key) const;

    // Current live entry for `key`, promoting it from the cold tier when it
    // fits the budget.  Expired entries are erased and reported absent.
    [[nodiscard]] std::optional<Entry> load_locked(const std::string& key);

    // Insert or replace `key` in the hot tier, dropping any cold copy, then
    // evict until back under budget.  A protected key is never chosen as the
    // victim of that eviction.
    void put_locked(const std::string& key, Entry entry, bool protect);

    bool erase_locked(const std::string& key);

    // Evict hot entries (never `keep`) until hot_bytes_ <= budget.
    void evict_locked(const std::string* keep);

    [[nodiscard]] bool evict_one_locked(const std::string& key);

    [[nodiscard]] std::error_code read_cold(const ColdLocation& loc, Entry& out) const;
    void drop_cold_locked(const std::string& key, const ColdLocation& loc);
    [[nodiscard]] std::error_code ensure_active_file_locked();
    void compact_ring_locked();

    int64_t add_locked(const std::string& key, int64_t delta, bool subtract);
    void set_locked(const std::string& key, Value value, const Ttl& ttl);
    bool setnx_locked(const std::string& key, Value value, const Ttl& ttl);
    std::size_t mdel_locked(const std::vector<std::string>& keys, std::vector<std::string>* removed);
    bool lock_locked(const std::string& key, const std::string& owner,
                     std::chrono::milliseconds ttl, int64_t acquired_at_ms);
    bool unlock_locked(const std::string& key, const std::string& owner);
    bool extend_lock_locked(const std::string& key, const std::string& owner,
                            std::chrono::milliseconds ttl);

    void record(MutationOp op);

    [[nodiscard]] bool has_budget() const noexcept { return options_.memory_budget > 0; }
    [[nodiscard]] std::size_t charge_of(const std::string& key, const Entry& entry) const noexcept;
    [[nodiscard]] Clock::time_point deadline(std::chrono::milliseconds ttl) const;
    [[nodiscard]] std::optional<Clock::time_point> deadline(const Ttl& ttl) const;

    void visit_locked(const Visitor& fn, uint64_t& last_lsn) const;
    bool compact_file(const std::shared_ptr<DataFile>& victim);

    const std::size_t id_;
    const Clock& clock_;
    const ShardOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    MutationSink* sink_ = nullptr;

    mutable std::shared_mutex mutex_;

    std::unordered_map<std::string, HotEntry> hot_;
    std::deque<std::pair<std::string, uint64_t>> ring_;   // clock hand at front
    uint64_t next_seq_ = 0;
    std::size_t hot_bytes_ = 0;

    std::unordered_map<std::string, ColdLocation> cold_;
    std::map<uint32_t, std::shared_ptr<DataFile>> files_;
    std::shared_ptr<DataFile> active_;
    std::atomic<uint32_t> next_file_id_{0};

    uint64_t last_lsn_ = 0;

    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> promotions_{0};
    std::atomic<uint64_t> compactions_{0};

    // Serialises compact() runs on this shard.
    std::mutex compaction_mutex_;
};

} // namespace tierkv
