#pragma once

#include "common/clock.hpp"
#include "storage/engine_error.hpp"
#include "storage/mutation.hpp"
#include "storage/shard.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace tierkv {

static constexpr std::size_t kMaxKeyBytes = 256;

struct EngineOptions {
    std::size_t num_shards = 256;

    // Hot-tier budget per shard in bytes; 0 keeps everything in memory.
    std::size_t shard_memory_bytes = 0;

    // Directory for cold-tier data files.  Wiped of stale data files at
    // startup.  Required when shard_memory_bytes > 0.
    std::filesystem::path cold_dir;

    double compaction_threshold = 0.5;

    // Maximum encoded size of a single value.
    std::size_t max_value_bytes = 16 * 1024 * 1024;
};

enum class PersistenceMode {
    Disabled,
    Enabled,
    Degraded,   // worker failed; mutations are no longer durable
};

[[nodiscard]] const char* to_string(PersistenceMode mode) noexcept;

struct EngineInfo {
    std::size_t num_shards = 0;
    std::size_t entries = 0;
    std::size_t hot_entries = 0;
    std::size_t cold_entries = 0;
    std::size_t hot_bytes = 0;
    std::size_t data_files = 0;
    uint64_t evictions = 0;
    uint64_t promotions = 0;
    uint64_t compactions = 0;
    PersistenceMode persistence = PersistenceMode::Disabled;
};

// Multi-line "name: value" rendering used by the INFO command.
[[nodiscard]] std::string format_info(const EngineInfo& info);

// Stable 64-bit FNV-1a.  Shard routing depends on it across restarts.
[[nodiscard]] uint64_t hash_key(const std::string& key) noexcept;

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Routes every key to one of a fixed number of shards by hash and exposes
// the typed operation API.  Owns the shards and, optionally, the mutation
// sink that feeds the persistence worker.
//
// Validation errors (empty or oversized key, oversized value) and type
// errors raise EngineError; nothing is modified when they do.
//
// Thread-safety: every public method may be called concurrently.

class Engine {
public:
    explicit Engine(EngineOptions options);
    Engine(EngineOptions options, const Clock& clock);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ── Single-key operations ────────────────────────────────────────────────

    [[nodiscard]] std::optional<Value> get(const std::string& key);
    void set(const std::string& key, Value value, Ttl ttl = std::nullopt);
    bool del(const std::string& key);
    [[nodiscard]] bool exists(const std::string& key);
    int64_t incr(const std::string& key, int64_t delta = 1);
    int64_t decr(const std::string& key, int64_t delta = 1);
    bool cas(const std::string& key, const Value& expected, Value desired, Ttl ttl = std::nullopt);
    bool setnx(const std::string& key, Value value, Ttl ttl = std::nullopt);
    bool expire(const std::string& key, std::chrono::milliseconds ttl);

    // nullopt if absent, -1 if the key has no TTL, else milliseconds left.
    [[nodiscard]] std::optional<int64_t> ttl(const std::string& key);

    // ── Batch operations (atomic per key only) ───────────────────────────────

    [[nodiscard]] std::vector<std::optional<Value>> mget(const std::vector<std::string>& keys);
    void mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl = std::nullopt);
    std::size_t mdel(const std::vector<std::string>& keys);
    [[nodiscard]] std::vector<bool> mexists(const std::vector<std::string>& keys);

    // ── Locks ────────────────────────────────────────────────────────────────
    //
    // A lock is an ordinary entry holding {owner, acquired_at} with a TTL.
    // unlock / extend_lock return false when no lock is held and raise
    // LockOwnerMismatch when someone else holds it.

    bool lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);
    bool unlock(const std::string& key, const std::string& owner);
    bool extend_lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);

    // ── Maintenance ──────────────────────────────────────────────────────────

    std::size_t sweep_expired();
    std::size_t compact();

    [[nodiscard]] EngineInfo info() const;

    // ── Persistence ──────────────────────────────────────────────────────────

    // Take ownership of the sink and start reporting mutations to it.
    // attach / detach must not race with other calls (startup, shutdown).
    void attach_persistence(std::unique_ptr<MutationSink> sink);

    // Stop reporting and destroy the sink (which flushes what it holds).
    void detach_persistence();

    [[nodiscard]] PersistenceMode persistence_mode() const;

    // Replay a logged mutation without reporting it.
    void apply(const MutationOp& op);

    // Insert an entry loaded from a snapshot.
    void import_entry(const std::string& key, Entry entry);

    [[nodiscard]] std::size_t num_shards() const noexcept { return shards_.size(); }
    [[nodiscard]] std::size_t shard_index(const std::string& key) const noexcept;
    [[nodiscard]] Shard& shard(std::size_t index) { return *shards_[index]; }
    [[nodiscard]] const Shard& shard(std::size_t index) const { return *shards_[index]; }
    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

private:
    Shard& shard_for(const std::string& key) { return *shards_[shard_index(key)]; }

    void validate_key(const std::string& key) const;
    void validate_value(const Value& value) const;
    void validate_ttl(std::chrono::milliseconds ttl) const;
    void validate_ttl(const Ttl& ttl) const;

    const EngineOptions options_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<std::unique_ptr<Shard>> shards_;

    // Declared last: destroyed (and drained) while the shards still exist.
    std::unique_ptr<MutationSink> persistence_;
};

} // namespace tierkv
