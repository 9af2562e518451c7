#include "persistence/recovery.hpp"

#include "persistence/snapshot.hpp"
#include "persistence/wal.hpp"

#include <algorithm>
#include <type_traits>
#include <vector>

#include <spdlog/spdlog.h>

namespace tierkv::persistence {

namespace {

std::chrono::milliseconds shorten(std::chrono::milliseconds ttl, std::chrono::milliseconds elapsed) {
    if (ttl <= elapsed) return std::chrono::milliseconds{0};
    return ttl - elapsed;
}

// Rewrite TTLs relative to now instead of the record's write time.
void adjust_ttl(MutationOp& op, std::chrono::milliseconds elapsed) {
    std::visit(
        [elapsed](auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, SetOp> ||
                          std::is_same_v<T, SetNxOp> ||
                          std::is_same_v<T, MSetOp>) {
                if (m.ttl) m.ttl = shorten(*m.ttl, elapsed);
            } else if constexpr (std::is_same_v<T, LockOp> ||
                                 std::is_same_v<T, ExtendLockOp>) {
                m.ttl = shorten(m.ttl, elapsed);
            }
        },
        op);
}

// Per-shard LSNs recorded by the snapshot.  Keys are routed with the
// snapshot's own shard count, which is what the recorded LSNs refer to.
class SnapshotCoverage {
public:
    SnapshotCoverage() = default;

    explicit SnapshotCoverage(const SnapshotContents& contents)
        : lsns_(contents.header.shard_count, 0) {
        for (const auto& shard : contents.shards) {
            if (shard.id < lsns_.size()) lsns_[shard.id] = shard.last_lsn;
        }
    }

    [[nodiscard]] bool covers(const std::string& key, uint64_t lsn) const {
        if (lsns_.empty()) return false;
        return lsn <= lsns_[hash_key(key) % lsns_.size()];
    }

    [[nodiscard]] uint64_t max_lsn() const {
        return lsns_.empty() ? 0 : *std::max_element(lsns_.begin(), lsns_.end());
    }

private:
    std::vector<uint64_t> lsns_;
};

// Drop the parts of `op` the snapshot already reflects.  Returns false when
// nothing is left to apply.
bool filter_covered(MutationOp& op, uint64_t lsn, const SnapshotCoverage& coverage) {
    return std::visit(
        [&](auto& m) -> bool {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, MSetOp>) {
                std::erase_if(m.pairs, [&](const auto& p) { return coverage.covers(p.first, lsn); });
                return !m.pairs.empty();
            } else if constexpr (std::is_same_v<T, MDelOp>) {
                std::erase_if(m.keys, [&](const auto& k) { return coverage.covers(k, lsn); });
                return !m.keys.empty();
            } else {
                return !coverage.covers(m.key, lsn);
            }
        },
        op);
}

uint64_t load_snapshot_into(Engine& engine,
                            const std::filesystem::path& dir,
                            RecoveryStats& stats,
                            SnapshotCoverage& coverage) {
    auto latest = load_latest_snapshot(dir);
    if (!latest) {
        spdlog::info("Recovery: no valid snapshot, starting from empty state");
        return 0;
    }

    auto& [path, contents] = *latest;
    if (contents.header.shard_count != engine.num_shards()) {
        spdlog::warn("Recovery: snapshot has {} shards, engine has {}; re-routing keys",
                     contents.header.shard_count, engine.num_shards());
    }

    const auto now = engine.clock().now();
    const int64_t unix_now = unix_now_ns();

    for (auto& shard : contents.shards) {
        for (auto& [key, decoded] : shard.entries) {
            Entry entry;
            entry.value = std::move(decoded.value);
            entry.version = decoded.version;
            if (decoded.expires_at) {
                int64_t left_ns = *decoded.expires_at - unix_now;
                if (left_ns <= 0) continue;   // expired while we were down
                auto left = std::min(std::chrono::nanoseconds{left_ns},
                                     std::chrono::nanoseconds{kMaxTtl});
                entry.expires_at = now + std::chrono::duration_cast<Clock::duration>(left);
            }
            engine.import_entry(key, std::move(entry));
            ++stats.snapshot_entries;
        }
    }

    stats.snapshot_loaded = true;
    stats.snapshot_file = path.filename().string();
    coverage = SnapshotCoverage(contents);

    spdlog::info("Recovery: loaded {} entries from {} (wal position {})",
                 stats.snapshot_entries, stats.snapshot_file, contents.header.wal_position);
    return contents.header.wal_position;
}

} // anonymous namespace

std::error_code recover(Engine& engine, const std::filesystem::path& dir, RecoveryStats& stats) {
    const auto start = std::chrono::steady_clock::now();
    stats = {};

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return ec;

    spdlog::info("Recovery: starting from {}", dir.string());

    SnapshotCoverage coverage;
    const uint64_t position = load_snapshot_into(engine, dir, stats, coverage);
    uint64_t max_lsn = coverage.max_lsn();

    const int64_t unix_now = unix_now_ns();
    for (const auto& path : list_wal_files(dir)) {
        WalReadStats file_stats;
        auto read_ec = read_wal_file(
            path,
            [&](WalRecord&& rec) {
                max_lsn = std::max(max_lsn, rec.lsn);
                if (rec.lsn < position || !filter_covered(rec.op, rec.lsn, coverage)) {
                    ++stats.wal_records_skipped;
                    return;
                }
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::nanoseconds{std::max<int64_t>(0, unix_now - rec.timestamp_ns)});
                adjust_ttl(rec.op, elapsed);
                engine.apply(rec.op);
                ++stats.wal_records_replayed;
            },
            file_stats);

        if (read_ec) {
            spdlog::warn("Recovery: skipping WAL {}: {}", path.filename().string(), read_ec.message());
            ++stats.corrupted_records;
            continue;
        }

        ++stats.wal_files;
        stats.corrupted_records += file_stats.corrupted + (file_stats.truncated ? 1 : 0);
    }

    stats.last_lsn = max_lsn;
    for (std::size_t i = 0; i < engine.num_shards(); ++i) {
        engine.shard(i).set_last_lsn(max_lsn);
    }

    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::info("Recovery: done in {} ms: {} snapshot entries, {} WAL records replayed "
                 "({} already in snapshot, {} corrupted), last lsn {}",
                 stats.duration.count(), stats.snapshot_entries, stats.wal_records_replayed,
                 stats.wal_records_skipped, stats.corrupted_records, stats.last_lsn);
    return {};
}

} // namespace tierkv::persistence
