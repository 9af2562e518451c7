#pragma once

#include "storage/value_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tierkv::persistence {

// ── Snapshot header constants ────────────────────────────────────────────────

static constexpr char kSnapshotMagic[] = "KVSNAP01";     // 8 bytes (no NUL)
static constexpr std::size_t kSnapshotMagicSize = 8;
static constexpr uint32_t kSnapshotVersion = 1;
static constexpr std::size_t kSnapshotHeaderSize = 48;

struct SnapshotHeader {
    uint32_t version = kSnapshotVersion;
    int64_t created_ns = 0;      // unix ns
    uint32_t shard_count = 0;
    uint64_t total_entries = 0;
    uint64_t wal_position = 0;   // replay starts at this LSN
    uint32_t checksum = 0;       // CRC32 of the body
};

// ── Snapshot shard block ─────────────────────────────────────────────────────
//
// In-memory form of one shard's section.  Deadlines are absolute unix
// nanoseconds so they survive a restart.

struct SnapshotShard {
    uint32_t id = 0;
    uint64_t last_lsn = 0;
    std::vector<std::pair<std::string, DecodedEntry>> entries;
};

struct SnapshotContents {
    SnapshotHeader header;
    std::vector<SnapshotShard> shards;
};

// ── Snapshot file format ─────────────────────────────────────────────────────
//
//   [magic: "KVSNAP01" (8B)][version: u32][created: i64 unix ns]
//   [shard_count: u32][total_entries: u64][wal_position: u64]
//   [crc32: u32][reserved: u32]                               = 48 bytes
//   body, per shard:
//     [shard_id: u32][last_lsn: u64][entry_count: u32]
//       ([key_len: u16][key][entry]) × entry_count
//
// The CRC covers the body.  Files are written as snapshot-{ms}.snap.tmp and
// renamed into place once complete.

// ── SnapshotWriter ───────────────────────────────────────────────────────────
//
// Streams one snapshot to disk shard block by shard block so the caller
// never holds more than one shard's worth of data.
//
// Thread-safety: NOT thread-safe.  Owned by the persistence worker.

class SnapshotWriter {
public:
    explicit SnapshotWriter(std::filesystem::path dir);
    ~SnapshotWriter();

    SnapshotWriter(const SnapshotWriter&) = delete;
    SnapshotWriter& operator=(const SnapshotWriter&) = delete;

    // Create the temporary file and reserve room for the header.
    [[nodiscard]] std::error_code begin();

    // Start a new shard block.
    void begin_shard(uint32_t id);

    // Add an entry to the current block.  `expires_at_ns` is unix ns.
    void add_entry(const std::string& key,
                   const Value& value,
                   std::optional<int64_t> expires_at_ns,
                   uint64_t version);

    // Finish the current block and write it out.
    [[nodiscard]] std::error_code end_shard(uint64_t last_lsn);

    // Write the header, fsync, and rename into place.  On success `path`
    // receives the final file name.
    [[nodiscard]] std::error_code commit(uint64_t wal_position, std::filesystem::path& path);

    // Remove the temporary file.  Called by the destructor if neither
    // commit() nor abort() ran.
    void abort();

private:
    std::filesystem::path dir_;
    std::filesystem::path tmp_path_;
    int64_t created_ns_ = 0;
    int fd_ = -1;

    std::vector<uint8_t> block_;
    uint32_t block_count_ = 0;
    uint32_t shard_count_ = 0;
    uint64_t total_entries_ = 0;
    uint32_t crc_ = 0;
};

// ── Loading ──────────────────────────────────────────────────────────────────

// Load and fully validate (magic, version, CRC, structure) one snapshot.
[[nodiscard]] std::error_code load_snapshot(const std::filesystem::path& path,
                                            SnapshotContents& out);

// Read just the header (no CRC check).
[[nodiscard]] std::error_code read_snapshot_header(const std::filesystem::path& path,
                                                   SnapshotHeader& out);

// Finalised snapshots in `dir`, oldest first.
[[nodiscard]] std::vector<std::filesystem::path> list_snapshots(const std::filesystem::path& dir);

// Load the newest snapshot that validates.  Returns nullopt (and logs each
// rejected file) when none does.
[[nodiscard]] std::optional<std::pair<std::filesystem::path, SnapshotContents>>
load_latest_snapshot(const std::filesystem::path& dir);

// Delete all but the newest `retain` snapshots and any stale .tmp files.
// Returns the WAL position of the oldest snapshot kept (0 if none), which
// is the lowest LSN recovery can still need.
uint64_t prune_snapshots(const std::filesystem::path& dir, std::size_t retain);

} // namespace tierkv::persistence
