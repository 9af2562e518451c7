#pragma once

#include "storage/engine.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace tierkv::persistence {

struct RecoveryStats {
    bool snapshot_loaded = false;
    std::string snapshot_file;
    uint64_t snapshot_entries = 0;
    uint64_t wal_files = 0;
    uint64_t wal_records_replayed = 0;
    uint64_t wal_records_skipped = 0;    // already contained in the snapshot
    uint64_t corrupted_records = 0;
    uint64_t last_lsn = 0;               // new records must be numbered above this
    std::chrono::milliseconds duration{0};
};

// ── Recovery ─────────────────────────────────────────────────────────────────
//
// Rebuild `engine` (expected empty) from the persisted state in `dir`:
//
//   1. load the newest snapshot whose checksum validates, if any;
//   2. replay, in order, every WAL record at or after the snapshot's WAL
//      position, skipping per key those the snapshot already reflects;
//   3. skip (and count) corrupted records rather than stopping.
//
// TTLs are carried across the downtime: a replayed TTL is shortened by the
// time elapsed since its record was written, and snapshot deadlines are
// absolute wall-clock times.
//
// Always leaves the engine usable.  Only returns an error when `dir` itself
// cannot be created or read.

[[nodiscard]] std::error_code recover(Engine& engine,
                                      const std::filesystem::path& dir,
                                      RecoveryStats& stats);

} // namespace tierkv::persistence
