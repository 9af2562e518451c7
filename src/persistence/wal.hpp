#pragma once

#include "storage/mutation.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tierkv::persistence {

// ── WAL file header ──────────────────────────────────────────────────────────
//
//   [magic: "KVWAL001" (8B)][version: u32][created: i64 unix s]
//   [first_lsn: u64][reserved: u32]                           = 32 bytes

static constexpr char kWalMagic[] = "KVWAL001";          // 8 bytes (no NUL)
static constexpr std::size_t kWalMagicSize = 8;
static constexpr uint32_t kWalVersion = 1;
static constexpr std::size_t kWalHeaderSize = 32;

static constexpr const char* kWalCurrentName = "wal-current.log";

struct WalHeader {
    uint32_t version = kWalVersion;
    int64_t created = 0;
    uint64_t first_lsn = 0;   // LSN of the first record written to the file
};

// ── WAL record ───────────────────────────────────────────────────────────────
//
//   [length: u32][timestamp: i64 unix ns][op: u8][payload][crc32: u32]
//
// `length` counts timestamp through crc.  The CRC covers timestamp through
// payload.  The payload always starts with the record's LSN (u64); the rest
// is op-specific:
//
//   Set, SetNx   [key][ttl][value]
//   Delete       [key]
//   Incr, Decr   [key][delta: i64]
//   MSet         [ttl][count: u32]([key][value])*
//   MDel         [count: u32][key]*
//   Lock         [key][owner][ttl_ms: i64][acquired_at: i64 unix ms]
//   Unlock       [key][owner]
//   ExtendLock   [key][owner][ttl_ms: i64]
//
// where [key] / [owner] are u16-length-prefixed strings and [ttl] is
// [has_ttl: u8][ttl_ms: i64].

static constexpr std::size_t kWalRecordFixedSize = 4 + 8 + 1 + 8 + 4;

struct WalRecord {
    uint64_t lsn = 0;
    int64_t timestamp_ns = 0;
    MutationOp op;
};

// Serialise a record (length prefix and CRC included).
[[nodiscard]] std::vector<uint8_t> encode_record(const WalRecord& rec);

void encode_record(std::vector<uint8_t>& buf, const WalRecord& rec);

// ── WAL replay result ────────────────────────────────────────────────────────

struct WalReadStats {
    uint64_t records = 0;     // records decoded and passed to the callback
    uint64_t corrupted = 0;   // records skipped for a checksum or format error
    bool truncated = false;   // file ended inside a record
};

// ── WalWriter ────────────────────────────────────────────────────────────────
//
// Appends records to <dir>/wal-current.log.  append() hands bytes to the OS
// immediately; flush() makes them durable (fdatasync).  rotate() renames
// the current file to wal-{unix ms}.log and starts a fresh one.
//
// Thread-safety: NOT thread-safe.  Owned by the persistence worker.

class WalWriter {
public:
    explicit WalWriter(std::filesystem::path dir);
    ~WalWriter();

    WalWriter(const WalWriter&) = delete;
    WalWriter& operator=(const WalWriter&) = delete;

    // Create the directory if needed, retire any wal-current.log left by a
    // previous process, and open a fresh file whose first record will be
    // `next_lsn`.
    [[nodiscard]] std::error_code open(uint64_t next_lsn);

    void close();

    [[nodiscard]] std::error_code append(const WalRecord& rec);

    [[nodiscard]] std::error_code flush();

    // Flush, seal the current file and start a new one at `next_lsn`.
    [[nodiscard]] std::error_code rotate(uint64_t next_lsn);

    [[nodiscard]] bool is_open() const { return fd_ != -1; }
    [[nodiscard]] uint64_t size() const { return size_; }
    [[nodiscard]] bool dirty() const { return dirty_; }
    [[nodiscard]] std::filesystem::path current_path() const { return dir_ / kWalCurrentName; }

private:
    [[nodiscard]] std::error_code create_current(uint64_t next_lsn);
    [[nodiscard]] std::error_code seal_current();

    std::filesystem::path dir_;
    int fd_ = -1;
    uint64_t size_ = 0;
    bool dirty_ = false;
    std::vector<uint8_t> scratch_;
};

// ── Reading ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::error_code read_wal_header(const std::filesystem::path& path, WalHeader& out);

// Decode every record of one WAL file in order.  A record whose checksum or
// payload is bad is skipped (its length is trusted) and counted; a record
// that runs past the end of the file ends the scan.  Only a missing or
// unreadable file, or a bad header, is reported as an error.
[[nodiscard]] std::error_code read_wal_file(
    const std::filesystem::path& path,
    const std::function<void(WalRecord&&)>& fn,
    WalReadStats& stats);

// WAL files in `dir` in replay order: rotated files by timestamp, then
// wal-current.log.
[[nodiscard]] std::vector<std::filesystem::path> list_wal_files(const std::filesystem::path& dir);

// Delete rotated WAL files holding only records below `lsn`.  Returns the
// number of files removed.
std::size_t prune_wal_files(const std::filesystem::path& dir, uint64_t lsn);

} // namespace tierkv::persistence
