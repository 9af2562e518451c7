#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace tierkv {

// ── Cold-tier data file ──────────────────────────────────────────────────────
//
// Append-only file of evicted entries:
//   record := [crc32: u32 BE][entry bytes]
// The CRC covers the entry bytes.  Files hold only derived data; a shard
// wipes its directory at startup.
//
// Thread-safety: append() is only called by the owning shard while it holds
// its write lock (or by compaction on a file nobody else can see yet).
// read() uses pread() and is safe from any number of threads.  Instances are
// shared through shared_ptr so compaction can keep reading a file that a
// concurrent pointer swap has already retired.

class DataFile {
public:
    ~DataFile();

    DataFile(const DataFile&) = delete;
    DataFile& operator=(const DataFile&) = delete;

    // Create a new, empty file at `path`.
    [[nodiscard]] static std::shared_ptr<DataFile> create(
        const std::filesystem::path& path,
        uint32_t id,
        std::error_code& ec);

    // Append one record wrapping `entry_bytes`.  On success sets `offset`
    // and `length` (length includes the CRC).
    [[nodiscard]] std::error_code append(const std::vector<uint8_t>& entry_bytes,
                                         uint64_t& offset,
                                         uint32_t& length);

    // Append an already-framed record (CRC included) verbatim.
    [[nodiscard]] std::error_code append_raw(const std::vector<uint8_t>& record,
                                             uint64_t& offset);

    // Read the record at [offset, offset + length).  Verifies the CRC and
    // strips it; `entry_bytes` receives the entry encoding.
    [[nodiscard]] std::error_code read(uint64_t offset,
                                       uint32_t length,
                                       std::vector<uint8_t>& entry_bytes) const;

    // Read the framed record verbatim (used by compaction).
    [[nodiscard]] std::error_code read_raw(uint64_t offset,
                                           uint32_t length,
                                           std::vector<uint8_t>& record) const;

    // Bytes of records that are no longer referenced by the cold index.
    void add_dead(uint64_t bytes) noexcept { dead_bytes_.fetch_add(bytes, std::memory_order_relaxed); }

    [[nodiscard]] uint32_t id() const noexcept { return id_; }
    [[nodiscard]] uint64_t size() const noexcept { return size_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t dead_bytes() const noexcept { return dead_bytes_.load(std::memory_order_relaxed); }

    // Fraction of the file occupied by dead records, 0 for an empty file.
    [[nodiscard]] double waste_ratio() const noexcept;

    // Mark for deletion; the file is unlinked once the last reference drops.
    void retire() noexcept { retired_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    DataFile(std::filesystem::path path, uint32_t id, int fd);

    std::filesystem::path path_;
    uint32_t id_;
    int fd_;
    std::atomic<uint64_t> size_{0};
    std::atomic<uint64_t> dead_bytes_{0};
    std::atomic<bool> retired_{false};
};

} // namespace tierkv
