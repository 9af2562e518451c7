#include "persistence/snapshot.hpp"

#include "common/byte_io.hpp"
#include "common/checksum.hpp"
#include "common/clock.hpp"
#include "persistence/file_util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tierkv::persistence {

namespace {

std::error_code invalid() {
    return std::make_error_code(std::errc::invalid_argument);
}

std::vector<uint8_t> encode_header(const SnapshotHeader& h) {
    std::vector<uint8_t> buf;
    buf.reserve(kSnapshotHeaderSize);
    write_bytes(buf, kSnapshotMagic, kSnapshotMagicSize);
    write_u32_be(buf, h.version);
    write_i64_be(buf, h.created_ns);
    write_u32_be(buf, h.shard_count);
    write_u64_be(buf, h.total_entries);
    write_u64_be(buf, h.wal_position);
    write_u32_be(buf, h.checksum);
    write_u32_be(buf, 0);  // reserved
    return buf;
}

std::error_code decode_header(const uint8_t* data, std::size_t size, SnapshotHeader& out) {
    if (size < kSnapshotHeaderSize || std::memcmp(data, kSnapshotMagic, kSnapshotMagicSize) != 0) {
        return invalid();
    }
    const uint8_t* p = data + kSnapshotMagicSize;
    const uint8_t* end = data + kSnapshotHeaderSize;
    if (!read_u32_be(p, end, out.version) ||
        !read_i64_be(p, end, out.created_ns) ||
        !read_u32_be(p, end, out.shard_count) ||
        !read_u64_be(p, end, out.total_entries) ||
        !read_u64_be(p, end, out.wal_position) ||
        !read_u32_be(p, end, out.checksum)) {
        return invalid();
    }
    if (out.version != kSnapshotVersion) {
        return std::make_error_code(std::errc::not_supported);
    }
    return {};
}

// Timestamp of "snapshot-<ms>.snap", or nullopt.
std::optional<int64_t> snapshot_stamp(const std::filesystem::path& p) {
    const auto name = p.filename().string();
    constexpr std::string_view kPrefix = "snapshot-";
    constexpr std::string_view kSuffix = ".snap";
    if (name.size() <= kPrefix.size() + kSuffix.size() ||
        name.compare(0, kPrefix.size(), kPrefix) != 0 ||
        name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0) {
        return std::nullopt;
    }
    const auto digits = name.substr(kPrefix.size(), name.size() - kPrefix.size() - kSuffix.size());
    if (digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoll(digits);
}

} // anonymous namespace

// ── SnapshotWriter ───────────────────────────────────────────────────────────

SnapshotWriter::SnapshotWriter(std::filesystem::path dir) : dir_(std::move(dir)) {}

SnapshotWriter::~SnapshotWriter() {
    abort();
}

std::error_code SnapshotWriter::begin() {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return ec;

    created_ns_ = unix_now_ns();
    tmp_path_ = dir_ / fmt::format("snapshot-{}.snap.tmp", created_ns_ / 1'000'000);

    fd_ = ::open(tmp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        ec = make_errno_error();
        spdlog::error("Snapshot: failed to open tmp file {}: {}", tmp_path_.string(), ec.message());
        return ec;
    }

    // Placeholder; the real header is written by commit().
    std::vector<uint8_t> zeros(kSnapshotHeaderSize, 0);
    return write_all(fd_, zeros.data(), zeros.size());
}

void SnapshotWriter::begin_shard(uint32_t id) {
    block_.clear();
    block_count_ = 0;
    write_u32_be(block_, id);
    write_u64_be(block_, 0);   // last_lsn, patched in end_shard()
    write_u32_be(block_, 0);   // entry count, patched in end_shard()
}

void SnapshotWriter::add_entry(const std::string& key,
                               const Value& value,
                               std::optional<int64_t> expires_at_ns,
                               uint64_t version) {
    write_short_string(block_, key);
    encode_entry(block_, value, expires_at_ns, version);
    ++block_count_;
}

std::error_code SnapshotWriter::end_shard(uint64_t last_lsn) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    for (int i = 0; i < 8; ++i) {
        block_[4 + i] = static_cast<uint8_t>((last_lsn >> ((7 - i) * 8)) & 0xFF);
    }
    patch_u32_be(block_, 12, block_count_);

    crc_ = crc32_update(crc_, block_.data(), block_.size());
    auto ec = write_all(fd_, block_.data(), block_.size());
    if (ec) return ec;

    ++shard_count_;
    total_entries_ += block_count_;
    block_.clear();
    block_count_ = 0;
    return {};
}

std::error_code SnapshotWriter::commit(uint64_t wal_position, std::filesystem::path& path) {
    if (fd_ == -1) return std::make_error_code(std::errc::bad_file_descriptor);

    SnapshotHeader header;
    header.created_ns = created_ns_;
    header.shard_count = shard_count_;
    header.total_entries = total_entries_;
    header.wal_position = wal_position;
    header.checksum = crc_;
    auto bytes = encode_header(header);

    std::error_code ec;
    auto n = ::pwrite(fd_, bytes.data(), bytes.size(), 0);
    if (n < 0) {
        ec = make_errno_error();
    } else if (static_cast<std::size_t>(n) != bytes.size()) {
        ec = std::make_error_code(std::errc::io_error);
    } else if (::fsync(fd_) < 0) {
        ec = make_errno_error();
    }
    ::close(fd_);
    fd_ = -1;
    if (ec) {
        spdlog::error("Snapshot: finalising {} failed: {}", tmp_path_.string(), ec.message());
        abort();
        return ec;
    }

    int64_t stamp = created_ns_ / 1'000'000;
    do {
        path = dir_ / fmt::format("snapshot-{}.snap", stamp++);
    } while (std::filesystem::exists(path));

    std::filesystem::rename(tmp_path_, path, ec);
    if (ec) {
        spdlog::error("Snapshot: rename failed: {}", ec.message());
        abort();
        return ec;
    }
    tmp_path_.clear();

    ec = fsync_dir(dir_);
    if (ec) return ec;

    spdlog::info("Snapshot: saved {} entries across {} shards to {} (wal position {})",
                 total_entries_, shard_count_, path.filename().string(), wal_position);
    return {};
}

void SnapshotWriter::abort() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!tmp_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path_, ec);
        tmp_path_.clear();
    }
}

// ── Loading ──────────────────────────────────────────────────────────────────

std::error_code read_snapshot_header(const std::filesystem::path& path, SnapshotHeader& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }
    uint8_t buf[kSnapshotHeaderSize];
    auto n = ::pread(fd, buf, sizeof(buf), 0);
    ::close(fd);
    if (n < 0) {
        return make_errno_error();
    }
    return decode_header(buf, static_cast<std::size_t>(n), out);
}

std::error_code load_snapshot(const std::filesystem::path& path, SnapshotContents& out) {
    std::vector<uint8_t> buf;
    auto ec = read_file(path, buf);
    if (ec) {
        spdlog::error("Snapshot: failed to read {}: {}", path.string(), ec.message());
        return ec;
    }

    ec = decode_header(buf.data(), buf.size(), out.header);
    if (ec) {
        spdlog::error("Snapshot: {} has an invalid header", path.filename().string());
        return ec;
    }

    const uint8_t* p = buf.data() + kSnapshotHeaderSize;
    const uint8_t* end = buf.data() + buf.size();

    uint32_t computed_crc = crc32(p, static_cast<std::size_t>(end - p));
    if (computed_crc != out.header.checksum) {
        spdlog::error("Snapshot: {} CRC mismatch (stored={:#010x}, computed={:#010x})",
                      path.filename().string(), out.header.checksum, computed_crc);
        return invalid();
    }

    out.shards.clear();
    out.shards.reserve(out.header.shard_count);

    uint64_t total = 0;
    for (uint32_t s = 0; s < out.header.shard_count; ++s) {
        SnapshotShard shard;
        uint32_t count = 0;
        if (!read_u32_be(p, end, shard.id) ||
            !read_u64_be(p, end, shard.last_lsn) ||
            !read_u32_be(p, end, count)) {
            spdlog::error("Snapshot: {} truncated at shard block {}", path.filename().string(), s);
            return invalid();
        }

        shard.entries.reserve(std::min<std::size_t>(count, static_cast<std::size_t>(end - p)));
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            DecodedEntry entry;
            if (!read_short_string(p, end, key) || !decode_entry(p, end, entry)) {
                spdlog::error("Snapshot: {} malformed entry {} in shard {}",
                              path.filename().string(), i, shard.id);
                return invalid();
            }
            shard.entries.emplace_back(std::move(key), std::move(entry));
        }

        total += count;
        out.shards.push_back(std::move(shard));
    }

    if (p != end || total != out.header.total_entries) {
        spdlog::error("Snapshot: {} structure does not match its header", path.filename().string());
        return invalid();
    }

    spdlog::info("Snapshot: loaded {} entries from {}", total, path.filename().string());
    return {};
}

std::vector<std::filesystem::path> list_snapshots(const std::filesystem::path& dir) {
    std::vector<std::pair<int64_t, std::filesystem::path>> found;
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (auto stamp = snapshot_stamp(e.path())) {
            found.emplace_back(*stamp, e.path());
        }
    }
    std::sort(found.begin(), found.end());

    std::vector<std::filesystem::path> paths;
    paths.reserve(found.size());
    for (auto& [stamp, p] : found) {
        paths.push_back(std::move(p));
    }
    return paths;
}

std::optional<std::pair<std::filesystem::path, SnapshotContents>>
load_latest_snapshot(const std::filesystem::path& dir) {
    auto paths = list_snapshots(dir);
    for (auto it = paths.rbegin(); it != paths.rend(); ++it) {
        SnapshotContents contents;
        if (auto ec = load_snapshot(*it, contents)) {
            spdlog::warn("Snapshot: skipping {}: {}", it->filename().string(), ec.message());
            continue;
        }
        return std::make_pair(*it, std::move(contents));
    }
    return std::nullopt;
}

uint64_t prune_snapshots(const std::filesystem::path& dir, std::size_t retain) {
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        const auto name = e.path().filename().string();
        if (name.rfind("snapshot-", 0) == 0 && e.path().extension() == ".tmp") {
            std::error_code rm_ec;
            std::filesystem::remove(e.path(), rm_ec);
        }
    }

    auto paths = list_snapshots(dir);
    std::size_t excess = paths.size() > retain ? paths.size() - retain : 0;
    for (std::size_t i = 0; i < excess; ++i) {
        std::error_code rm_ec;
        if (std::filesystem::remove(paths[i], rm_ec)) {
            spdlog::info("Snapshot: pruned {}", paths[i].filename().string());
        }
    }

    if (excess >= paths.size()) return 0;
    SnapshotHeader oldest;
    if (read_snapshot_header(paths[excess], oldest)) return 0;
    return oldest.wal_position;
}

} // namespace tierkv::persistence
