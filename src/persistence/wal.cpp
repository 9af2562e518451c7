#include "persistence/wal.hpp"

#include "common/byte_io.hpp"
#include "common/checksum.hpp"
#include "common/clock.hpp"
#include "persistence/file_util.hpp"
#include "storage/value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <type_traits>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tierkv::persistence {

namespace {

std::error_code make_error(std::errc e) {
    return std::make_error_code(e);
}

// ── Payload helpers ──────────────────────────────────────────────────────────

void write_ttl(std::vector<uint8_t>& buf, const Ttl& ttl) {
    write_u8(buf, ttl ? 1 : 0);
    write_i64_be(buf, ttl ? ttl->count() : 0);
}

bool read_ttl(const uint8_t*& ptr, const uint8_t* end, Ttl& out) {
    uint8_t has = 0;
    int64_t ms = 0;
    if (!read_u8(ptr, end, has) || !read_i64_be(ptr, end, ms)) return false;
    out.reset();
    if (has) out = std::chrono::milliseconds{ms};
    return true;
}

bool read_ms(const uint8_t*& ptr, const uint8_t* end, std::chrono::milliseconds& out) {
    int64_t ms = 0;
    if (!read_i64_be(ptr, end, ms)) return false;
    out = std::chrono::milliseconds{ms};
    return true;
}

void encode_payload(std::vector<uint8_t>& buf, const MutationOp& op) {
    std::visit(
        [&buf](const auto& m) {
            using T = std::decay_t<decltype(m)>;

            if constexpr (std::is_same_v<T, SetOp> || std::is_same_v<T, SetNxOp>) {
                write_short_string(buf, m.key);
                write_ttl(buf, m.ttl);
                encode_value(buf, m.value);
            } else if constexpr (std::is_same_v<T, DeleteOp>) {
                write_short_string(buf, m.key);
            } else if constexpr (std::is_same_v<T, IncrOp> || std::is_same_v<T, DecrOp>) {
                write_short_string(buf, m.key);
                write_i64_be(buf, m.delta);
            } else if constexpr (std::is_same_v<T, MSetOp>) {
                write_ttl(buf, m.ttl);
                write_u32_be(buf, static_cast<uint32_t>(m.pairs.size()));
                for (const auto& [key, value] : m.pairs) {
                    write_short_string(buf, key);
                    encode_value(buf, value);
                }
            } else if constexpr (std::is_same_v<T, MDelOp>) {
                write_u32_be(buf, static_cast<uint32_t>(m.keys.size()));
                for (const auto& key : m.keys) {
                    write_short_string(buf, key);
                }
            } else if constexpr (std::is_same_v<T, LockOp>) {
                write_short_string(buf, m.key);
                write_short_string(buf, m.owner);
                write_i64_be(buf, m.ttl.count());
                write_i64_be(buf, m.acquired_at_ms);
            } else if constexpr (std::is_same_v<T, UnlockOp>) {
                write_short_string(buf, m.key);
                write_short_string(buf, m.owner);
            } else if constexpr (std::is_same_v<T, ExtendLockOp>) {
                write_short_string(buf, m.key);
                write_short_string(buf, m.owner);
                write_i64_be(buf, m.ttl.count());
            }
        },
        op);
}

// Decode the op-specific part of a payload.  Must consume it exactly.
bool decode_payload(OpType type, const uint8_t*& ptr, const uint8_t* end, MutationOp& out) {
    switch (type) {
    case OpType::Set:
    case OpType::SetNx: {
        std::string key;
        Ttl ttl;
        Value value;
        if (!read_short_string(ptr, end, key) || !read_ttl(ptr, end, ttl) ||
            !decode_value(ptr, end, value)) {
            return false;
        }
        if (type == OpType::Set) {
            out = SetOp{std::move(key), std::move(value), ttl};
        } else {
            out = SetNxOp{std::move(key), std::move(value), ttl};
        }
        return true;
    }

    case OpType::Delete: {
        DeleteOp op;
        if (!read_short_string(ptr, end, op.key)) return false;
        out = std::move(op);
        return true;
    }

    case OpType::Incr:
    case OpType::Decr: {
        std::string key;
        int64_t delta = 0;
        if (!read_short_string(ptr, end, key) || !read_i64_be(ptr, end, delta)) return false;
        if (type == OpType::Incr) {
            out = IncrOp{std::move(key), delta};
        } else {
            out = DecrOp{std::move(key), delta};
        }
        return true;
    }

    case OpType::MSet: {
        MSetOp op;
        uint32_t count = 0;
        if (!read_ttl(ptr, end, op.ttl) || !read_u32_be(ptr, end, count)) return false;
        if (static_cast<std::size_t>(end - ptr) < count) return false;
        op.pairs.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            Value value;
            if (!read_short_string(ptr, end, key) || !decode_value(ptr, end, value)) return false;
            op.pairs.emplace_back(std::move(key), std::move(value));
        }
        out = std::move(op);
        return true;
    }

    case OpType::MDel: {
        MDelOp op;
        uint32_t count = 0;
        if (!read_u32_be(ptr, end, count)) return false;
        if (static_cast<std::size_t>(end - ptr) < count) return false;
        op.keys.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            if (!read_short_string(ptr, end, key)) return false;
            op.keys.push_back(std::move(key));
        }
        out = std::move(op);
        return true;
    }

    case OpType::Lock: {
        LockOp op;
        if (!read_short_string(ptr, end, op.key) || !read_short_string(ptr, end, op.owner) ||
            !read_ms(ptr, end, op.ttl) || !read_i64_be(ptr, end, op.acquired_at_ms)) {
            return false;
        }
        out = std::move(op);
        return true;
    }

    case OpType::Unlock: {
        UnlockOp op;
        if (!read_short_string(ptr, end, op.key) || !read_short_string(ptr, end, op.owner)) {
            return false;
        }
        out = std::move(op);
        return true;
    }

    case OpType::ExtendLock: {
        ExtendLockOp op;
        if (!read_short_string(ptr, end, op.key) || !read_short_string(ptr, end, op.owner) ||
            !read_ms(ptr, end, op.ttl)) {
            return false;
        }
        out = std::move(op);
        return true;
    }
    }

    return false;  // unknown op type
}

std::vector<uint8_t> encode_header(const WalHeader& h) {
    std::vector<uint8_t> buf;
    buf.reserve(kWalHeaderSize);
    write_bytes(buf, kWalMagic, kWalMagicSize);
    write_u32_be(buf, h.version);
    write_i64_be(buf, h.created);
    write_u64_be(buf, h.first_lsn);
    write_u32_be(buf, 0);  // reserved
    return buf;
}

std::error_code decode_header(const uint8_t* data, std::size_t size, WalHeader& out) {
    if (size < kWalHeaderSize || std::memcmp(data, kWalMagic, kWalMagicSize) != 0) {
        return make_error(std::errc::invalid_argument);
    }
    const uint8_t* ptr = data + kWalMagicSize;
    const uint8_t* end = data + kWalHeaderSize;
    if (!read_u32_be(ptr, end, out.version) ||
        !read_i64_be(ptr, end, out.created) ||
        !read_u64_be(ptr, end, out.first_lsn)) {
        return make_error(std::errc::invalid_argument);
    }
    if (out.version != kWalVersion) {
        return make_error(std::errc::not_supported);
    }
    return {};
}

// Timestamp of a rotated file name "wal-<ms>.log", or nullopt.
std::optional<int64_t> rotated_stamp(const std::filesystem::path& p) {
    const auto name = p.filename().string();
    if (name.size() <= 8 || name.rfind("wal-", 0) != 0 || p.extension() != ".log") {
        return std::nullopt;
    }
    const auto digits = name.substr(4, name.size() - 8);
    if (digits.empty() || digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoll(digits);
}

} // anonymous namespace

// ── Serialisation ────────────────────────────────────────────────────────────

void encode_record(std::vector<uint8_t>& buf, const WalRecord& rec) {
    const std::size_t start = buf.size();

    write_u32_be(buf, 0);  // length, patched below
    write_i64_be(buf, rec.timestamp_ns);
    write_u8(buf, static_cast<uint8_t>(op_type(rec.op)));
    write_u64_be(buf, rec.lsn);
    encode_payload(buf, rec.op);

    // CRC covers timestamp through payload.
    uint32_t c = crc32(buf.data() + start + 4, buf.size() - start - 4);
    write_u32_be(buf, c);

    patch_u32_be(buf, start, static_cast<uint32_t>(buf.size() - start - 4));
}

std::vector<uint8_t> encode_record(const WalRecord& rec) {
    std::vector<uint8_t> buf;
    encode_record(buf, rec);
    return buf;
}

// ── WalWriter ────────────────────────────────────────────────────────────────

WalWriter::WalWriter(std::filesystem::path dir) : dir_(std::move(dir)) {}

WalWriter::~WalWriter() {
    close();
}

std::error_code WalWriter::open(uint64_t next_lsn) {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) return ec;

    if (std::filesystem::exists(current_path())) {
        ec = seal_current();
        if (ec) return ec;
    }
    return create_current(next_lsn);
}

void WalWriter::close() {
    if (fd_ != -1) {
        if (dirty_ && ::fdatasync(fd_) < 0) {
            spdlog::warn("WAL: final fdatasync failed: {}", make_errno_error().message());
        }
        ::close(fd_);
        fd_ = -1;
        dirty_ = false;
    }
}

std::error_code WalWriter::create_current(uint64_t next_lsn) {
    const auto path = current_path();
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND, 0644);
    if (fd_ < 0) {
        return make_errno_error();
    }

    WalHeader header;
    header.created = unix_now_ns() / 1'000'000'000;
    header.first_lsn = next_lsn;
    auto bytes = encode_header(header);

    auto ec = write_all(fd_, bytes.data(), bytes.size());
    if (!ec && ::fdatasync(fd_) < 0) {
        ec = make_errno_error();
    }
    if (ec) {
        ::close(fd_);
        fd_ = -1;
        return ec;
    }

    size_ = bytes.size();
    dirty_ = false;
    return fsync_dir(dir_);
}

std::error_code WalWriter::seal_current() {
    int64_t stamp = unix_now_ns() / 1'000'000;
    std::filesystem::path target;
    do {
        target = dir_ / fmt::format("wal-{}.log", stamp++);
    } while (std::filesystem::exists(target));

    std::error_code ec;
    std::filesystem::rename(current_path(), target, ec);
    if (ec) return ec;

    spdlog::info("WAL: sealed {}", target.filename().string());
    return {};
}

std::error_code WalWriter::append(const WalRecord& rec) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    scratch_.clear();
    encode_record(scratch_, rec);
    auto ec = write_all(fd_, scratch_.data(), scratch_.size());
    if (ec) return ec;

    size_ += scratch_.size();
    dirty_ = true;
    return {};
}

std::error_code WalWriter::flush() {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);
    if (!dirty_) return {};

    if (::fdatasync(fd_) < 0) {
        return make_errno_error();
    }
    dirty_ = false;
    return {};
}

std::error_code WalWriter::rotate(uint64_t next_lsn) {
    if (fd_ == -1) return make_error(std::errc::bad_file_descriptor);

    auto ec = flush();
    if (ec) return ec;
    ::close(fd_);
    fd_ = -1;

    ec = seal_current();
    if (ec) return ec;
    return create_current(next_lsn);
}

// ── Reading ──────────────────────────────────────────────────────────────────

std::error_code read_wal_header(const std::filesystem::path& path, WalHeader& out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return make_errno_error();
    }

    uint8_t hdr[kWalHeaderSize];
    std::size_t total = 0;
    while (total < kWalHeaderSize) {
        auto n = ::read(fd, hdr + total, kWalHeaderSize - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        total += static_cast<std::size_t>(n);
    }
    ::close(fd);

    return decode_header(hdr, total, out);
}

std::error_code read_wal_file(
    const std::filesystem::path& path,
    const std::function<void(WalRecord&&)>& fn,
    WalReadStats& stats)
{
    std::vector<uint8_t> data;
    auto ec = read_file(path, data);
    if (ec) return ec;

    WalHeader header;
    ec = decode_header(data.data(), data.size(), header);
    if (ec) return ec;

    const uint8_t* ptr = data.data() + kWalHeaderSize;
    const uint8_t* end = data.data() + data.size();

    while (ptr < end) {
        const uint8_t* record_start = ptr;

        uint32_t length = 0;
        if (!read_u32_be(ptr, end, length) ||
            static_cast<std::size_t>(end - ptr) < length) {
            spdlog::warn("WAL: {} ends inside a record at offset {}",
                         path.filename().string(), record_start - data.data());
            stats.truncated = true;
            break;
        }

        const uint8_t* body = ptr;
        const uint8_t* next = ptr + length;
        ptr = next;

        if (length < kWalRecordFixedSize - 4) {
            spdlog::warn("WAL: {} record at offset {} too short ({} bytes), skipping",
                         path.filename().string(), record_start - data.data(), length);
            ++stats.corrupted;
            continue;
        }

        uint32_t stored = load_u32_be(next - 4);
        if (crc32(body, length - 4) != stored) {
            spdlog::warn("WAL: {} CRC mismatch at offset {}, skipping",
                         path.filename().string(), record_start - data.data());
            ++stats.corrupted;
            continue;
        }

        WalRecord rec;
        const uint8_t* p = body;
        const uint8_t* payload_end = next - 4;
        uint8_t type = 0;
        bool ok = read_i64_be(p, payload_end, rec.timestamp_ns) &&
                  read_u8(p, payload_end, type) &&
                  read_u64_be(p, payload_end, rec.lsn) &&
                  decode_payload(static_cast<OpType>(type), p, payload_end, rec.op) &&
                  p == payload_end;
        if (!ok) {
            spdlog::warn("WAL: {} undecodable record (op {}) at offset {}, skipping",
                         path.filename().string(), type, record_start - data.data());
            ++stats.corrupted;
            continue;
        }

        ++stats.records;
        fn(std::move(rec));
    }

    return {};
}

std::vector<std::filesystem::path> list_wal_files(const std::filesystem::path& dir) {
    std::vector<std::pair<int64_t, std::filesystem::path>> rotated;
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (auto stamp = rotated_stamp(e.path())) {
            rotated.emplace_back(*stamp, e.path());
        }
    }
    std::sort(rotated.begin(), rotated.end());

    std::vector<std::filesystem::path> files;
    files.reserve(rotated.size() + 1);
    for (auto& [stamp, p] : rotated) {
        files.push_back(std::move(p));
    }
    if (std::filesystem::exists(dir / kWalCurrentName, ec)) {
        files.push_back(dir / kWalCurrentName);
    }
    return files;
}

std::size_t prune_wal_files(const std::filesystem::path& dir, uint64_t lsn) {
    auto files = list_wal_files(dir);

    std::size_t removed = 0;
    // File i holds LSNs in [first_i, first_{i+1}); the last one is live.
    for (std::size_t i = 0; i + 1 < files.size(); ++i) {
        if (files[i].filename() == kWalCurrentName) break;

        WalHeader next;
        if (read_wal_header(files[i + 1], next)) break;
        if (next.first_lsn > lsn) break;

        std::error_code ec;
        if (!std::filesystem::remove(files[i], ec)) break;
        spdlog::info("WAL: pruned {}", files[i].filename().string());
        ++removed;
    }
    return removed;
}

} // namespace tierkv::persistence
