#include "storage/data_file.hpp"

#include "common/byte_io.hpp"
#include "common/checksum.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

namespace tierkv {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code pwrite_all(int fd, const uint8_t* ptr, std::size_t len, uint64_t offset) {
    while (len > 0) {
        auto n = ::pwrite(fd, ptr, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        len -= static_cast<std::size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
    return {};
}

std::error_code pread_all(int fd, uint8_t* ptr, std::size_t len, uint64_t offset) {
    while (len > 0) {
        auto n = ::pread(fd, ptr, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) {
            return std::make_error_code(std::errc::io_error);  // short file
        }
        ptr += n;
        len -= static_cast<std::size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
    return {};
}

} // anonymous namespace

DataFile::DataFile(std::filesystem::path path, uint32_t id, int fd)
    : path_(std::move(path)), id_(id), fd_(fd) {}

DataFile::~DataFile() {
    if (fd_ != -1) {
        ::close(fd_);
    }
    if (retired_.load(std::memory_order_relaxed)) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

std::shared_ptr<DataFile> DataFile::create(const std::filesystem::path& path,
                                           uint32_t id,
                                           std::error_code& ec) {
    ec.clear();
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        ec = make_errno_error();
        return nullptr;
    }
    return std::shared_ptr<DataFile>(new DataFile(path, id, fd));
}

std::error_code DataFile::append(const std::vector<uint8_t>& entry_bytes,
                                 uint64_t& offset,
                                 uint32_t& length) {
    std::vector<uint8_t> record;
    record.reserve(4 + entry_bytes.size());
    write_u32_be(record, crc32(entry_bytes.data(), entry_bytes.size()));
    write_bytes(record, entry_bytes.data(), entry_bytes.size());

    auto ec = append_raw(record, offset);
    if (!ec) {
        length = static_cast<uint32_t>(record.size());
    }
    return ec;
}

std::error_code DataFile::append_raw(const std::vector<uint8_t>& record, uint64_t& offset) {
    uint64_t at = size_.load(std::memory_order_relaxed);
    auto ec = pwrite_all(fd_, record.data(), record.size(), at);
    if (ec) return ec;
    offset = at;
    size_.store(at + record.size(), std::memory_order_relaxed);
    return {};
}

std::error_code DataFile::read_raw(uint64_t offset,
                                   uint32_t length,
                                   std::vector<uint8_t>& record) const {
    if (offset + length > size()) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    record.resize(length);
    return pread_all(fd_, record.data(), length, offset);
}

std::error_code DataFile::read(uint64_t offset,
                               uint32_t length,
                               std::vector<uint8_t>& entry_bytes) const {
    if (length < 4) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::vector<uint8_t> record;
    auto ec = read_raw(offset, length, record);
    if (ec) return ec;

    uint32_t stored = load_u32_be(record.data());
    if (crc32(record.data() + 4, record.size() - 4) != stored) {
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }
    entry_bytes.assign(record.begin() + 4, record.end());
    return {};
}

double DataFile::waste_ratio() const noexcept {
    uint64_t total = size();
    if (total == 0) return 0.0;
    return static_cast<double>(dead_bytes()) / static_cast<double>(total);
}

} // namespace tierkv
