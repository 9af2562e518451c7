#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace tierkv::persistence {

// ── POSIX file helpers shared by the WAL and snapshot code ──────────────────

[[nodiscard]] std::error_code make_errno_error();

// Write all bytes to fd, retrying on EINTR and short writes.
[[nodiscard]] std::error_code write_all(int fd, const uint8_t* data, std::size_t len);

// Read the whole file at `path` into `out`.
[[nodiscard]] std::error_code read_file(const std::filesystem::path& path,
                                        std::vector<uint8_t>& out);

// fsync a directory so a preceding rename inside it is durable.
[[nodiscard]] std::error_code fsync_dir(const std::filesystem::path& dir);

} // namespace tierkv::persistence
