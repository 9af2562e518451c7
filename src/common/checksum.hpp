#pragma once

#include <cstddef>
#include <cstdint>

namespace tierkv {

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// Continue a running CRC32 over another chunk.  Start with crc = 0.
[[nodiscard]] uint32_t crc32_update(uint32_t crc, const uint8_t* data, std::size_t length);

} // namespace tierkv
