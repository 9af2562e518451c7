#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace tierkv {

// ── Big-endian encode / decode helpers ───────────────────────────────────────
//
// Shared by the value codec, the wire protocol, the WAL and the snapshot
// format.  Writers append to a byte vector; readers advance `ptr` and return
// false (leaving `ptr` untouched) if fewer than the required bytes remain.

inline void write_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

inline void write_u16_be(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u32_be(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u64_be(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

inline void write_i64_be(std::vector<uint8_t>& buf, int64_t v) {
    write_u64_be(buf, static_cast<uint64_t>(v));
}

inline void write_bytes(std::vector<uint8_t>& buf, const void* data, std::size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + len);
}

// u16 length prefix + bytes.  Caller guarantees s.size() <= 0xFFFF.
inline void write_short_string(std::vector<uint8_t>& buf, const std::string& s) {
    write_u16_be(buf, static_cast<uint16_t>(s.size()));
    write_bytes(buf, s.data(), s.size());
}

// Overwrite 4 bytes at `pos` (used to back-patch length / checksum fields).
inline void patch_u32_be(std::vector<uint8_t>& buf, std::size_t pos, uint32_t v) {
    buf[pos]     = static_cast<uint8_t>((v >> 24) & 0xFF);
    buf[pos + 1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    buf[pos + 2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    buf[pos + 3] = static_cast<uint8_t>(v & 0xFF);
}

inline bool read_u8(const uint8_t*& ptr, const uint8_t* end, uint8_t& out) {
    if (end - ptr < 1) return false;
    out = *ptr++;
    return true;
}

inline bool read_u16_be(const uint8_t*& ptr, const uint8_t* end, uint16_t& out) {
    if (end - ptr < 2) return false;
    out = static_cast<uint16_t>(
        (static_cast<uint16_t>(ptr[0]) << 8) |
         static_cast<uint16_t>(ptr[1]));
    ptr += 2;
    return true;
}

inline bool read_u32_be(const uint8_t*& ptr, const uint8_t* end, uint32_t& out) {
    if (end - ptr < 4) return false;
    out = (static_cast<uint32_t>(ptr[0]) << 24) |
          (static_cast<uint32_t>(ptr[1]) << 16) |
          (static_cast<uint32_t>(ptr[2]) << 8) |
           static_cast<uint32_t>(ptr[3]);
    ptr += 4;
    return true;
}

inline bool read_u64_be(const uint8_t*& ptr, const uint8_t* end, uint64_t& out) {
    if (end - ptr < 8) return false;
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out = (out << 8) | static_cast<uint64_t>(ptr[i]);
    }
    ptr += 8;
    return true;
}

inline bool read_i64_be(const uint8_t*& ptr, const uint8_t* end, int64_t& out) {
    uint64_t v = 0;
    if (!read_u64_be(ptr, end, v)) return false;
    out = static_cast<int64_t>(v);
    return true;
}

inline bool read_string(const uint8_t*& ptr, const uint8_t* end,
                        std::size_t len, std::string& out) {
    if (static_cast<std::size_t>(end - ptr) < len) return false;
    out.assign(reinterpret_cast<const char*>(ptr), len);
    ptr += len;
    return true;
}

inline bool read_short_string(const uint8_t*& ptr, const uint8_t* end, std::string& out) {
    const uint8_t* start = ptr;
    uint16_t len = 0;
    if (!read_u16_be(ptr, end, len)) return false;
    if (!read_string(ptr, end, len, out)) {
        ptr = start;
        return false;
    }
    return true;
}

// Decode a big-endian u32 from 4 raw bytes.
inline uint32_t load_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
            static_cast<uint32_t>(p[3]);
}

} // namespace tierkv
