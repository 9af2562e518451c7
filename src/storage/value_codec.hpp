#pragma once

#include "common/clock.hpp"
#include "storage/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tierkv {

// ── Value type tags ──────────────────────────────────────────────────────────

enum class ValueTag : uint8_t {
    Null    = 0x00,
    Int     = 0x01,
    Float   = 0x02,
    Decimal = 0x03,
    String  = 0x04,
    Bytes   = 0x05,
    List    = 0x06,
    Map     = 0x07,
    Bool    = 0x08,
};

// Nesting deeper than this is rejected on decode so a hostile payload cannot
// exhaust the stack.
static constexpr std::size_t kMaxValueDepth = 64;

// ── Value encoding ───────────────────────────────────────────────────────────
//
// Tag byte followed by type-specific bytes, all integers big-endian:
//   Null    []
//   Int     [i64]
//   Float   [f64 bits as u64]
//   Decimal [len: u16][ascii]
//   String  [len: u32][utf-8]
//   Bytes   [len: u32][raw]
//   List    [count: u32][value]*
//   Map     [count: u32]([key_len: u16][key][value])*
//   Bool    [u8]
//
// The same encoding is used on the wire, in the WAL, in snapshots and in
// cold-tier data files.

void encode_value(std::vector<uint8_t>& buf, const Value& value);

[[nodiscard]] std::vector<uint8_t> encode_value(const Value& value);

// Empty when `value` round-trips through the codec.  Otherwise describes the
// first part that cannot: nesting beyond kMaxValueDepth, a Decimal or map key
// longer than 0xFFFF bytes, or a string, blob or collection over 2^32 - 1.
[[nodiscard]] std::optional<std::string> encoding_error(const Value& value);

// Decode one value starting at `ptr`; advances `ptr` past it on success.
// Returns false on truncated, malformed or too-deeply nested input.
[[nodiscard]] bool decode_value(const uint8_t*& ptr, const uint8_t* end, Value& out);

// Decode a buffer that must contain exactly one value.
[[nodiscard]] std::optional<Value> decode_value(const std::vector<uint8_t>& buf);

// ── Entry ────────────────────────────────────────────────────────────────────

struct Entry {
    Value value;
    std::optional<Clock::time_point> expires_at;
    uint64_t version = 1;

    [[nodiscard]] bool is_expired(Clock::time_point now) const noexcept {
        return expires_at.has_value() && *expires_at <= now;
    }
};

// ── Entry encoding ───────────────────────────────────────────────────────────
//
//   [flags: u8 (bit0 = has TTL)][expires_at: i64, if bit0][version: u64][value]
//
// The deadline is written as a raw tick count in whatever epoch the caller
// chooses.  Cold data files use the engine clock's own epoch (they never
// outlive the process); snapshots convert to unix nanoseconds first.

static constexpr uint8_t kEntryFlagTtl = 0x01;

void encode_entry(std::vector<uint8_t>& buf,
                  const Value& value,
                  std::optional<int64_t> expires_at,
                  uint64_t version);

struct DecodedEntry {
    Value value;
    std::optional<int64_t> expires_at;
    uint64_t version = 0;
};

[[nodiscard]] bool decode_entry(const uint8_t*& ptr, const uint8_t* end, DecodedEntry& out);

// Helpers converting a steady-clock deadline to and from the tick count
// stored in cold data files.
[[nodiscard]] inline int64_t to_ticks(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline Clock::time_point from_ticks(int64_t ticks) {
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds{ticks})};
}

} // namespace tierkv
