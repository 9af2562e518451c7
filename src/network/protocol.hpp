#pragma once

#include "storage/mutation.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tierkv::network {

// ── Wire constants ───────────────────────────────────────────────────────────
//
//   request   [opcode: u8][payload_length: u32][payload]
//   response  [status: u8][payload_length: u32][payload]

namespace wire {

inline constexpr uint8_t kOpGet      = 0x01;
inline constexpr uint8_t kOpSet      = 0x02;
inline constexpr uint8_t kOpDel      = 0x03;
inline constexpr uint8_t kOpExists   = 0x04;
inline constexpr uint8_t kOpIncr     = 0x05;
inline constexpr uint8_t kOpDecr     = 0x06;
inline constexpr uint8_t kOpCas      = 0x07;
inline constexpr uint8_t kOpPing     = 0x08;
inline constexpr uint8_t kOpInfo     = 0x09;
inline constexpr uint8_t kOpSetNx    = 0x0A;
inline constexpr uint8_t kOpLock     = 0x0B;
inline constexpr uint8_t kOpUnlock   = 0x0C;
inline constexpr uint8_t kOpExtend   = 0x0D;
inline constexpr uint8_t kOpMGet     = 0x0E;
inline constexpr uint8_t kOpMSet     = 0x0F;
inline constexpr uint8_t kOpMDel     = 0x10;
inline constexpr uint8_t kOpExpire   = 0x11;
inline constexpr uint8_t kOpTtl      = 0x12;
inline constexpr uint8_t kOpMExists  = 0x13;

inline constexpr uint8_t kStatusOk        = 0x00;
inline constexpr uint8_t kStatusNull      = 0x01;
inline constexpr uint8_t kStatusError     = 0x02;
inline constexpr uint8_t kStatusInvalid   = 0x03;
inline constexpr uint8_t kStatusCasFailed = 0x04;

inline constexpr std::size_t kHeaderSize = 5;

inline constexpr uint32_t kDefaultMaxPayload = 64u * 1024 * 1024;

} // namespace wire

// ── Commands ─────────────────────────────────────────────────────────────────
//
// Payload layouts ([key] / [owner] are u16-length-prefixed, [ttl] is a u64
// of milliseconds where 0 means "no TTL", [keys] is a u16 count of [key]):
//
//   GET, DEL, EXISTS, TTL   raw key bytes (the whole payload)
//   SET, SETNX              [key][ttl][value]
//   INCR, DECR              [key][delta: i64]
//   CAS                     [key][ttl][expected value][new value]
//   LOCK, EXTEND            [key][owner][ttl]
//   UNLOCK                  [key][owner]
//   EXPIRE                  [key][ttl]
//   MGET, MDEL, MEXISTS     [keys]
//   MSET                    [count: u16][ttl]([key][value])*
//   PING, INFO              empty

struct GetCmd { std::string key; };
struct SetCmd { std::string key; Value value; Ttl ttl; };
struct DelCmd { std::string key; };
struct ExistsCmd { std::string key; };
struct IncrCmd { std::string key; int64_t delta = 1; };
struct DecrCmd { std::string key; int64_t delta = 1; };

struct CasCmd {
    std::string key;
    Value expected;
    Value desired;
    Ttl ttl;
};

struct PingCmd {};
struct InfoCmd {};
struct SetNxCmd { std::string key; Value value; Ttl ttl; };

struct LockCmd {
    std::string key;
    std::string owner;
    std::chrono::milliseconds ttl{0};
};

struct UnlockCmd {
    std::string key;
    std::string owner;
};

struct ExtendLockCmd {
    std::string key;
    std::string owner;
    std::chrono::milliseconds ttl{0};
};

struct MGetCmd { std::vector<std::string> keys; };

struct MSetCmd {
    std::vector<std::pair<std::string, Value>> pairs;
    Ttl ttl;
};

struct MDelCmd { std::vector<std::string> keys; };
struct ExpireCmd { std::string key; std::chrono::milliseconds ttl{0}; };
struct TtlCmd { std::string key; };
struct MExistsCmd { std::vector<std::string> keys; };

using Command = std::variant<GetCmd, SetCmd, DelCmd, ExistsCmd, IncrCmd, DecrCmd, CasCmd,
                             PingCmd, InfoCmd, SetNxCmd, LockCmd, UnlockCmd, ExtendLockCmd,
                             MGetCmd, MSetCmd, MDelCmd, ExpireCmd, TtlCmd, MExistsCmd>;

[[nodiscard]] uint8_t opcode(const Command& cmd) noexcept;

// ── Responses ────────────────────────────────────────────────────────────────
//
// Response payloads by status:
//
//   OK          GET            [value]
//               SET, MSET      empty
//               DEL, EXISTS, SETNX, LOCK, UNLOCK, EXTEND, EXPIRE
//                              [bool: u8]
//               INCR, DECR     [result: i64]
//               TTL            [remaining ms: i64] (-1 = no TTL)
//               CAS            empty
//               PING, INFO     UTF-8 text
//               MGET           [count: u16]([present: u8][value]?)*
//               MDEL           [removed: u32]
//               MEXISTS        [count: u16][bool: u8]*
//   NULL        GET / TTL on an absent key; empty
//   CAS_FAILED  empty
//   ERROR, INVALID  UTF-8 message

struct OkResp {};
struct NullResp {};
struct CasFailedResp {};

struct ValueResp { Value value; };
struct BoolResp { bool value = false; };
struct IntResp { int64_t value = 0; };
struct TextResp { std::string text; };
struct ValuesResp { std::vector<std::optional<Value>> values; };
struct CountResp { uint32_t count = 0; };
struct BoolsResp { std::vector<bool> values; };

// Request failed in the engine (type mismatch, key too long, ...).
struct ErrorResp { std::string message; };

// Request could not be parsed (unknown opcode, malformed or oversized payload).
struct InvalidResp { std::string message; };

using Response = std::variant<OkResp, NullResp, CasFailedResp, ValueResp, BoolResp, IntResp,
                              TextResp, ValuesResp, CountResp, BoolsResp, ErrorResp,
                              InvalidResp>;

// ── Header helpers ───────────────────────────────────────────────────────────

// Split a 5-byte header.  Returns false if `data` is shorter than that.
[[nodiscard]] bool read_header(std::span<const uint8_t> data,
                               uint8_t& code_out,
                               uint32_t& payload_length_out) noexcept;

// ── Server side ──────────────────────────────────────────────────────────────

// Parse a request payload (everything after the header).
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, InvalidResp> parse_request(
    uint8_t opcode, std::span<const uint8_t> payload);

// Serialize a Response, header included.
[[nodiscard]] std::vector<uint8_t> serialize_response(const Response& response);

// ── Client side ──────────────────────────────────────────────────────────────

inline constexpr std::size_t kMaxBatchKeys = 0xFFFF;

// Empty when `cmd` can be framed as written.  Otherwise names the field the
// wire format cannot carry: a batch over kMaxBatchKeys, a key or owner over
// 0xFFFF bytes, a TTL above kMaxTtl, or a value the codec cannot encode.
[[nodiscard]] std::optional<std::string> request_error(const Command& cmd);

// Serialize a Command, header included.  Fields that fail request_error()
// are truncated.
[[nodiscard]] std::vector<uint8_t> serialize_request(const Command& cmd);

// Decode the response to a request with `opcode`.  The payload shape
// depends on the request, so the opcode is needed.  Returns InvalidResp
// if the payload does not match what the opcode/status pair calls for.
[[nodiscard]] Response parse_response(uint8_t opcode,
                                      uint8_t status,
                                      std::span<const uint8_t> payload);

} // namespace tierkv::network
