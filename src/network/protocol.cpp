#include "network/protocol.hpp"

#include "common/byte_io.hpp"
#include "storage/value_codec.hpp"

#include <algorithm>
#include <type_traits>

#include <fmt/format.h>

namespace tierkv::network {

namespace {

// ── Payload readers ──────────────────────────────────────────────────────────

using Ptr = const uint8_t*;

bool read_key(Ptr& ptr, Ptr end, std::string& out) {
    return read_short_string(ptr, end, out);
}

// u64 milliseconds, 0 meaning "no TTL".  Anything above kMaxTtl is malformed.
bool read_ttl(Ptr& ptr, Ptr end, Ttl& out) {
    uint64_t ms = 0;
    if (!read_u64_be(ptr, end, ms)) return false;
    if (ms > static_cast<uint64_t>(kMaxTtl.count())) return false;
    out = ms == 0 ? Ttl{} : Ttl{std::chrono::milliseconds(static_cast<int64_t>(ms))};
    return true;
}

// Like read_ttl, but the TTL is mandatory.
bool read_required_ttl(Ptr& ptr, Ptr end, std::chrono::milliseconds& out) {
    Ttl ttl;
    if (!read_ttl(ptr, end, ttl) || !ttl) return false;
    out = *ttl;
    return true;
}

bool read_keys(Ptr& ptr, Ptr end, std::vector<std::string>& out) {
    uint16_t count = 0;
    if (!read_u16_be(ptr, end, count)) return false;
    out.clear();
    out.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        std::string key;
        if (!read_key(ptr, end, key)) return false;
        out.push_back(std::move(key));
    }
    return true;
}

void write_ttl(std::vector<uint8_t>& buf, const Ttl& ttl) {
    write_u64_be(buf, ttl ? static_cast<uint64_t>(std::max<int64_t>(ttl->count(), 1)) : 0);
}

void write_keys(std::vector<uint8_t>& buf, const std::vector<std::string>& keys) {
    write_u16_be(buf, static_cast<uint16_t>(keys.size()));
    for (const auto& k : keys) {
        write_short_string(buf, k);
    }
}

void write_text(std::vector<uint8_t>& buf, const std::string& s) {
    write_bytes(buf, s.data(), s.size());
}

std::string payload_text(std::span<const uint8_t> payload) {
    return std::string(reinterpret_cast<const char*>(payload.data()), payload.size());
}

const char* op_name(uint8_t op) {
    switch (op) {
        case wire::kOpGet:     return "GET";
        case wire::kOpSet:     return "SET";
        case wire::kOpDel:     return "DEL";
        case wire::kOpExists:  return "EXISTS";
        case wire::kOpIncr:    return "INCR";
        case wire::kOpDecr:    return "DECR";
        case wire::kOpCas:     return "CAS";
        case wire::kOpPing:    return "PING";
        case wire::kOpInfo:    return "INFO";
        case wire::kOpSetNx:   return "SETNX";
        case wire::kOpLock:    return "LOCK";
        case wire::kOpUnlock:  return "UNLOCK";
        case wire::kOpExtend:  return "EXTEND";
        case wire::kOpMGet:    return "MGET";
        case wire::kOpMSet:    return "MSET";
        case wire::kOpMDel:    return "MDEL";
        case wire::kOpExpire:  return "EXPIRE";
        case wire::kOpTtl:     return "TTL";
        case wire::kOpMExists: return "MEXISTS";
        default:               return "?";
    }
}

InvalidResp malformed(uint8_t op) {
    return InvalidResp{fmt::format("malformed {} payload", op_name(op))};
}

// ── Response building ────────────────────────────────────────────────────────

struct ResponseParts {
    uint8_t status;
    std::vector<uint8_t> payload;
};

ResponseParts build_response_parts(const Response& response) {
    return std::visit(
        [](const auto& r) -> ResponseParts {
            using T = std::decay_t<decltype(r)>;
            std::vector<uint8_t> payload;

            if constexpr (std::is_same_v<T, OkResp>) {
                return {wire::kStatusOk, {}};

            } else if constexpr (std::is_same_v<T, NullResp>) {
                return {wire::kStatusNull, {}};

            } else if constexpr (std::is_same_v<T, CasFailedResp>) {
                return {wire::kStatusCasFailed, {}};

            } else if constexpr (std::is_same_v<T, ValueResp>) {
                encode_value(payload, r.value);
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, BoolResp>) {
                write_u8(payload, r.value ? 1 : 0);
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, IntResp>) {
                write_i64_be(payload, r.value);
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, TextResp>) {
                write_text(payload, r.text);
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, ValuesResp>) {
                write_u16_be(payload, static_cast<uint16_t>(r.values.size()));
                for (const auto& v : r.values) {
                    write_u8(payload, v ? 1 : 0);
                    if (v) encode_value(payload, *v);
                }
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, CountResp>) {
                write_u32_be(payload, r.count);
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, BoolsResp>) {
                write_u16_be(payload, static_cast<uint16_t>(r.values.size()));
                for (bool b : r.values) {
                    write_u8(payload, b ? 1 : 0);
                }
                return {wire::kStatusOk, std::move(payload)};

            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                write_text(payload, r.message);
                return {wire::kStatusError, std::move(payload)};

            } else if constexpr (std::is_same_v<T, InvalidResp>) {
                write_text(payload, r.message);
                return {wire::kStatusInvalid, std::move(payload)};
            }
        },
        response);
}

std::vector<uint8_t> frame(uint8_t code, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> buf;
    buf.reserve(wire::kHeaderSize + payload.size());
    write_u8(buf, code);
    write_u32_be(buf, static_cast<uint32_t>(payload.size()));
    buf.insert(buf.end(), payload.begin(), payload.end());
    return buf;
}

} // anonymous namespace

uint8_t opcode(const Command& cmd) noexcept {
    return std::visit(
        [](const auto& c) -> uint8_t {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, GetCmd>) return wire::kOpGet;
            else if constexpr (std::is_same_v<T, SetCmd>) return wire::kOpSet;
            else if constexpr (std::is_same_v<T, DelCmd>) return wire::kOpDel;
            else if constexpr (std::is_same_v<T, ExistsCmd>) return wire::kOpExists;
            else if constexpr (std::is_same_v<T, IncrCmd>) return wire::kOpIncr;
            else if constexpr (std::is_same_v<T, DecrCmd>) return wire::kOpDecr;
            else if constexpr (std::is_same_v<T, CasCmd>) return wire::kOpCas;
            else if constexpr (std::is_same_v<T, PingCmd>) return wire::kOpPing;
            else if constexpr (std::is_same_v<T, InfoCmd>) return wire::kOpInfo;
            else if constexpr (std::is_same_v<T, SetNxCmd>) return wire::kOpSetNx;
            else if constexpr (std::is_same_v<T, LockCmd>) return wire::kOpLock;
            else if constexpr (std::is_same_v<T, UnlockCmd>) return wire::kOpUnlock;
            else if constexpr (std::is_same_v<T, ExtendLockCmd>) return wire::kOpExtend;
            else if constexpr (std::is_same_v<T, MGetCmd>) return wire::kOpMGet;
            else if constexpr (std::is_same_v<T, MSetCmd>) return wire::kOpMSet;
            else if constexpr (std::is_same_v<T, MDelCmd>) return wire::kOpMDel;
            else if constexpr (std::is_same_v<T, ExpireCmd>) return wire::kOpExpire;
            else if constexpr (std::is_same_v<T, TtlCmd>) return wire::kOpTtl;
            else if constexpr (std::is_same_v<T, MExistsCmd>) return wire::kOpMExists;
        },
        cmd);
}

// ── read_header ──────────────────────────────────────────────────────────────

bool read_header(std::span<const uint8_t> data,
                 uint8_t& code_out,
                 uint32_t& payload_length_out) noexcept {
    if (data.size() < wire::kHeaderSize) return false;
    code_out = data[0];
    payload_length_out = load_u32_be(data.data() + 1);
    return true;
}

// ── parse_request ────────────────────────────────────────────────────────────

std::variant<Command, InvalidResp> parse_request(uint8_t op, std::span<const uint8_t> payload) {
    Ptr ptr = payload.data();
    Ptr end = payload.data() + payload.size();

    // Every layout must consume the payload exactly.
    auto done = [&](Command cmd) -> std::variant<Command, InvalidResp> {
        if (ptr != end) return malformed(op);
        return cmd;
    };

    switch (op) {
        case wire::kOpGet:
            return GetCmd{payload_text(payload)};
        case wire::kOpDel:
            return DelCmd{payload_text(payload)};
        case wire::kOpExists:
            return ExistsCmd{payload_text(payload)};
        case wire::kOpTtl:
            return TtlCmd{payload_text(payload)};

        case wire::kOpPing:
        case wire::kOpInfo:
            if (!payload.empty()) return malformed(op);
            if (op == wire::kOpPing) return PingCmd{};
            return InfoCmd{};

        case wire::kOpSet:
        case wire::kOpSetNx: {
            std::string key;
            Ttl ttl;
            Value value;
            if (!read_key(ptr, end, key) || !read_ttl(ptr, end, ttl) ||
                !decode_value(ptr, end, value)) {
                return malformed(op);
            }
            if (op == wire::kOpSet) return done(SetCmd{std::move(key), std::move(value), ttl});
            return done(SetNxCmd{std::move(key), std::move(value), ttl});
        }

        case wire::kOpIncr:
        case wire::kOpDecr: {
            std::string key;
            int64_t delta = 0;
            if (!read_key(ptr, end, key) || !read_i64_be(ptr, end, delta)) {
                return malformed(op);
            }
            if (op == wire::kOpIncr) return done(IncrCmd{std::move(key), delta});
            return done(DecrCmd{std::move(key), delta});
        }

        case wire::kOpCas: {
            CasCmd cmd;
            if (!read_key(ptr, end, cmd.key) || !read_ttl(ptr, end, cmd.ttl) ||
                !decode_value(ptr, end, cmd.expected) || !decode_value(ptr, end, cmd.desired)) {
                return malformed(op);
            }
            return done(std::move(cmd));
        }

        case wire::kOpLock:
        case wire::kOpExtend: {
            std::string key;
            std::string owner;
            std::chrono::milliseconds ttl{0};
            if (!read_key(ptr, end, key) || !read_key(ptr, end, owner) ||
                !read_required_ttl(ptr, end, ttl)) {
                return malformed(op);
            }
            if (op == wire::kOpLock) return done(LockCmd{std::move(key), std::move(owner), ttl});
            return done(ExtendLockCmd{std::move(key), std::move(owner), ttl});
        }

        case wire::kOpUnlock: {
            UnlockCmd cmd;
            if (!read_key(ptr, end, cmd.key) || !read_key(ptr, end, cmd.owner)) {
                return malformed(op);
            }
            return done(std::move(cmd));
        }

        case wire::kOpExpire: {
            ExpireCmd cmd;
            uint64_t ms = 0;
            if (!read_key(ptr, end, cmd.key) || !read_u64_be(ptr, end, ms) ||
                ms > static_cast<uint64_t>(kMaxTtl.count())) {
                return malformed(op);
            }
            cmd.ttl = std::chrono::milliseconds(static_cast<int64_t>(ms));
            return done(std::move(cmd));
        }

        case wire::kOpMGet:
        case wire::kOpMDel:
        case wire::kOpMExists: {
            std::vector<std::string> keys;
            if (!read_keys(ptr, end, keys)) return malformed(op);
            if (op == wire::kOpMGet) return done(MGetCmd{std::move(keys)});
            if (op == wire::kOpMDel) return done(MDelCmd{std::move(keys)});
            return done(MExistsCmd{std::move(keys)});
        }

        case wire::kOpMSet: {
            MSetCmd cmd;
            uint16_t count = 0;
            if (!read_u16_be(ptr, end, count) || !read_ttl(ptr, end, cmd.ttl)) {
                return malformed(op);
            }
            cmd.pairs.reserve(count);
            for (uint16_t i = 0; i < count; ++i) {
                std::string key;
                Value value;
                if (!read_key(ptr, end, key) || !decode_value(ptr, end, value)) {
                    return malformed(op);
                }
                cmd.pairs.emplace_back(std::move(key), std::move(value));
            }
            return done(std::move(cmd));
        }

        default:
            return InvalidResp{fmt::format("unknown opcode 0x{:02x}", op)};
    }
}

// ── serialize_response ───────────────────────────────────────────────────────

std::vector<uint8_t> serialize_response(const Response& response) {
    auto [status, payload] = build_response_parts(response);
    return frame(status, payload);
}

// ── request_error ────────────────────────────────────────────────────────────

std::optional<std::string> request_error(const Command& cmd) {
    auto key_error = [](const std::string& key, const char* what) -> std::optional<std::string> {
        if (key.size() <= 0xFFFF) return std::nullopt;
        return fmt::format("{} length {} exceeds maximum {}", what, key.size(), 0xFFFF);
    };
    auto ttl_error = [](std::chrono::milliseconds ttl) -> std::optional<std::string> {
        if (ttl <= kMaxTtl) return std::nullopt;
        return fmt::format("ttl {}ms exceeds maximum {}ms", ttl.count(), kMaxTtl.count());
    };
    auto batch_error = [](std::size_t n) -> std::optional<std::string> {
        if (n <= kMaxBatchKeys) return std::nullopt;
        return fmt::format("batch of {} keys exceeds maximum {}", n, kMaxBatchKeys);
    };

    return std::visit(
        [&](const auto& c) -> std::optional<std::string> {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, SetCmd> || std::is_same_v<T, SetNxCmd>) {
                if (auto e = key_error(c.key, "key")) return e;
                if (c.ttl) {
                    if (auto e = ttl_error(*c.ttl)) return e;
                }
                return encoding_error(c.value);

            } else if constexpr (std::is_same_v<T, IncrCmd> || std::is_same_v<T, DecrCmd>) {
                return key_error(c.key, "key");

            } else if constexpr (std::is_same_v<T, CasCmd>) {
                if (auto e = key_error(c.key, "key")) return e;
                if (c.ttl) {
                    if (auto e = ttl_error(*c.ttl)) return e;
                }
                if (auto e = encoding_error(c.expected)) return e;
                return encoding_error(c.desired);

            } else if constexpr (std::is_same_v<T, LockCmd> || std::is_same_v<T, ExtendLockCmd>) {
                if (auto e = key_error(c.key, "key")) return e;
                if (auto e = key_error(c.owner, "owner")) return e;
                return ttl_error(c.ttl);

            } else if constexpr (std::is_same_v<T, UnlockCmd>) {
                if (auto e = key_error(c.key, "key")) return e;
                return key_error(c.owner, "owner");

            } else if constexpr (std::is_same_v<T, ExpireCmd>) {
                if (auto e = key_error(c.key, "key")) return e;
                return ttl_error(c.ttl);

            } else if constexpr (std::is_same_v<T, MGetCmd> || std::is_same_v<T, MDelCmd> ||
                                 std::is_same_v<T, MExistsCmd>) {
                if (auto e = batch_error(c.keys.size())) return e;
                for (const auto& k : c.keys) {
                    if (auto e = key_error(k, "key")) return e;
                }
                return std::nullopt;

            } else if constexpr (std::is_same_v<T, MSetCmd>) {
                if (auto e = batch_error(c.pairs.size())) return e;
                if (c.ttl) {
                    if (auto e = ttl_error(*c.ttl)) return e;
                }
                for (const auto& [key, value] : c.pairs) {
                    if (auto e = key_error(key, "key")) return e;
                    if (auto e = encoding_error(value)) return e;
                }
                return std::nullopt;

            } else {
                // GET, DEL, EXISTS, TTL send the key as the whole payload.
                return std::nullopt;
            }
        },
        cmd);
}

// ── serialize_request ────────────────────────────────────────────────────────

std::vector<uint8_t> serialize_request(const Command& cmd) {
    std::vector<uint8_t> payload;

    std::visit(
        [&payload](const auto& c) {
            using T = std::decay_t<decltype(c)>;

            if constexpr (std::is_same_v<T, GetCmd> || std::is_same_v<T, DelCmd> ||
                          std::is_same_v<T, ExistsCmd> || std::is_same_v<T, TtlCmd>) {
                write_text(payload, c.key);

            } else if constexpr (std::is_same_v<T, SetCmd> || std::is_same_v<T, SetNxCmd>) {
                write_short_string(payload, c.key);
                write_ttl(payload, c.ttl);
                encode_value(payload, c.value);

            } else if constexpr (std::is_same_v<T, IncrCmd> || std::is_same_v<T, DecrCmd>) {
                write_short_string(payload, c.key);
                write_i64_be(payload, c.delta);

            } else if constexpr (std::is_same_v<T, CasCmd>) {
                write_short_string(payload, c.key);
                write_ttl(payload, c.ttl);
                encode_value(payload, c.expected);
                encode_value(payload, c.desired);

            } else if constexpr (std::is_same_v<T, LockCmd> || std::is_same_v<T, ExtendLockCmd>) {
                write_short_string(payload, c.key);
                write_short_string(payload, c.owner);
                write_ttl(payload, Ttl{c.ttl});

            } else if constexpr (std::is_same_v<T, UnlockCmd>) {
                write_short_string(payload, c.key);
                write_short_string(payload, c.owner);

            } else if constexpr (std::is_same_v<T, ExpireCmd>) {
                write_short_string(payload, c.key);
                write_u64_be(payload, static_cast<uint64_t>(std::max<int64_t>(c.ttl.count(), 0)));

            } else if constexpr (std::is_same_v<T, MGetCmd> || std::is_same_v<T, MDelCmd> ||
                                 std::is_same_v<T, MExistsCmd>) {
                write_keys(payload, c.keys);

            } else if constexpr (std::is_same_v<T, MSetCmd>) {
                write_u16_be(payload, static_cast<uint16_t>(c.pairs.size()));
                write_ttl(payload, c.ttl);
                for (const auto& [key, value] : c.pairs) {
                    write_short_string(payload, key);
                    encode_value(payload, value);
                }

            } else if constexpr (std::is_same_v<T, PingCmd> || std::is_same_v<T, InfoCmd>) {
                // empty
            }
        },
        cmd);

    return frame(opcode(cmd), payload);
}

// ── parse_response ───────────────────────────────────────────────────────────

Response parse_response(uint8_t op, uint8_t status, std::span<const uint8_t> payload) {
    Ptr ptr = payload.data();
    Ptr end = payload.data() + payload.size();
    auto bad = [op] { return InvalidResp{fmt::format("malformed {} response", op_name(op))}; };

    switch (status) {
        case wire::kStatusError:
            return ErrorResp{payload_text(payload)};
        case wire::kStatusInvalid:
            return InvalidResp{payload_text(payload)};
        case wire::kStatusCasFailed:
            if (op != wire::kOpCas) return bad();
            return CasFailedResp{};
        case wire::kStatusNull:
            if (op != wire::kOpGet && op != wire::kOpTtl) return bad();
            return NullResp{};
        case wire::kStatusOk:
            break;
        default:
            return InvalidResp{fmt::format("unknown status 0x{:02x}", status)};
    }

    switch (op) {
        case wire::kOpSet:
        case wire::kOpMSet:
        case wire::kOpCas:
            if (!payload.empty()) return bad();
            return OkResp{};

        case wire::kOpGet: {
            Value value;
            if (!decode_value(ptr, end, value) || ptr != end) return bad();
            return ValueResp{std::move(value)};
        }

        case wire::kOpDel:
        case wire::kOpExists:
        case wire::kOpSetNx:
        case wire::kOpLock:
        case wire::kOpUnlock:
        case wire::kOpExtend:
        case wire::kOpExpire: {
            uint8_t b = 0;
            if (!read_u8(ptr, end, b) || ptr != end) return bad();
            return BoolResp{b != 0};
        }

        case wire::kOpIncr:
        case wire::kOpDecr:
        case wire::kOpTtl: {
            int64_t v = 0;
            if (!read_i64_be(ptr, end, v) || ptr != end) return bad();
            return IntResp{v};
        }

        case wire::kOpPing:
        case wire::kOpInfo:
            return TextResp{payload_text(payload)};

        case wire::kOpMGet: {
            uint16_t count = 0;
            if (!read_u16_be(ptr, end, count)) return bad();
            ValuesResp resp;
            resp.values.reserve(count);
            for (uint16_t i = 0; i < count; ++i) {
                uint8_t present = 0;
                if (!read_u8(ptr, end, present)) return bad();
                if (present == 0) {
                    resp.values.emplace_back(std::nullopt);
                    continue;
                }
                Value value;
                if (!decode_value(ptr, end, value)) return bad();
                resp.values.emplace_back(std::move(value));
            }
            if (ptr != end) return bad();
            return resp;
        }

        case wire::kOpMDel: {
            uint32_t count = 0;
            if (!read_u32_be(ptr, end, count) || ptr != end) return bad();
            return CountResp{count};
        }

        case wire::kOpMExists: {
            uint16_t count = 0;
            if (!read_u16_be(ptr, end, count)) return bad();
            BoolsResp resp;
            resp.values.reserve(count);
            for (uint16_t i = 0; i < count; ++i) {
                uint8_t b = 0;
                if (!read_u8(ptr, end, b)) return bad();
                resp.values.push_back(b != 0);
            }
            if (ptr != end) return bad();
            return resp;
        }

        default:
            return InvalidResp{fmt::format("unknown opcode 0x{:02x}", op)};
    }
}

} // namespace tierkv::network
