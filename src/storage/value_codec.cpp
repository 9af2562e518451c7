#include "storage/value_codec.hpp"

#include "common/byte_io.hpp"

#include <cstring>
#include <type_traits>

#include <fmt/format.h>

namespace tierkv {

namespace {

constexpr std::size_t kMaxShortString = 0xFFFF;
constexpr std::size_t kMaxLongLength = 0xFFFFFFFF;

uint64_t double_bits(double d) {
    uint64_t bits = 0;
    std::memcpy(&bits, &d, sizeof(bits));
    return bits;
}

double bits_double(uint64_t bits) {
    double d = 0;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

bool decode_at_depth(const uint8_t*& ptr, const uint8_t* end, Value& out, std::size_t depth) {
    if (depth > kMaxValueDepth) return false;

    uint8_t tag = 0;
    if (!read_u8(ptr, end, tag)) return false;

    switch (static_cast<ValueTag>(tag)) {
    case ValueTag::Null:
        out = Value{};
        return true;

    case ValueTag::Bool: {
        uint8_t b = 0;
        if (!read_u8(ptr, end, b)) return false;
        out = Value{b != 0};
        return true;
    }

    case ValueTag::Int: {
        int64_t i = 0;
        if (!read_i64_be(ptr, end, i)) return false;
        out = Value{i};
        return true;
    }

    case ValueTag::Float: {
        uint64_t bits = 0;
        if (!read_u64_be(ptr, end, bits)) return false;
        out = Value{bits_double(bits)};
        return true;
    }

    case ValueTag::Decimal: {
        Decimal d;
        if (!read_short_string(ptr, end, d.repr)) return false;
        out = Value{std::move(d)};
        return true;
    }

    case ValueTag::String: {
        uint32_t len = 0;
        std::string s;
        if (!read_u32_be(ptr, end, len)) return false;
        if (!read_string(ptr, end, len, s)) return false;
        out = Value{std::move(s)};
        return true;
    }

    case ValueTag::Bytes: {
        uint32_t len = 0;
        if (!read_u32_be(ptr, end, len)) return false;
        if (static_cast<std::size_t>(end - ptr) < len) return false;
        out = Value{Bytes(ptr, ptr + len)};
        ptr += len;
        return true;
    }

    case ValueTag::List: {
        uint32_t count = 0;
        if (!read_u32_be(ptr, end, count)) return false;
        // Every element takes at least one byte; reject impossible counts
        // before reserving.
        if (static_cast<std::size_t>(end - ptr) < count) return false;

        Value::List list;
        list.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            Value item;
            if (!decode_at_depth(ptr, end, item, depth + 1)) return false;
            list.push_back(std::move(item));
        }
        out = Value{std::move(list)};
        return true;
    }

    case ValueTag::Map: {
        uint32_t count = 0;
        if (!read_u32_be(ptr, end, count)) return false;
        if (static_cast<std::size_t>(end - ptr) < count) return false;

        Value::Map map;
        for (uint32_t i = 0; i < count; ++i) {
            std::string key;
            Value item;
            if (!read_short_string(ptr, end, key)) return false;
            if (!decode_at_depth(ptr, end, item, depth + 1)) return false;
            map.insert_or_assign(std::move(key), std::move(item));
        }
        out = Value{std::move(map)};
        return true;
    }
    }

    return false;  // unknown tag
}

std::optional<std::string> encoding_error_at(const Value& value, std::size_t depth) {
    if (depth > kMaxValueDepth) {
        return fmt::format("value nesting exceeds maximum depth {}", kMaxValueDepth);
    }

    return std::visit(
        [depth](const auto& v) -> std::optional<std::string> {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, Decimal>) {
                if (v.repr.size() > kMaxShortString) {
                    return fmt::format("decimal length {} exceeds maximum {}", v.repr.size(), kMaxShortString);
                }
            } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Bytes>) {
                if (v.size() > kMaxLongLength) {
                    return fmt::format("{} length {} exceeds maximum {}",
                                       std::is_same_v<T, Bytes> ? "bytes" : "string", v.size(), kMaxLongLength);
                }
            } else if constexpr (std::is_same_v<T, Value::List>) {
                if (v.size() > kMaxLongLength) {
                    return fmt::format("list length {} exceeds maximum {}", v.size(), kMaxLongLength);
                }
                for (const auto& item : v) {
                    if (auto err = encoding_error_at(item, depth + 1)) return err;
                }
            } else if constexpr (std::is_same_v<T, Value::Map>) {
                if (v.size() > kMaxLongLength) {
                    return fmt::format("map size {} exceeds maximum {}", v.size(), kMaxLongLength);
                }
                for (const auto& [key, item] : v) {
                    if (key.size() > kMaxShortString) {
                        return fmt::format("map key length {} exceeds maximum {}", key.size(), kMaxShortString);
                    }
                    if (auto err = encoding_error_at(item, depth + 1)) return err;
                }
            }
            return std::nullopt;
        },
        value.data);
}

} // anonymous namespace

// ── Value ────────────────────────────────────────────────────────────────────

void encode_value(std::vector<uint8_t>& buf, const Value& value) {
    std::visit(
        [&buf](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Null));
            } else if constexpr (std::is_same_v<T, bool>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Bool));
                write_u8(buf, v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Int));
                write_i64_be(buf, v);
            } else if constexpr (std::is_same_v<T, double>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Float));
                write_u64_be(buf, double_bits(v));
            } else if constexpr (std::is_same_v<T, Decimal>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Decimal));
                write_short_string(buf, v.repr);
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::String));
                write_u32_be(buf, static_cast<uint32_t>(v.size()));
                write_bytes(buf, v.data(), v.size());
            } else if constexpr (std::is_same_v<T, Bytes>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Bytes));
                write_u32_be(buf, static_cast<uint32_t>(v.size()));
                write_bytes(buf, v.data(), v.size());
            } else if constexpr (std::is_same_v<T, Value::List>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::List));
                write_u32_be(buf, static_cast<uint32_t>(v.size()));
                for (const auto& item : v) {
                    encode_value(buf, item);
                }
            } else if constexpr (std::is_same_v<T, Value::Map>) {
                write_u8(buf, static_cast<uint8_t>(ValueTag::Map));
                write_u32_be(buf, static_cast<uint32_t>(v.size()));
                for (const auto& [key, item] : v) {
                    write_short_string(buf, key);
                    encode_value(buf, item);
                }
            }
        },
        value.data);
}

std::vector<uint8_t> encode_value(const Value& value) {
    std::vector<uint8_t> buf;
    encode_value(buf, value);
    return buf;
}

std::optional<std::string> encoding_error(const Value& value) {
    return encoding_error_at(value, 0);
}

bool decode_value(const uint8_t*& ptr, const uint8_t* end, Value& out) {
    const uint8_t* start = ptr;
    if (!decode_at_depth(ptr, end, out, 0)) {
        ptr = start;
        return false;
    }
    return true;
}

std::optional<Value> decode_value(const std::vector<uint8_t>& buf) {
    const uint8_t* ptr = buf.data();
    const uint8_t* end = buf.data() + buf.size();
    Value v;
    if (!decode_value(ptr, end, v) || ptr != end) {
        return std::nullopt;
    }
    return v;
}

// ── Entry ────────────────────────────────────────────────────────────────────

void encode_entry(std::vector<uint8_t>& buf,
                  const Value& value,
                  std::optional<int64_t> expires_at,
                  uint64_t version) {
    write_u8(buf, expires_at ? kEntryFlagTtl : 0);
    if (expires_at) {
        write_i64_be(buf, *expires_at);
    }
    write_u64_be(buf, version);
    encode_value(buf, value);
}

bool decode_entry(const uint8_t*& ptr, const uint8_t* end, DecodedEntry& out) {
    const uint8_t* start = ptr;

    uint8_t flags = 0;
    if (!read_u8(ptr, end, flags)) return false;

    out.expires_at.reset();
    if (flags & kEntryFlagTtl) {
        int64_t ts = 0;
        if (!read_i64_be(ptr, end, ts)) {
            ptr = start;
            return false;
        }
        out.expires_at = ts;
    }

    if (!read_u64_be(ptr, end, out.version) || !decode_value(ptr, end, out.value)) {
        ptr = start;
        return false;
    }
    return true;
}

} // namespace tierkv
