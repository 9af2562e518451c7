#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tierkv {

// ── Value ─────────────────────────────────────────────────────────────────────
//
// Closed tagged union of every storable type.  List and Map nest
// arbitrarily.  Pure data: the only behaviour lives in value_codec (wire and
// disk encoding) and in the size estimate used for hot-tier accounting.
//
// Adding an alternative to Value::Data breaks every std::visit that handles
// it exhaustively (codec, size estimate, printing) at compile time.

struct Decimal {
    std::string repr;   // arbitrary-precision decimal, kept as its string form

    friend bool operator==(const Decimal&, const Decimal&) = default;
};

using Bytes = std::vector<uint8_t>;

struct Value {
    using List = std::vector<Value>;
    using Map  = std::map<std::string, Value>;

    using Data = std::variant<std::monostate,   // Null
                              bool,
                              int64_t,
                              double,
                              Decimal,
                              std::string,
                              Bytes,
                              List,
                              Map>;

    Data data;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data(b) {}
    Value(int64_t i) : data(i) {}
    Value(int i) : data(static_cast<int64_t>(i)) {}
    Value(double d) : data(d) {}
    Value(Decimal d) : data(std::move(d)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(Bytes b) : data(std::move(b)) {}
    Value(List l) : data(std::move(l)) {}
    Value(Map m) : data(std::move(m)) {}

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int64_t>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }

    [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data); }
    [[nodiscard]] const List& as_list() const { return std::get<List>(data); }
    [[nodiscard]] const Map& as_map() const { return std::get<Map>(data); }

    // Human-readable type name ("Int", "String", ...) for error messages.
    [[nodiscard]] const char* type_name() const noexcept;

    // Approximate heap + inline footprint in bytes, used for hot-tier
    // memory accounting.  Deterministic for a given value.
    [[nodiscard]] std::size_t memory_size() const noexcept;

    // Debug rendering (CLI output, log lines).
    [[nodiscard]] std::string to_string() const;
};

bool operator==(const Value& a, const Value& b);

} // namespace tierkv
