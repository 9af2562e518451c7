#include "storage/value.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace tierkv {

bool operator==(const Value& a, const Value& b) {
    return a.data == b.data;
}

const char* Value::type_name() const noexcept {
    return std::visit(
        [](const auto& v) -> const char* {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "Null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "Bool";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return "Int";
            } else if constexpr (std::is_same_v<T, double>) {
                return "Float";
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return "Decimal";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "String";
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return "Bytes";
            } else if constexpr (std::is_same_v<T, List>) {
                return "List";
            } else if constexpr (std::is_same_v<T, Map>) {
                return "Map";
            }
        },
        data);
}

std::size_t Value::memory_size() const noexcept {
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate> ||
                          std::is_same_v<T, bool> ||
                          std::is_same_v<T, int64_t> ||
                          std::is_same_v<T, double>) {
                return sizeof(Value);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return sizeof(Value) + v.repr.size();
            } else if constexpr (std::is_same_v<T, std::string>) {
                return sizeof(Value) + v.size();
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return sizeof(Value) + v.size();
            } else if constexpr (std::is_same_v<T, List>) {
                std::size_t total = sizeof(Value);
                for (const auto& item : v) {
                    total += item.memory_size();
                }
                return total;
            } else if constexpr (std::is_same_v<T, Map>) {
                // Red-black tree node overhead: three pointers + colour.
                constexpr std::size_t kNodeOverhead = 4 * sizeof(void*);
                std::size_t total = sizeof(Value);
                for (const auto& [k, item] : v) {
                    total += kNodeOverhead + sizeof(std::string) + k.size() + item.memory_size();
                }
                return total;
            }
        },
        data);
}

std::string Value::to_string() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                return v.repr;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "\"" + v + "\"";
            } else if constexpr (std::is_same_v<T, Bytes>) {
                std::string out = "b'";
                for (uint8_t b : v) {
                    out += fmt::format("{:02x}", b);
                }
                return out + "'";
            } else if constexpr (std::is_same_v<T, List>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i > 0) out += ", ";
                    out += v[i].to_string();
                }
                return out + "]";
            } else if constexpr (std::is_same_v<T, Map>) {
                std::string out = "{";
                bool first = true;
                for (const auto& [k, item] : v) {
                    if (!first) out += ", ";
                    first = false;
                    out += "\"" + k + "\": " + item.to_string();
                }
                return out + "}";
            }
        },
        data);
}

} // namespace tierkv
