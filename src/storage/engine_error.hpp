#pragma once

#include <stdexcept>
#include <string>

namespace tierkv {

// ── Engine errors ────────────────────────────────────────────────────────────
//
// Request-validation and type errors.  Thrown before any shard state is
// touched, or after the failed check with the entry left as it was.

enum class EngineErrc {
    EmptyKey,
    KeyTooLong,
    ValueTooLarge,
    InvalidValue,
    TtlOutOfRange,
    TypeMismatch,
    LockOwnerMismatch,
};

class EngineError : public std::runtime_error {
public:
    EngineError(EngineErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    [[nodiscard]] EngineErrc code() const noexcept { return code_; }

private:
    EngineErrc code_;
};

} // namespace tierkv
