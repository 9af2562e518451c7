#pragma once

#include "storage/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tierkv {

// ── Mutations ────────────────────────────────────────────────────────────────
//
// One struct per successful mutating engine call.  These are the immutable
// messages the engine hands to the persistence worker and the unit the WAL
// stores and replays.  TTLs are relative; replay shortens them by the time
// elapsed since the record was written.
//
// The variant index + 1 is the on-disk op-type byte, so the order of
// alternatives in MutationOp is part of the WAL format.

using Ttl = std::optional<std::chrono::milliseconds>;

// Longest accepted TTL (100 years).  Deadlines built from it stay well inside
// the nanosecond range of both the steady clock and unix time.
inline constexpr std::chrono::milliseconds kMaxTtl = std::chrono::hours(24 * 365 * 100);

struct SetOp {
    std::string key;
    Value value;
    Ttl ttl;
};

struct DeleteOp {
    std::string key;
};

struct IncrOp {
    std::string key;
    int64_t delta = 0;
};

struct DecrOp {
    std::string key;
    int64_t delta = 0;
};

struct MSetOp {
    std::vector<std::pair<std::string, Value>> pairs;
    Ttl ttl;
};

struct MDelOp {
    std::vector<std::string> keys;
};

struct SetNxOp {
    std::string key;
    Value value;
    Ttl ttl;
};

struct LockOp {
    std::string key;
    std::string owner;
    std::chrono::milliseconds ttl{0};
    int64_t acquired_at_ms = 0;   // unix ms, stored so replay rebuilds the same record
};

struct UnlockOp {
    std::string key;
    std::string owner;
};

struct ExtendLockOp {
    std::string key;
    std::string owner;
    std::chrono::milliseconds ttl{0};
};

using MutationOp = std::variant<SetOp,
                                DeleteOp,
                                IncrOp,
                                DecrOp,
                                MSetOp,
                                MDelOp,
                                SetNxOp,
                                LockOp,
                                UnlockOp,
                                ExtendLockOp>;

enum class OpType : uint8_t {
    Set        = 1,
    Delete     = 2,
    Incr       = 3,
    Decr       = 4,
    MSet       = 5,
    MDel       = 6,
    SetNx      = 7,
    Lock       = 8,
    Unlock     = 9,
    ExtendLock = 10,
};

[[nodiscard]] inline OpType op_type(const MutationOp& op) noexcept {
    return static_cast<OpType>(op.index() + 1);
}

// ── MutationSink ─────────────────────────────────────────────────────────────
//
// Receiver of every successful mutation.  record() is called while the
// owning shard's write lock is held, so for any one shard the returned log
// sequence numbers are in the same order the mutations were applied.  It may
// block when the receiver is saturated.

class MutationSink {
public:
    virtual ~MutationSink() = default;

    // Returns the log sequence number assigned to the mutation.
    virtual uint64_t record(std::size_t shard, MutationOp op) = 0;

    // Highest sequence number assigned so far.
    [[nodiscard]] virtual uint64_t current_lsn() const = 0;

    // True once the receiver has failed and mutations are no longer durable.
    [[nodiscard]] virtual bool degraded() const = 0;
};

} // namespace tierkv
