#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace tierkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one tierkv-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string host;                    // Bind address for client connections
    uint16_t    port;                    // Client port
    std::size_t shards;                  // Shard count, fixed for the life of the data dir
    std::string data_dir;                // WAL, snapshots and cold-tier data files
    bool        persistence;             // WAL + snapshots on/off
    uint32_t    flush_interval_ms;       // WAL fsync interval
    uint64_t    wal_max_bytes;           // WAL rotation size
    uint32_t    snapshot_interval_s;     // Snapshot time trigger
    uint64_t    snapshot_ops;            // Snapshot op-count trigger (0 = off)
    uint32_t    snapshot_retention;      // Snapshots kept on disk
    uint32_t    channel_capacity;        // Bounded WAL channel size
    uint64_t    shard_memory_bytes;      // Hot-tier budget per shard (0 = unlimited)
    double      compaction_threshold;    // Waste ratio that triggers compaction
    uint32_t    maintenance_interval_ms; // TTL sweep + compaction period
    uint32_t    max_payload_bytes;       // Largest accepted request payload
    uint64_t    max_value_bytes;         // Largest accepted encoded value
    uint32_t    idle_timeout_s;          // Idle connection timeout (0 = none)
    std::string log_level;               // spdlog level string
};

// Thrown by parse_config() for --help.  what() is the option table.
class HelpRequested : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - port in [1, 65535]
//   - shards, flush interval, snapshot retention, channel capacity,
//     maintenance interval and payload / value limits > 0
//   - compaction threshold in (0, 1]
//   - data dir non-empty

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace tierkv
