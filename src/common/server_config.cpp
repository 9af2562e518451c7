#include "common/server_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace tierkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

template <typename T>
void require_positive(T value, const char* option) {
    if (value == 0) {
        throw std::runtime_error(fmt::format("{} must be > 0", option));
    }
}

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (cfg.data_dir.empty()) {
        throw std::runtime_error("--data-dir must not be empty");
    }

    require_positive(cfg.shards, "--shards");
    require_positive(cfg.flush_interval_ms, "--flush-interval-ms");
    require_positive(cfg.wal_max_bytes, "--wal-max-bytes");
    require_positive(cfg.snapshot_interval_s, "--snapshot-interval-s");
    require_positive(cfg.snapshot_retention, "--snapshot-retention");
    require_positive(cfg.channel_capacity, "--channel-capacity");
    require_positive(cfg.maintenance_interval_ms, "--maintenance-interval-ms");
    require_positive(cfg.max_payload_bytes, "--max-payload-bytes");
    require_positive(cfg.max_value_bytes, "--max-value-bytes");

    if (!(cfg.compaction_threshold > 0.0 && cfg.compaction_threshold <= 1.0)) {
        throw std::runtime_error(fmt::format(
            "--compaction-threshold must be in (0, 1], got {}", cfg.compaction_threshold));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for client connections")
        ("port",
            po::value<uint16_t>()->default_value(6380),
            "Port for client connections")
        ("shards",
            po::value<std::size_t>()->default_value(256),
            "Number of shards (fixed for the life of the data directory)")
        ("data-dir",
            po::value<std::string>()->default_value("./data"),
            "Directory for WAL, snapshot and cold-tier files")
        ("persistence",
            po::value<bool>()->default_value(true),
            "Enable WAL and snapshots (true|false)")
        ("flush-interval-ms",
            po::value<uint32_t>()->default_value(100),
            "WAL fsync interval in milliseconds")
        ("wal-max-bytes",
            po::value<uint64_t>()->default_value(1ull << 30),
            "Rotate the WAL once it reaches this size")
        ("snapshot-interval-s",
            po::value<uint32_t>()->default_value(300),
            "Seconds between snapshots")
        ("snapshot-ops",
            po::value<uint64_t>()->default_value(100000),
            "Mutations between snapshots (0 disables this trigger)")
        ("snapshot-retention",
            po::value<uint32_t>()->default_value(3),
            "Number of snapshots kept on disk")
        ("channel-capacity",
            po::value<uint32_t>()->default_value(10000),
            "Capacity of the bounded WAL channel")
        ("shard-memory-bytes",
            po::value<uint64_t>()->default_value(0),
            "Hot-tier memory budget per shard; 0 keeps everything in memory")
        ("compaction-threshold",
            po::value<double>()->default_value(0.5),
            "Data-file waste ratio in (0, 1] that triggers compaction")
        ("maintenance-interval-ms",
            po::value<uint32_t>()->default_value(1000),
            "Period of the TTL sweep and compaction task")
        ("max-payload-bytes",
            po::value<uint32_t>()->default_value(64u * 1024 * 1024),
            "Largest accepted request payload")
        ("max-value-bytes",
            po::value<uint64_t>()->default_value(16u * 1024 * 1024),
            "Largest accepted encoded value")
        ("idle-timeout-s",
            po::value<uint32_t>()->default_value(300),
            "Close connections idle this long (0 = never)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("tierkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw HelpRequested(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host                    = vm["host"].as<std::string>();
    cfg.port                    = vm["port"].as<uint16_t>();
    cfg.shards                  = vm["shards"].as<std::size_t>();
    cfg.data_dir                = vm["data-dir"].as<std::string>();
    cfg.persistence             = vm["persistence"].as<bool>();
    cfg.flush_interval_ms       = vm["flush-interval-ms"].as<uint32_t>();
    cfg.wal_max_bytes           = vm["wal-max-bytes"].as<uint64_t>();
    cfg.snapshot_interval_s     = vm["snapshot-interval-s"].as<uint32_t>();
    cfg.snapshot_ops            = vm["snapshot-ops"].as<uint64_t>();
    cfg.snapshot_retention      = vm["snapshot-retention"].as<uint32_t>();
    cfg.channel_capacity        = vm["channel-capacity"].as<uint32_t>();
    cfg.shard_memory_bytes      = vm["shard-memory-bytes"].as<uint64_t>();
    cfg.compaction_threshold    = vm["compaction-threshold"].as<double>();
    cfg.maintenance_interval_ms = vm["maintenance-interval-ms"].as<uint32_t>();
    cfg.max_payload_bytes       = vm["max-payload-bytes"].as<uint32_t>();
    cfg.max_value_bytes         = vm["max-value-bytes"].as<uint64_t>();
    cfg.idle_timeout_s          = vm["idle-timeout-s"].as<uint32_t>();
    cfg.log_level               = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace tierkv
