#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "persistence/persistence_handle.hpp"
#include "persistence/recovery.hpp"
#include "server/maintenance.hpp"
#include "storage/engine.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    tierkv::ServerConfig cfg;
    try {
        cfg = tierkv::parse_config(argc, argv);
    } catch (const tierkv::HelpRequested& help) {
        fprintf(stdout, "%s\n", help.what());
        return 0;
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    tierkv::init_default_logger(tierkv::parse_log_level(cfg.log_level));
    auto logger = tierkv::make_component_logger("main");

    logger->info("tierkv-server starting – {}:{} shards={} data_dir={} persistence={}",
                 cfg.host, cfg.port, cfg.shards, cfg.data_dir, cfg.persistence);

    // ── Data directory ───────────────────────────────────────────────────────
    namespace fs = std::filesystem;
    const fs::path data_dir{cfg.data_dir};
    std::error_code fs_ec;
    fs::create_directories(data_dir, fs_ec);
    if (fs_ec) {
        logger->error("Failed to create data directory {}: {}", data_dir.string(), fs_ec.message());
        return 1;
    }

    // ── Engine ───────────────────────────────────────────────────────────────
    tierkv::EngineOptions engine_options;
    engine_options.num_shards = cfg.shards;
    engine_options.shard_memory_bytes = cfg.shard_memory_bytes;
    engine_options.cold_dir = data_dir / "cold";
    engine_options.compaction_threshold = cfg.compaction_threshold;
    engine_options.max_value_bytes = cfg.max_value_bytes;

    std::unique_ptr<tierkv::Engine> engine;
    try {
        engine = std::make_unique<tierkv::Engine>(engine_options);
    } catch (const std::exception& e) {
        logger->error("Failed to create engine: {}", e.what());
        return 1;
    }

    // ── Recovery + persistence ───────────────────────────────────────────────
    tierkv::persistence::PersistenceHandle* persistence = nullptr;
    if (cfg.persistence) {
        tierkv::persistence::RecoveryStats stats;
        if (auto ec = tierkv::persistence::recover(*engine, data_dir, stats)) {
            logger->error("Data directory {} is unusable: {}", data_dir.string(), ec.message());
            return 1;
        }

        tierkv::persistence::PersistenceOptions popts;
        popts.dir = data_dir;
        popts.flush_interval = std::chrono::milliseconds(cfg.flush_interval_ms);
        popts.wal_max_bytes = cfg.wal_max_bytes;
        popts.snapshot_interval = std::chrono::seconds(cfg.snapshot_interval_s);
        popts.snapshot_ops = cfg.snapshot_ops;
        popts.snapshot_retention = cfg.snapshot_retention;
        popts.channel_capacity = cfg.channel_capacity;

        auto handle = std::make_unique<tierkv::persistence::PersistenceHandle>(
            *engine, popts, stats.last_lsn);
        try {
            handle->start();
        } catch (const std::runtime_error& e) {
            logger->error("Failed to start persistence: {}", e.what());
            return 1;
        }
        persistence = handle.get();
        engine->attach_persistence(std::move(handle));
    } else {
        logger->warn("Persistence disabled – data lives in memory only");
    }

    // ── Server ───────────────────────────────────────────────────────────────
    tierkv::network::ServerOptions server_options;
    server_options.host = cfg.host;
    server_options.port = cfg.port;
    server_options.session.max_payload_bytes = cfg.max_payload_bytes;
    server_options.session.idle_timeout = std::chrono::seconds(cfg.idle_timeout_s);

    std::unique_ptr<tierkv::network::Server> server;
    try {
        server = std::make_unique<tierkv::network::Server>(server_options, *engine);
    } catch (const std::exception& e) {
        logger->error("Failed to bind {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    auto maintenance = std::make_shared<tierkv::MaintenanceTask>(
        server->io_context(), *engine,
        std::chrono::milliseconds(cfg.maintenance_interval_ms));
    maintenance->start();

    server->run(); // Blocks until SIGINT / SIGTERM.

    maintenance->stop();
    maintenance.reset();

    // ── Shutdown ─────────────────────────────────────────────────────────────
    if (persistence != nullptr && !persistence->degraded()) {
        logger->info("Writing final snapshot");
        if (!persistence->snapshot_now()) {
            logger->warn("Final snapshot failed; the WAL still covers all writes");
        }
    }
    server.reset();
    engine->detach_persistence(); // drains and fsyncs the WAL

    logger->info("tierkv-server stopped");
    return 0;
}
