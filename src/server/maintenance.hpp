#pragma once

#include "storage/engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <spdlog/spdlog.h>

namespace tierkv {

// ── MaintenanceTask ──────────────────────────────────────────────────────────
//
// Periodic housekeeping on the server's io_context: removes expired entries
// from both tiers and compacts cold data files whose waste ratio crossed
// the threshold.
//
// Lifecycle: create with std::make_shared.  start() spawns the timer loop on
// the io_context; stop() posts the cancellation, so the loop finishes the
// next time the io_context runs.  The loop and the posted cancellation each
// hold a reference, so the owner may drop the task at any point.

class MaintenanceTask : public std::enable_shared_from_this<MaintenanceTask> {
public:
    struct Result {
        std::size_t expired = 0;
        std::size_t compacted = 0;   // data files rewritten
    };

    MaintenanceTask(boost::asio::io_context& ioc, Engine& engine, std::chrono::milliseconds interval);

    MaintenanceTask(const MaintenanceTask&) = delete;
    MaintenanceTask& operator=(const MaintenanceTask&) = delete;

    void start();
    void stop();

    // One sweep + compaction pass, synchronously.
    Result run_once();

private:
    boost::asio::awaitable<void> loop();

    Engine& engine_;
    const std::chrono::milliseconds interval_;
    boost::asio::steady_timer timer_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<bool> running_{false};
};

} // namespace tierkv
