#include "server/maintenance.hpp"

#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace tierkv {

MaintenanceTask::MaintenanceTask(boost::asio::io_context& ioc,
                                 Engine& engine,
                                 std::chrono::milliseconds interval)
    : engine_(engine),
      interval_(interval),
      timer_(ioc),
      logger_(make_component_logger("maintenance")) {}

void MaintenanceTask::start() {
    if (running_.exchange(true)) return;
    boost::asio::co_spawn(
        timer_.get_executor(),
        [self = shared_from_this()]() -> boost::asio::awaitable<void> {
            co_await self->loop();
        },
        boost::asio::detached);
    logger_->info("started, interval {} ms", interval_.count());
}

void MaintenanceTask::stop() {
    if (!running_.exchange(false)) return;
    boost::asio::post(timer_.get_executor(), [self = shared_from_this()] { self->timer_.cancel(); });
}

MaintenanceTask::Result MaintenanceTask::run_once() {
    Result result;
    result.expired = engine_.sweep_expired();
    result.compacted = engine_.compact();

    if (result.expired > 0 || result.compacted > 0) {
        logger_->debug("swept {} expired entries, compacted {} data files",
                       result.expired, result.compacted);
    }
    return result;
}

boost::asio::awaitable<void> MaintenanceTask::loop() {
    while (running_) {
        timer_.expires_after(interval_);
        boost::system::error_code ec;
        co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || !running_) break;

        try {
            run_once();
        } catch (const std::exception& e) {
            logger_->error("maintenance pass failed: {}", e.what());
        }
    }
    logger_->debug("loop exited");
}

} // namespace tierkv
