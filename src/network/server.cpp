#include "network/server.hpp"

#include "common/logger.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

namespace tierkv::network {

namespace {

unsigned pool_size(unsigned requested) {
    if (requested > 0) return requested;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

Server::Server(ServerOptions options, Engine& engine)
    : options_(std::move(options)),
      engine_(engine),
      logger_(make_component_logger("server")),
      threads_(pool_size(options_.threads)),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_) {
    const auto address = boost::asio::ip::make_address(options_.host);
    const boost::asio::ip::tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    bound_port_ = acceptor_.local_endpoint().port();

    logger_->info("listening on {}:{}", options_.host, bound_port_);
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    std::unique_ptr<boost::asio::signal_set> signals;
    if (options_.handle_signals) {
        signals = std::make_unique<boost::asio::signal_set>(ioc_, SIGINT, SIGTERM);
        signals->async_wait([this](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                logger_->info("received signal {}, shutting down", signo);
                stop();
            }
        });
    }

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);

    // Run the io_context across a thread pool.
    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    logger_->info("io_context stopped, all threads joined");
}

void Server::stop() {
    boost::asio::post(acceptor_.get_executor(), [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();
}

boost::asio::awaitable<void> Server::accept_loop() {
    logger_->debug("accept loop started");

    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                break; // Acceptor was closed – time to stop.
            }
            logger_->warn("accept error: {}", ec.message());
            continue;
        }

        // Disable Nagle – send responses immediately.
        socket.set_option(boost::asio::ip::tcp::no_delay(true), ec);

        auto session = std::make_shared<Session>(std::move(socket), engine_, options_.session);
        auto executor = session->executor();
        boost::asio::co_spawn(
            executor,
            [sp = std::move(session)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }

    logger_->debug("accept loop exited");
}

} // namespace tierkv::network
