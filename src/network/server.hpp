#pragma once

#include "network/session.hpp"
#include "storage/engine.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tierkv::network {

struct ServerOptions {
    std::string host = "0.0.0.0";
    std::uint16_t port = 6380;       // 0 picks an ephemeral port (tests)
    unsigned threads = 0;            // 0 = hardware concurrency
    bool handle_signals = true;      // stop on SIGINT / SIGTERM
    SessionOptions session;
};

// Owns the io_context and TCP acceptor.
//
// Usage:
//   Server srv{options, engine};
//   srv.run();   // blocks until stop() or SIGINT/SIGTERM
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if
    // the address cannot be bound.
    Server(ServerOptions options, Engine& engine);

    // Starts the thread pool and the accept loop and blocks until the server
    // stops.
    void run();

    // Stops the io_context, causing run() to return.  Safe to call from any
    // thread.
    void stop();

    // The port actually bound.
    [[nodiscard]] std::uint16_t port() const noexcept { return bound_port_; }

    // Shared with the maintenance task.
    [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

private:
    // Accept loop coroutine – runs until the acceptor closes.
    boost::asio::awaitable<void> accept_loop();

    const ServerOptions options_;
    Engine& engine_;
    std::shared_ptr<spdlog::logger> logger_;

    unsigned threads_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t bound_port_ = 0;
};

} // namespace tierkv::network
