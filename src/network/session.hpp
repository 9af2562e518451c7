#pragma once

#include "network/protocol.hpp"
#include "storage/engine.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tierkv::network {

struct SessionOptions {
    uint32_t max_payload_bytes = wire::kDefaultMaxPayload;
    std::chrono::seconds idle_timeout{300};   // 0 disables the timeout
};

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() on the socket's
// strand and runs until the client disconnects, an I/O error occurs, or the
// connection has been idle for longer than the idle timeout.  Requests are
// answered strictly in order.
//
// A request whose declared payload exceeds the limit is read off the wire
// and discarded, then answered with INVALID; the connection stays usable.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket, Engine& engine, SessionOptions options);

    // Main coroutine.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

    // The socket's strand; run() must be spawned on it.
    [[nodiscard]] boost::asio::any_io_executor executor() { return socket_.get_executor(); }

private:
    // Execute a parsed Command against the engine.
    [[nodiscard]] Response dispatch(const Command& cmd);

    // Closes the socket once `deadline_` passes without activity.
    boost::asio::awaitable<void> watchdog();

    // Read and drop `n` bytes.
    boost::asio::awaitable<void> discard(std::size_t n, boost::system::error_code& ec);

    void touch();

    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer idle_timer_;
    Engine& engine_;
    const SessionOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    std::chrono::steady_clock::time_point deadline_;
    bool closed_ = false;
    std::string remote_;
};

} // namespace tierkv::network
