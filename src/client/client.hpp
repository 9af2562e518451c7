#pragma once

#include "network/protocol.hpp"
#include "storage/mutation.hpp"
#include "storage/value.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tierkv::client {

// ── Address ──────────────────────────────────────────────────────────────────
//
//   "127.0.0.1:6380"            no namespace
//   "127.0.0.1:6380/tasks"      namespace "tasks"
//   "127.0.0.1:6380/prod/cache" namespace "prod/cache"

struct Address {
    std::string host;
    uint16_t port = 0;
    std::string ns;   // empty = no namespace
};

// Throws std::invalid_argument on a malformed address.
[[nodiscard]] Address parse_address(const std::string& text);

// ── ClientError ──────────────────────────────────────────────────────────────

class ClientError : public std::runtime_error {
public:
    enum class Kind {
        Connection,   // connect / read / write failed; the client is closed
        Server,       // ERROR status (type mismatch, key too long, ...)
        Invalid,      // INVALID status (request rejected by the parser)
        Protocol,     // response could not be decoded; the client is closed
        Timeout,      // pool acquire timed out
    };

    ClientError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// ── Client ───────────────────────────────────────────────────────────────────
//
// Blocking client for one server connection.  Mirrors the engine API as
// request/response round trips and prefixes every key with "<ns>:" when a
// namespace is configured.  Failures are thrown as ClientError.
//
// Thread-safety: NOT thread-safe; use one Client per thread or a ClientPool.

class Client {
public:
    // Connect to "host:port[/namespace]".
    explicit Client(const std::string& address);
    explicit Client(const Address& address);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ── Single-key operations ────────────────────────────────────────────────

    [[nodiscard]] std::optional<Value> get(const std::string& key);
    void set(const std::string& key, Value value, Ttl ttl = std::nullopt);
    bool del(const std::string& key);
    [[nodiscard]] bool exists(const std::string& key);
    int64_t incr(const std::string& key, int64_t delta = 1);
    int64_t decr(const std::string& key, int64_t delta = 1);
    bool cas(const std::string& key, Value expected, Value desired, Ttl ttl = std::nullopt);
    bool setnx(const std::string& key, Value value, Ttl ttl = std::nullopt);
    bool expire(const std::string& key, std::chrono::milliseconds ttl);
    [[nodiscard]] std::optional<int64_t> ttl(const std::string& key);

    // ── Batch operations ─────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::optional<Value>> mget(const std::vector<std::string>& keys);
    void mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl = std::nullopt);
    std::size_t mdel(const std::vector<std::string>& keys);
    [[nodiscard]] std::vector<bool> mexists(const std::vector<std::string>& keys);

    // ── Locks ────────────────────────────────────────────────────────────────

    bool lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);
    bool unlock(const std::string& key, const std::string& owner);
    bool extend_lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl);

    // ── Server ───────────────────────────────────────────────────────────────

    std::string ping();
    std::string info();

    [[nodiscard]] const std::string& ns() const noexcept { return namespace_; }
    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }
    void close();

private:
    // One round trip.  ERROR / INVALID responses are thrown.
    network::Response call(const network::Command& cmd);

    [[nodiscard]] std::string prefix(const std::string& key) const;
    [[nodiscard]] std::vector<std::string> prefix(const std::vector<std::string>& keys) const;

    [[noreturn]] void protocol_failure(const std::string& what);

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::socket socket_;
    std::string namespace_;
};

} // namespace tierkv::client
