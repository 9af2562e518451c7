#include "client/client.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <array>
#include <charconv>
#include <variant>

#include <fmt/format.h>

namespace tierkv::client {

namespace net = tierkv::network;

namespace {

// Pull the expected alternative out of a response.  call() has already
// checked the shape against the opcode, so a miss is a protocol bug.
template <typename T>
T take(net::Response& resp, const char* op) {
    if (auto* r = std::get_if<T>(&resp)) {
        return std::move(*r);
    }
    throw ClientError(ClientError::Kind::Protocol, fmt::format("unexpected {} response", op));
}

} // namespace

// ── Address ──────────────────────────────────────────────────────────────────

Address parse_address(const std::string& text) {
    Address addr;
    std::string host_port = text;
    if (auto slash = text.find('/'); slash != std::string::npos) {
        host_port = text.substr(0, slash);
        addr.ns = text.substr(slash + 1);
        if (addr.ns.empty()) {
            throw std::invalid_argument(fmt::format("empty namespace in address '{}'", text));
        }
    }

    auto colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == host_port.size()) {
        throw std::invalid_argument(fmt::format("expected host:port[/namespace], got '{}'", text));
    }
    addr.host = host_port.substr(0, colon);

    const char* first = host_port.data() + colon + 1;
    const char* last = host_port.data() + host_port.size();
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port == 0 || port > 65535) {
        throw std::invalid_argument(fmt::format("invalid port in address '{}'", text));
    }
    addr.port = static_cast<uint16_t>(port);
    return addr;
}

// ── Client ───────────────────────────────────────────────────────────────────

Client::Client(const std::string& address) : Client(parse_address(address)) {}

Client::Client(const Address& address) : socket_(ioc_), namespace_(address.ns) {
    try {
        boost::asio::ip::tcp::resolver resolver(ioc_);
        auto endpoints = resolver.resolve(address.host, std::to_string(address.port));
        boost::asio::connect(socket_, endpoints);
        socket_.set_option(boost::asio::ip::tcp::no_delay(true));
    } catch (const boost::system::system_error& e) {
        throw ClientError(ClientError::Kind::Connection,
                          fmt::format("cannot connect to {}:{}: {}",
                                      address.host, address.port, e.code().message()));
    }
}

void Client::close() {
    boost::system::error_code ec;
    socket_.close(ec);
}

std::string Client::prefix(const std::string& key) const {
    if (namespace_.empty()) return key;
    return namespace_ + ":" + key;
}

std::vector<std::string> Client::prefix(const std::vector<std::string>& keys) const {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (const auto& k : keys) {
        out.push_back(prefix(k));
    }
    return out;
}

void Client::protocol_failure(const std::string& what) {
    close();
    throw ClientError(ClientError::Kind::Protocol, what);
}

net::Response Client::call(const net::Command& cmd) {
    if (!socket_.is_open()) {
        throw ClientError(ClientError::Kind::Connection, "connection is closed");
    }

    auto fail = [this](const char* stage, const boost::system::error_code& ec) {
        close();
        throw ClientError(ClientError::Kind::Connection,
                          fmt::format("{} failed: {}", stage, ec.message()));
    };

    if (auto err = net::request_error(cmd)) {
        throw ClientError(ClientError::Kind::Invalid, *err);
    }

    const auto request = net::serialize_request(cmd);
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(request), ec);
    if (ec) fail("send", ec);

    std::array<uint8_t, net::wire::kHeaderSize> header{};
    boost::asio::read(socket_, boost::asio::buffer(header), ec);
    if (ec) fail("receive", ec);

    uint8_t status = 0;
    uint32_t len = 0;
    (void)net::read_header(header, status, len);

    std::vector<uint8_t> payload(len);
    if (len > 0) {
        boost::asio::read(socket_, boost::asio::buffer(payload), ec);
        if (ec) fail("receive", ec);
    }

    auto resp = net::parse_response(net::opcode(cmd), status, payload);
    if (auto* err = std::get_if<net::ErrorResp>(&resp)) {
        throw ClientError(ClientError::Kind::Server, err->message);
    }
    if (auto* invalid = std::get_if<net::InvalidResp>(&resp)) {
        if (status == net::wire::kStatusInvalid) {
            throw ClientError(ClientError::Kind::Invalid, invalid->message);
        }
        protocol_failure(invalid->message);
    }
    return resp;
}

// ── Single-key operations ────────────────────────────────────────────────────

std::optional<Value> Client::get(const std::string& key) {
    auto resp = call(net::GetCmd{prefix(key)});
    if (std::holds_alternative<net::NullResp>(resp)) return std::nullopt;
    return take<net::ValueResp>(resp, "GET").value;
}

void Client::set(const std::string& key, Value value, Ttl ttl) {
    auto resp = call(net::SetCmd{prefix(key), std::move(value), ttl});
    take<net::OkResp>(resp, "SET");
}

bool Client::del(const std::string& key) {
    auto resp = call(net::DelCmd{prefix(key)});
    return take<net::BoolResp>(resp, "DEL").value;
}

bool Client::exists(const std::string& key) {
    auto resp = call(net::ExistsCmd{prefix(key)});
    return take<net::BoolResp>(resp, "EXISTS").value;
}

int64_t Client::incr(const std::string& key, int64_t delta) {
    auto resp = call(net::IncrCmd{prefix(key), delta});
    return take<net::IntResp>(resp, "INCR").value;
}

int64_t Client::decr(const std::string& key, int64_t delta) {
    auto resp = call(net::DecrCmd{prefix(key), delta});
    return take<net::IntResp>(resp, "DECR").value;
}

bool Client::cas(const std::string& key, Value expected, Value desired, Ttl ttl) {
    auto resp = call(net::CasCmd{prefix(key), std::move(expected), std::move(desired), ttl});
    if (std::holds_alternative<net::CasFailedResp>(resp)) return false;
    take<net::OkResp>(resp, "CAS");
    return true;
}

bool Client::setnx(const std::string& key, Value value, Ttl ttl) {
    auto resp = call(net::SetNxCmd{prefix(key), std::move(value), ttl});
    return take<net::BoolResp>(resp, "SETNX").value;
}

bool Client::expire(const std::string& key, std::chrono::milliseconds ttl) {
    auto resp = call(net::ExpireCmd{prefix(key), ttl});
    return take<net::BoolResp>(resp, "EXPIRE").value;
}

std::optional<int64_t> Client::ttl(const std::string& key) {
    auto resp = call(net::TtlCmd{prefix(key)});
    if (std::holds_alternative<net::NullResp>(resp)) return std::nullopt;
    return take<net::IntResp>(resp, "TTL").value;
}

// ── Batch operations ─────────────────────────────────────────────────────────

std::vector<std::optional<Value>> Client::mget(const std::vector<std::string>& keys) {
    auto resp = call(net::MGetCmd{prefix(keys)});
    auto values = take<net::ValuesResp>(resp, "MGET").values;
    if (values.size() != keys.size()) {
        protocol_failure("MGET returned the wrong number of values");
    }
    return values;
}

void Client::mset(std::vector<std::pair<std::string, Value>> pairs, Ttl ttl) {
    for (auto& [key, value] : pairs) {
        key = prefix(key);
    }
    auto resp = call(net::MSetCmd{std::move(pairs), ttl});
    take<net::OkResp>(resp, "MSET");
}

std::size_t Client::mdel(const std::vector<std::string>& keys) {
    auto resp = call(net::MDelCmd{prefix(keys)});
    return take<net::CountResp>(resp, "MDEL").count;
}

std::vector<bool> Client::mexists(const std::vector<std::string>& keys) {
    auto resp = call(net::MExistsCmd{prefix(keys)});
    auto values = take<net::BoolsResp>(resp, "MEXISTS").values;
    if (values.size() != keys.size()) {
        protocol_failure("MEXISTS returned the wrong number of flags");
    }
    return values;
}

// ── Locks ────────────────────────────────────────────────────────────────────

bool Client::lock(const std::string& key, const std::string& owner, std::chrono::milliseconds ttl) {
    auto resp = call(net::LockCmd{prefix(key), owner, ttl});
    return take<net::BoolResp>(resp, "LOCK").value;
}

bool Client::unlock(const std::string& key, const std::string& owner) {
    auto resp = call(net::UnlockCmd{prefix(key), owner});
    return take<net::BoolResp>(resp, "UNLOCK").value;
}

bool Client::extend_lock(const std::string& key, const std::string& owner,
                         std::chrono::milliseconds ttl) {
    auto resp = call(net::ExtendLockCmd{prefix(key), owner, ttl});
    return take<net::BoolResp>(resp, "EXTEND").value;
}

// ── Server ───────────────────────────────────────────────────────────────────

std::string Client::ping() {
    auto resp = call(net::PingCmd{});
    return take<net::TextResp>(resp, "PING").text;
}

std::string Client::info() {
    auto resp = call(net::InfoCmd{});
    return take<net::TextResp>(resp, "INFO").text;
}

} // namespace tierkv::client
