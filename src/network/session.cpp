#include "network/session.hpp"

#include "common/logger.hpp"
#include "storage/engine_error.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

namespace tierkv::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::bad_descriptor;
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket socket, Engine& engine, SessionOptions options)
    : socket_(std::move(socket)),
      idle_timer_(socket_.get_executor()),
      engine_(engine),
      options_(options),
      logger_(make_component_logger("session")) {
    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void Session::touch() {
    deadline_ = std::chrono::steady_clock::now() + options_.idle_timeout;
}

boost::asio::awaitable<void> Session::watchdog() {
    while (!closed_) {
        idle_timer_.expires_at(deadline_);
        boost::system::error_code ec;
        co_await idle_timer_.async_wait(redirect_error(use_awaitable, ec));

        if (closed_) break;
        if (deadline_ <= std::chrono::steady_clock::now()) {
            logger_->debug("{}: idle for {}s, closing", remote_, options_.idle_timeout.count());
            boost::system::error_code close_ec;
            socket_.close(close_ec);
            break;
        }
    }
}

boost::asio::awaitable<void> Session::discard(std::size_t n, boost::system::error_code& ec) {
    std::vector<uint8_t> sink(std::min<std::size_t>(n, 64 * 1024));
    while (n > 0) {
        auto chunk = std::min(n, sink.size());
        co_await boost::asio::async_read(socket_, boost::asio::buffer(sink.data(), chunk),
                                         redirect_error(use_awaitable, ec));
        if (ec) co_return;
        n -= chunk;
        touch();
    }
}

boost::asio::awaitable<void> Session::run() {
    logger_->debug("{}: connected", remote_);

    if (options_.idle_timeout.count() > 0) {
        touch();
        boost::asio::co_spawn(
            socket_.get_executor(),
            [self = shared_from_this()]() -> boost::asio::awaitable<void> {
                co_await self->watchdog();
            },
            boost::asio::detached);
    }

    std::array<uint8_t, wire::kHeaderSize> header{};
    std::vector<uint8_t> payload;

    for (;;) {
        boost::system::error_code ec;
        co_await boost::asio::async_read(socket_, boost::asio::buffer(header),
                                         redirect_error(use_awaitable, ec));
        if (ec) {
            if (!is_disconnect(ec)) {
                logger_->warn("{}: read header error: {}", remote_, ec.message());
            }
            break;
        }
        touch();

        uint8_t op = 0;
        uint32_t payload_len = 0;
        (void)read_header(header, op, payload_len);

        Response response;
        if (payload_len > options_.max_payload_bytes) {
            logger_->debug("{}: rejecting {} byte payload for opcode 0x{:02x}",
                           remote_, payload_len, op);
            co_await discard(payload_len, ec);
            if (ec) break;
            response = InvalidResp{fmt::format("payload of {} bytes exceeds the {} byte limit",
                                               payload_len, options_.max_payload_bytes)};
        } else {
            payload.resize(payload_len);
            if (payload_len > 0) {
                co_await boost::asio::async_read(socket_, boost::asio::buffer(payload),
                                                 redirect_error(use_awaitable, ec));
                if (ec) {
                    if (!is_disconnect(ec)) {
                        logger_->warn("{}: read payload error: {}", remote_, ec.message());
                    }
                    break;
                }
                touch();
            }

            logger_->trace("{}: recv opcode=0x{:02x} payload_len={}", remote_, op, payload_len);

            auto parsed = parse_request(op, payload);
            if (auto* invalid = std::get_if<InvalidResp>(&parsed)) {
                response = std::move(*invalid);
            } else {
                response = dispatch(std::get<Command>(parsed));
            }
        }

        auto wire_bytes = serialize_response(response);
        co_await boost::asio::async_write(socket_, boost::asio::buffer(wire_bytes),
                                          redirect_error(use_awaitable, ec));
        if (ec) {
            if (!is_disconnect(ec)) {
                logger_->warn("{}: write error: {}", remote_, ec.message());
            }
            break;
        }
        touch();
    }

    closed_ = true;
    idle_timer_.cancel();
    logger_->debug("{}: disconnected", remote_);
}

Response Session::dispatch(const Command& cmd) {
    try {
        return std::visit(
            [&](const auto& c) -> Response {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, PingCmd>) {
                    return TextResp{"PONG"};

                } else if constexpr (std::is_same_v<T, InfoCmd>) {
                    return TextResp{format_info(engine_.info())};

                } else if constexpr (std::is_same_v<T, GetCmd>) {
                    auto value = engine_.get(c.key);
                    if (!value) return NullResp{};
                    return ValueResp{std::move(*value)};

                } else if constexpr (std::is_same_v<T, SetCmd>) {
                    engine_.set(c.key, c.value, c.ttl);
                    return OkResp{};

                } else if constexpr (std::is_same_v<T, DelCmd>) {
                    return BoolResp{engine_.del(c.key)};

                } else if constexpr (std::is_same_v<T, ExistsCmd>) {
                    return BoolResp{engine_.exists(c.key)};

                } else if constexpr (std::is_same_v<T, IncrCmd>) {
                    return IntResp{engine_.incr(c.key, c.delta)};

                } else if constexpr (std::is_same_v<T, DecrCmd>) {
                    return IntResp{engine_.decr(c.key, c.delta)};

                } else if constexpr (std::is_same_v<T, CasCmd>) {
                    if (engine_.cas(c.key, c.expected, c.desired, c.ttl)) return OkResp{};
                    return CasFailedResp{};

                } else if constexpr (std::is_same_v<T, SetNxCmd>) {
                    return BoolResp{engine_.setnx(c.key, c.value, c.ttl)};

                } else if constexpr (std::is_same_v<T, LockCmd>) {
                    return BoolResp{engine_.lock(c.key, c.owner, c.ttl)};

                } else if constexpr (std::is_same_v<T, UnlockCmd>) {
                    return BoolResp{engine_.unlock(c.key, c.owner)};

                } else if constexpr (std::is_same_v<T, ExtendLockCmd>) {
                    return BoolResp{engine_.extend_lock(c.key, c.owner, c.ttl)};

                } else if constexpr (std::is_same_v<T, MGetCmd>) {
                    return ValuesResp{engine_.mget(c.keys)};

                } else if constexpr (std::is_same_v<T, MSetCmd>) {
                    engine_.mset(c.pairs, c.ttl);
                    return OkResp{};

                } else if constexpr (std::is_same_v<T, MDelCmd>) {
                    return CountResp{static_cast<uint32_t>(engine_.mdel(c.keys))};

                } else if constexpr (std::is_same_v<T, MExistsCmd>) {
                    return BoolsResp{engine_.mexists(c.keys)};

                } else if constexpr (std::is_same_v<T, ExpireCmd>) {
                    return BoolResp{engine_.expire(c.key, c.ttl)};

                } else if constexpr (std::is_same_v<T, TtlCmd>) {
                    auto remaining = engine_.ttl(c.key);
                    if (!remaining) return NullResp{};
                    return IntResp{*remaining};
                }
            },
            cmd);
    } catch (const EngineError& e) {
        return ErrorResp{e.what()};
    } catch (const std::exception& e) {
        logger_->error("{}: opcode 0x{:02x} failed: {}", remote_, opcode(cmd), e.what());
        return ErrorResp{fmt::format("internal error: {}", e.what())};
    }
}

} // namespace tierkv::network
