#include "client/client.hpp"
#include "common/logger.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

// Whitespace-split a line.  No quoting: values containing spaces cannot be
// typed at the prompt.
std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) {
        tokens.push_back(std::move(tok));
    }
    return tokens;
}

std::string to_upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::optional<int64_t> parse_int(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

// "42" is stored as an Int, anything else as a String.
tierkv::Value parse_value(const std::string& s) {
    if (auto i = parse_int(s)) return tierkv::Value{*i};
    return tierkv::Value{s};
}

// Optional trailing TTL argument in milliseconds.
std::optional<std::chrono::milliseconds> parse_ttl(const std::vector<std::string>& tokens,
                                                   std::size_t index) {
    if (tokens.size() <= index) return std::nullopt;
    auto ms = parse_int(tokens[index]);
    if (!ms || *ms <= 0) throw std::invalid_argument("TTL must be a positive number of milliseconds");
    return std::chrono::milliseconds(*ms);
}

void require_args(const std::vector<std::string>& tokens, std::size_t min, const char* usage) {
    if (tokens.size() < min) throw std::invalid_argument(std::string("usage: ") + usage);
}

const char* bool_text(bool b) { return b ? "1" : "0"; }

constexpr const char* kHelp =
    "Commands:\n"
    "  GET key                    SET key value [ttl_ms]\n"
    "  DEL key                    EXISTS key\n"
    "  INCR key [delta]           DECR key [delta]\n"
    "  SETNX key value [ttl_ms]   EXPIRE key ttl_ms\n"
    "  TTL key                    LOCK key owner ttl_ms\n"
    "  UNLOCK key owner           EXTEND key owner ttl_ms\n"
    "  MGET key...                MDEL key...\n"
    "  PING                       INFO\n"
    "  HELP                       QUIT\n";

// Run one command line and print its result.  Returns false on QUIT.
bool execute(tierkv::client::Client& client, const std::vector<std::string>& tokens) {
    const auto cmd = to_upper(tokens[0]);

    if (cmd == "QUIT" || cmd == "EXIT") {
        return false;
    } else if (cmd == "HELP") {
        fprintf(stdout, "%s", kHelp);
    } else if (cmd == "PING") {
        fprintf(stdout, "%s\n", client.ping().c_str());
    } else if (cmd == "INFO") {
        fprintf(stdout, "%s\n", client.info().c_str());
    } else if (cmd == "GET") {
        require_args(tokens, 2, "GET key");
        auto v = client.get(tokens[1]);
        fprintf(stdout, "%s\n", v ? v->to_string().c_str() : "(nil)");
    } else if (cmd == "SET") {
        require_args(tokens, 3, "SET key value [ttl_ms]");
        client.set(tokens[1], parse_value(tokens[2]), parse_ttl(tokens, 3));
        fprintf(stdout, "OK\n");
    } else if (cmd == "SETNX") {
        require_args(tokens, 3, "SETNX key value [ttl_ms]");
        fprintf(stdout, "%s\n", bool_text(client.setnx(tokens[1], parse_value(tokens[2]),
                                                       parse_ttl(tokens, 3))));
    } else if (cmd == "DEL") {
        require_args(tokens, 2, "DEL key");
        fprintf(stdout, "%s\n", bool_text(client.del(tokens[1])));
    } else if (cmd == "EXISTS") {
        require_args(tokens, 2, "EXISTS key");
        fprintf(stdout, "%s\n", bool_text(client.exists(tokens[1])));
    } else if (cmd == "INCR" || cmd == "DECR") {
        require_args(tokens, 2, "INCR|DECR key [delta]");
        int64_t delta = 1;
        if (tokens.size() > 2) {
            auto d = parse_int(tokens[2]);
            if (!d) throw std::invalid_argument("delta must be an integer");
            delta = *d;
        }
        auto result = cmd == "INCR" ? client.incr(tokens[1], delta) : client.decr(tokens[1], delta);
        fprintf(stdout, "%lld\n", static_cast<long long>(result));
    } else if (cmd == "EXPIRE") {
        require_args(tokens, 3, "EXPIRE key ttl_ms");
        fprintf(stdout, "%s\n", bool_text(client.expire(tokens[1], *parse_ttl(tokens, 2))));
    } else if (cmd == "TTL") {
        require_args(tokens, 2, "TTL key");
        auto ttl = client.ttl(tokens[1]);
        if (!ttl) {
            fprintf(stdout, "(nil)\n");
        } else {
            fprintf(stdout, "%lld\n", static_cast<long long>(*ttl));
        }
    } else if (cmd == "LOCK") {
        require_args(tokens, 4, "LOCK key owner ttl_ms");
        fprintf(stdout, "%s\n", bool_text(client.lock(tokens[1], tokens[2], *parse_ttl(tokens, 3))));
    } else if (cmd == "UNLOCK") {
        require_args(tokens, 3, "UNLOCK key owner");
        fprintf(stdout, "%s\n", bool_text(client.unlock(tokens[1], tokens[2])));
    } else if (cmd == "EXTEND") {
        require_args(tokens, 4, "EXTEND key owner ttl_ms");
        fprintf(stdout, "%s\n",
                bool_text(client.extend_lock(tokens[1], tokens[2], *parse_ttl(tokens, 3))));
    } else if (cmd == "MGET") {
        require_args(tokens, 2, "MGET key...");
        std::vector<std::string> keys(tokens.begin() + 1, tokens.end());
        auto values = client.mget(keys);
        for (std::size_t i = 0; i < keys.size(); ++i) {
            fprintf(stdout, "%zu) %s\n", i + 1,
                    values[i] ? values[i]->to_string().c_str() : "(nil)");
        }
    } else if (cmd == "MDEL") {
        require_args(tokens, 2, "MDEL key...");
        std::vector<std::string> keys(tokens.begin() + 1, tokens.end());
        fprintf(stdout, "%zu\n", client.mdel(keys));
    } else {
        fprintf(stdout, "ERROR unknown command '%s' (try HELP)\n", tokens[0].c_str());
    }
    return true;
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("tierkv-cli options");
    desc.add_options()
        ("help,h",                                                              "Show this help")
        ("address,a",   po::value<std::string>()->default_value("127.0.0.1:6380"), "host:port[/namespace]")
        ("log-level,l", po::value<std::string>()->default_value("warn"),           "Log level");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto address   = vm["address"].as<std::string>();
    const auto log_level = vm["log-level"].as<std::string>();

    tierkv::init_default_logger(tierkv::parse_log_level(log_level));
    spdlog::debug("tierkv-cli connecting to {}", address);

    std::optional<tierkv::client::Client> client;
    try {
        client.emplace(address);
    } catch (const std::exception& e) {
        spdlog::error("tierkv-cli: failed to connect to {} – {}", address, e.what());
        return 1;
    }

    fprintf(stdout, "Connected to %s. Type HELP for commands, Ctrl+D to quit.\n", address.c_str());

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        auto tokens = tokenize(line);
        if (tokens.empty()) {
            continue;
        }

        try {
            if (!execute(*client, tokens)) break;
        } catch (const std::invalid_argument& e) {
            fprintf(stdout, "ERROR %s\n", e.what());
        } catch (const tierkv::client::ClientError& e) {
            fprintf(stdout, "ERROR %s\n", e.what());
            if (e.kind() == tierkv::client::ClientError::Kind::Connection ||
                e.kind() == tierkv::client::ClientError::Kind::Protocol) {
                fprintf(stdout, "Server disconnected.\n");
                return 1;
            }
        }
    }

    return 0;
}
