// Throughput benchmark: N client threads each run SET+GET cycles against one
// server.
//
// Without --address, spins up an in-memory tierkv::network::Server on an
// ephemeral loopback port in a background thread.  With --address, drives an
// external server instead.
//
// Prints: total ops, elapsed wall time, ops/sec, and latency percentiles
// (p50, p90, p99, p999) per operation type and overall.

#include "client/client.hpp"
#include "common/logger.hpp"
#include "network/server.hpp"
#include "storage/engine.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <numeric>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

using bench_clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns, double elapsed_sec) {
    BenchResult r;
    r.total_ops = latencies_ns.size();
    r.elapsed_sec = elapsed_sec;

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.ops_per_sec = elapsed_sec > 0 ? static_cast<double>(r.total_ops) / elapsed_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

// ── Worker ───────────────────────────────────────────────────────────────────

struct WorkerLatencies {
    std::vector<int64_t> set_ns;
    std::vector<int64_t> get_ns;
};

void run_worker(const std::string& address,
                std::size_t worker,
                std::size_t num_cycles,
                const std::string& payload,
                WorkerLatencies& out) {
    tierkv::client::Client client(address);
    out.set_ns.reserve(num_cycles);
    out.get_ns.reserve(num_cycles);

    const std::string prefix = "bench:" + std::to_string(worker) + ":";
    for (std::size_t i = 0; i < num_cycles; ++i) {
        const std::string key = prefix + std::to_string(i);

        // SET
        {
            auto t0 = bench_clock::now();
            client.set(key, tierkv::Value{payload});
            auto t1 = bench_clock::now();
            out.set_ns.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }

        // GET
        {
            auto t0 = bench_clock::now();
            auto v = client.get(key);
            auto t1 = bench_clock::now();
            out.get_ns.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
            if (!v) {
                spdlog::warn("tierkv-bench: key {} missing right after SET", key);
            }
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    po::options_description desc("tierkv-bench options");
    desc.add_options()
        ("help,h",                                                       "Show this help")
        ("address,a",  po::value<std::string>(),                         "host:port of a running server (default: in-process)")
        ("threads,t",  po::value<std::size_t>()->default_value(4),       "Client threads")
        ("cycles,n",   po::value<std::size_t>()->default_value(10'000),  "SET+GET cycles per thread")
        ("value-size", po::value<std::size_t>()->default_value(64),      "Value size in bytes")
        ("shards",     po::value<std::size_t>()->default_value(256),     "Shards of the in-process engine");

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

    const auto num_threads = std::max<std::size_t>(1, vm["threads"].as<std::size_t>());
    const auto num_cycles  = std::max<std::size_t>(1, vm["cycles"].as<std::size_t>());
    const std::string payload(vm["value-size"].as<std::size_t>(), 'x');

    // Suppress server logs during benchmark.
    tierkv::init_default_logger(spdlog::level::warn);

    // Start an in-process server unless pointed at an external one.
    std::unique_ptr<tierkv::Engine> engine;
    std::unique_ptr<tierkv::network::Server> server;
    std::thread server_thread;
    std::string address;

    if (vm.count("address")) {
        address = vm["address"].as<std::string>();
    } else {
        tierkv::EngineOptions engine_options;
        engine_options.num_shards = vm["shards"].as<std::size_t>();
        engine = std::make_unique<tierkv::Engine>(engine_options);

        tierkv::network::ServerOptions server_options;
        server_options.host = "127.0.0.1";
        server_options.port = 0;
        server_options.handle_signals = false;
        server = std::make_unique<tierkv::network::Server>(server_options, *engine);
        server_thread = std::thread{[&] { server->run(); }};
        address = "127.0.0.1:" + std::to_string(server->port());
    }

    fprintf(stdout,
        "tierkv Benchmark\n"
        "================\n"
        "Threads:  %zu\n"
        "Cycles:   %zu per thread (each cycle = 1 SET + 1 GET = 2 ops)\n"
        "Value:    %zu bytes\n"
        "Server:   %s\n",
        num_threads, num_cycles, payload.size(), address.c_str());

    int rc = 0;
    std::vector<WorkerLatencies> results(num_threads);
    std::mutex error_mutex;
    std::string first_error;

    auto t0 = bench_clock::now();
    {
        std::vector<std::thread> workers;
        workers.reserve(num_threads);
        for (std::size_t w = 0; w < num_threads; ++w) {
            workers.emplace_back([&, w] {
                try {
                    run_worker(address, w, num_cycles, payload, results[w]);
                } catch (const std::exception& e) {
                    std::lock_guard lock(error_mutex);
                    if (first_error.empty()) first_error = e.what();
                }
            });
        }
        for (auto& t : workers) t.join();
    }
    const double elapsed = std::chrono::duration<double>(bench_clock::now() - t0).count();

    if (!first_error.empty()) {
        spdlog::error("tierkv-bench: worker failed: {}", first_error);
        rc = 1;
    } else {
        std::vector<int64_t> set_all, get_all, all;
        for (auto& r : results) {
            set_all.insert(set_all.end(), r.set_ns.begin(), r.set_ns.end());
            get_all.insert(get_all.end(), r.get_ns.begin(), r.get_ns.end());
        }
        all = set_all;
        all.insert(all.end(), get_all.begin(), get_all.end());

        print_result("SET", compute_stats(set_all, elapsed));
        print_result("GET", compute_stats(get_all, elapsed));
        print_result("Overall", compute_stats(all, elapsed));
        fprintf(stdout, "\n");
    }

    if (server) {
        server->stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    return rc;
}
