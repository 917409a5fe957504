// Engine micro-benchmark.
//
// Runs three workloads against an in-process kvmock::Engine:
//   (1) ZADD of N distinct members into one sorted set,
//   (2) ZRANK lookups of random members of that set,
//   (3) ZADD + ZRANGEBYSCORE round trips through the CommandDispatcher.
//
// Prints: total ops, summed latency, ops/sec, and latency percentiles (p50,
// p90, p99, p999) per workload.

#include "command/dispatcher.hpp"
#include "engine/engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <random>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double busy_sec{};
    double ops_per_sec{};
    double avg_us{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
};

BenchResult summarize(std::vector<int64_t>& samples_ns) {
    BenchResult r;
    r.total_ops = samples_ns.size();
    if (samples_ns.empty()) {
        return r;
    }

    std::sort(samples_ns.begin(), samples_ns.end());

    const auto total_ns = std::accumulate(samples_ns.begin(), samples_ns.end(), int64_t{0});
    r.busy_sec    = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = r.busy_sec > 0 ? static_cast<double>(r.total_ops) / r.busy_sec : 0.0;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto at = [&](double p) {
        const auto idx = static_cast<std::size_t>(p * static_cast<double>(samples_ns.size() - 1));
        return static_cast<double>(samples_ns[idx]) / 1000.0;
    };
    r.p50_us  = at(0.50);
    r.p90_us  = at(0.90);
    r.p99_us  = at(0.99);
    r.p999_us = at(0.999);
    return r;
}

void report(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Busy time:    %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.2f µs\n"
        "  p50:          %.2f µs\n"
        "  p90:          %.2f µs\n"
        "  p99:          %.2f µs\n"
        "  p99.9:        %.2f µs\n",
        label, r.total_ops, r.busy_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

template <typename Fn>
int64_t timed(Fn&& fn) {
    const auto t0 = clock::now();
    fn();
    return std::chrono::duration_cast<ns>(clock::now() - t0).count();
}

std::string member_name(std::size_t i) {
    return "member:" + std::to_string(i);
}

// ── Workloads ────────────────────────────────────────────────────────────────

BenchResult bench_zadd(kvmock::Engine& engine, std::size_t n, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> score(0.0, 1e6);
    std::vector<int64_t> samples;
    samples.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const kvmock::ScoredMember entry{member_name(i), score(rng)};
        samples.push_back(timed([&] { engine.zadd("bench:zset", {entry}); }));
    }
    return summarize(samples);
}

BenchResult bench_zrank(kvmock::Engine& engine, std::size_t n, std::mt19937_64& rng) {
    std::uniform_int_distribution<std::size_t> pick(0, n - 1);
    std::vector<int64_t> samples;
    samples.reserve(n);

    std::size_t found = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::string member = member_name(pick(rng));
        samples.push_back(timed([&] {
            found += engine.zrank("bench:zset", member).has_value() ? 1 : 0;
        }));
    }
    if (found != n) {
        spdlog::warn("zrank: {} of {} lookups missed", n - found, n);
    }
    return summarize(samples);
}

BenchResult bench_dispatch(kvmock::command::CommandDispatcher& dispatcher, std::size_t n) {
    std::vector<int64_t> samples;
    samples.reserve(n * 2);

    for (std::size_t i = 0; i < n; ++i) {
        const std::string score = std::to_string(i);
        samples.push_back(timed([&] {
            dispatcher.call("ZADD", {"bench:dispatch", score, member_name(i)});
        }));
        samples.push_back(timed([&] {
            dispatcher.call("ZRANGEBYSCORE", {"bench:dispatch", "-inf", score,
                                              "LIMIT", "0", "10", "WITHSCORES"});
        }));
    }
    return summarize(samples);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t n = 100'000;
    if (argc > 1) {
        n = static_cast<std::size_t>(std::atol(argv[1]));
        if (n == 0) n = 100'000;
    }

    fprintf(stdout, "kvmock benchmark: %zu operations per workload\n", n);

    kvmock::EngineConfig cfg;
    cfg.random_seed = 42;
    kvmock::Engine engine{cfg};
    kvmock::command::CommandDispatcher dispatcher{engine};
    std::mt19937_64 rng{cfg.random_seed};

    const auto zadd     = bench_zadd(engine, n, rng);
    const auto zrank    = bench_zrank(engine, n, rng);
    const auto dispatch = bench_dispatch(dispatcher, n);

    report("ZADD (direct)", zadd);
    report("ZRANK (direct)", zrank);
    report("ZADD + ZRANGEBYSCORE (dispatcher)", dispatch);

    return 0;
}
