#include "common/engine_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>

namespace po = boost::program_options;

namespace kvmock {

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("strict",
            po::bool_switch()->default_value(false),
            "Use the strict client convention for flat ZADD arguments (score member)")
        ("blocking-timeout",
            po::value<int64_t>()->default_value(1000),
            "Seconds a blocking pop waits when called with timeout 0")
        ("blocking-poll-ms",
            po::value<int64_t>()->default_value(10),
            "Milliseconds between blocking pop retries")
        ("seed",
            po::value<uint64_t>()->default_value(0),
            "Seed for SPOP/SRANDMEMBER (0 = nondeterministic)")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical|off");
}

// ── parse_config ──────────────────────────────────────────────────────────────

EngineConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("kvmock options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    const auto timeout = vm["blocking-timeout"].as<int64_t>();
    const auto poll_ms = vm["blocking-poll-ms"].as<int64_t>();

    if (timeout < 0) {
        throw std::runtime_error(
            fmt::format("--blocking-timeout must be >= 0, got {}", timeout));
    }
    if (poll_ms <= 0) {
        throw std::runtime_error(
            fmt::format("--blocking-poll-ms must be > 0, got {}", poll_ms));
    }

    EngineConfig cfg;
    cfg.convention             = vm["strict"].as<bool>() ? Convention::Strict : Convention::Legacy;
    cfg.blocking_timeout       = std::chrono::seconds{timeout};
    cfg.blocking_poll_interval = std::chrono::milliseconds{poll_ms};
    cfg.random_seed            = vm["seed"].as<uint64_t>();
    cfg.log_level              = vm["log-level"].as<std::string>();
    return cfg;
}

} // namespace kvmock
