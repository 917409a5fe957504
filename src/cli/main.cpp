#include "command/dispatcher.hpp"
#include "command/reply.hpp"
#include "command/tokenizer.hpp"
#include "common/engine_config.hpp"
#include "common/error.hpp"
#include "common/logger.hpp"
#include "engine/engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_error(const kvmock::Error& e) {
    fprintf(stdout, "(error) %s: %s\n",
            std::string{kvmock::to_string(e.kind())}.c_str(), e.what());
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    kvmock::EngineConfig cfg;
    try {
        cfg = kvmock::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const auto level = kvmock::parse_log_level(cfg.log_level);
    kvmock::init_default_logger(level);
    auto logger = kvmock::make_component_logger("engine", level);

    kvmock::Engine engine{cfg, logger};
    kvmock::command::CommandDispatcher dispatcher{engine, logger};

    fprintf(stdout, "kvmock (%s convention). Type commands (SET k v, ZADD z ..., SCAN 0). "
            ".sweep expires keys, .quit or Ctrl+D exits.\n",
            cfg.strict() ? "strict" : "legacy");

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        try {
            std::vector<std::string> tokens = kvmock::command::tokenize(line);
            if (tokens.empty()) {
                continue;
            }

            if (tokens.front() == ".quit") {
                break;
            }
            if (tokens.front() == ".sweep") {
                fprintf(stdout, "(integer) %zu\n", engine.do_expire());
                continue;
            }

            const std::string name = tokens.front();
            tokens.erase(tokens.begin());

            const auto reply = dispatcher.call(name, tokens);
            fprintf(stdout, "%s\n", kvmock::command::format_reply(reply).c_str());
        } catch (const kvmock::Error& e) {
            print_error(e);
        } catch (const std::exception& e) {
            spdlog::error("kvmock-cli: {}", e.what());
        }
    }

    return 0;
}
