#include "common/logger.hpp"

#include "common/strings.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace kvmock {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%f] [%n] [%^%l%$] %v";

// Registry lookup first: spdlog throws when a name is registered twice.
std::shared_ptr<spdlog::logger> obtain(const std::string& name,
                                       spdlog::level::level_enum level) {
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
    }
    logger->set_pattern(kPattern);
    logger->set_level(level);
    return logger;
}

} // namespace

void init_default_logger(spdlog::level::level_enum level) {
    spdlog::set_default_logger(obtain("kvmock", level));
}

std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level)
{
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return obtain(name, level);
}

spdlog::level::level_enum parse_log_level(const std::string& s) {
    const std::string name = to_lower(s);
    // from_str answers `off` for anything it does not know.
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace kvmock
