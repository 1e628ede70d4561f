#include <conduit/support/log.hpp>
#include <conduit/support/str.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit::support::log {

Logger make_logger(const std::string& name, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(name);
        logger->set_pattern(kDefaultPattern);
    }
    logger->set_level(level);
    return logger;
}

spdlog::level::level_enum level_from_string(std::string_view name)
{
    const auto lower = str::to_lower(str::trim(name));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace conduit::support::log
