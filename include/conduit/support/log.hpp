#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace conduit::support::log {

using Logger = std::shared_ptr<spdlog::logger>;

inline constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Colored stdout logger. Returns the already registered logger when `name` is taken.
Logger make_logger(const std::string& name, spdlog::level::level_enum level = spdlog::level::info);

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"; anything else is info.
spdlog::level::level_enum level_from_string(std::string_view name);

} // namespace conduit::support::log
