#pragma once

#include <conduit/http/middleware.hpp>
#include <conduit/support/log.hpp>

namespace app::Http::Middleware {

// Access log line per request: "[Request] GET /users - 10.0.0.7 - 200".
// Failures are logged and rethrown so the kernel still turns them into a response.
inline conduit::http::Middleware RequestLogger(conduit::support::log::Logger logger)
{
    return [logger = std::move(logger)](const conduit::http::Request& req, const conduit::http::Handler& next) {
        const auto ip = req.header("x-remote-addr", "unknown");
        try {
            auto res = next(req);
            logger->info("[Request] {} {} - {} - {}", req.method_name(), req.path(), ip,
                         conduit::http::code(res.status()));
            return res;
        } catch (const std::exception& e) {
            logger->info("[Request] {} {} - {} - failed ({})", req.method_name(), req.path(), ip, e.what());
            throw;
        }
    };
}

} // namespace app::Http::Middleware
