#pragma once

#include <conduit/http/middleware.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace app::Http::Middleware {

// Tags every response with X-Request-Id, keeping the client's id when it sent one.
inline conduit::http::Middleware RequestId()
{
    auto counter = std::make_shared<std::atomic<std::uint64_t>>(0);
    return [counter](const conduit::http::Request& req, const conduit::http::Handler& next) {
        auto id = req.header("x-request-id");
        if (id.empty()) {
            id = std::to_string(++*counter);
        }
        auto res = next(req);
        res.set_header("X-Request-Id", id);
        return res;
    };
}

} // namespace app::Http::Middleware
