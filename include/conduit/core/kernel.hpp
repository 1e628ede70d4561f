#pragma once

#include <conduit/http/error_normalizer.hpp>
#include <conduit/http/fallback.hpp>
#include <conduit/http/middleware.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/http/route_resolver.hpp>
#include <conduit/support/log.hpp>

namespace conduit::core {

// Request dispatch pipeline:
//   method normalization -> middleware chain -> router (or fallback)
//   -> error normalization on failure -> HEAD body stripping.
//
// Every call to handle() yields a response; no exception leaves it.
// Once booted the kernel is immutable and handle() may run concurrently.
class Kernel {
public:
    // `router` is not owned and must outlive the kernel.
    Kernel(const http::RouteResolver& router, http::ErrorNormalizer normalizer, support::log::Logger logger);

    // Closures built by boot() refer to this kernel.
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Global middleware, first added runs outermost. Throws std::logic_error after boot().
    http::MiddlewareChain& middleware();
    const http::MiddlewareChain& middleware() const { return middleware_; }

    // Composes the middleware chain once. Without boot() it is composed per request.
    void boot();
    bool booted() const { return booted_; }

    http::Response handle(http::Request request) const;

    const http::ErrorNormalizer& error_normalizer() const { return normalizer_; }

private:
    http::Response dispatch(const http::Request& request) const;

    // Answer when the error normalizer itself failed.
    static http::Response internal_error();

    const http::RouteResolver& router_;
    http::ErrorNormalizer normalizer_;
    support::log::Logger logger_;
    http::FallbackHandler fallback_;
    http::MiddlewareChain middleware_;
    http::Handler composed_;
    bool booted_ = false;
};

} // namespace conduit::core
