#include <conduit/core/kernel.hpp>
#include <conduit/http/protocol.hpp>

#include <stdexcept>

namespace conduit::core {

Kernel::Kernel(const http::RouteResolver& router, http::ErrorNormalizer normalizer, support::log::Logger logger)
    : router_(router)
    , normalizer_(std::move(normalizer))
    , logger_(std::move(logger))
{
}

http::MiddlewareChain& Kernel::middleware()
{
    if (booted_) {
        throw std::logic_error("Kernel middleware cannot change after boot");
    }
    return middleware_;
}

void Kernel::boot()
{
    if (booted_) {
        return;
    }
    composed_ = middleware_.chain([this](const http::Request& req) { return dispatch(req); });
    booted_ = true;
}

http::Response Kernel::handle(http::Request request) const
{
    logger_->info("{} {}", request.method_name(), request.path());

    const http::Method original_method = http::normalize_method(request);

    http::Response response;
    try {
        if (booted_) {
            response = composed_(request);
        } else {
            response = middleware_.run(request, [this](const http::Request& req) { return dispatch(req); });
        }
        normalizer_.inspect(response);
    } catch (...) {
        try {
            response = normalizer_.normalize(std::current_exception(), request);
        } catch (const std::exception& e) {
            logger_->critical("Error normalization failed: {}", e.what());
            response = internal_error();
        } catch (...) {
            logger_->critical("Error normalization failed with a non-standard exception");
            response = internal_error();
        }
    }

    http::finalize_response(original_method, response);
    return response;
}

http::Response Kernel::internal_error()
{
    return http::Response{http::StatusCode::InternalServerError,
                          http::Headers{{"Content-Type", "application/json; charset=utf-8"}},
                          R"({"error":true,"reason":"Internal Server Error"})"};
}

http::Response Kernel::dispatch(const http::Request& request) const
{
    if (auto handler = router_.route(request)) {
        return (*handler)(request);
    }
    return fallback_(request);
}

} // namespace conduit::core
