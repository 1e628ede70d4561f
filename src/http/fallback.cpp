#include <conduit/http/fallback.hpp>
#include <conduit/http/abort.hpp>

namespace conduit::http {

Response FallbackHandler::operator()(const Request& request) const
{
    switch (request.method()) {
        case Method::Get:
        case Method::Post:
        case Method::Put:
        case Method::Patch:
        case Method::Delete:
            throw Abort::not_found();
        case Method::Options:
            return Response{StatusCode::OK, Headers{{"Allow", "OPTIONS"}}};
        default:
            return Response{StatusCode::NotImplemented};
    }
}

} // namespace conduit::http
