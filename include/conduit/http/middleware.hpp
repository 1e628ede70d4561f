#pragma once

#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

namespace conduit::http {

// Produces a response or throws.
using Handler = std::function<Response(const Request&)>;

// Inspects the request, calls `next` to continue (or not), inspects the response.
using Middleware = std::function<Response(const Request&, const Handler& next)>;

class MiddlewareChain {
public:
    MiddlewareChain() = default;
    MiddlewareChain(std::initializer_list<Middleware> middlewares) : middlewares_(middlewares) {}

    void add(Middleware mw) { middlewares_.push_back(std::move(mw)); }

    // Wraps `innermost` so the first middleware added runs outermost.
    [[nodiscard]] Handler chain(Handler innermost) const
    {
        Handler next = std::move(innermost);
        for (auto it = middlewares_.rbegin(); it != middlewares_.rend(); ++it) {
            next = [mw = *it, inner = std::move(next)](const Request& req) {
                return mw(req, inner);
            };
        }
        return next;
    }

    Response run(const Request& request, Handler last) const
    {
        return chain(std::move(last))(request);
    }

    [[nodiscard]] bool empty() const { return middlewares_.empty(); }
    [[nodiscard]] std::size_t size() const { return middlewares_.size(); }

private:
    std::vector<Middleware> middlewares_;
};

} // namespace conduit::http
