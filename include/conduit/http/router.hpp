// include/conduit/http/router.hpp
#pragma once
#include <conduit/http/middleware.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/http/route_resolver.hpp>

#include <deque>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace conduit::http {

class Router : public RouteResolver {
public:
    struct Route {
        std::string method;
        std::string pattern_str;
        std::regex pattern;
        std::vector<std::string> param_names;
        Handler handler;
        std::string route_name;
        std::vector<Middleware> middlewares;

        [[nodiscard]] bool matches(const std::string& req_method, const std::string& path) const;
        [[nodiscard]] std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;

        Route& name(std::string name)
        {
            route_name = std::move(name);
            return *this;
        }

        Route& middleware(Middleware mw)
        {
            middlewares.push_back(std::move(mw));
            return *this;
        }
    };

    // Basic routing
    Route& add_route(const std::string& method, const std::string& pattern, Handler handler);

    Route& match(const std::vector<std::string>& methods, const std::string& pattern, Handler handler);
    Route& any(const std::string& pattern, Handler handler);

    Route& get(const std::string& pattern, Handler handler) { return add_route("GET", pattern, std::move(handler)); }
    Route& post(const std::string& pattern, Handler handler) { return add_route("POST", pattern, std::move(handler)); }
    Route& put(const std::string& pattern, Handler handler) { return add_route("PUT", pattern, std::move(handler)); }
    Route& patch(const std::string& pattern, Handler handler) { return add_route("PATCH", pattern, std::move(handler)); }
    Route& delete_(const std::string& pattern, Handler handler) { return add_route("DELETE", pattern, std::move(handler)); }
    Route& options(const std::string& pattern, Handler handler) { return add_route("OPTIONS", pattern, std::move(handler)); }

    // Route groups share a path prefix and middleware.
    class Group {
    public:
        Group(Router& router, std::string prefix, std::vector<Middleware> middleware = {})
            : router_(router), prefix_(normalize_path(prefix)), middleware_(std::move(middleware)) {}

        Group& middleware(Middleware mw)
        {
            middleware_.push_back(std::move(mw));
            return *this;
        }

        Group group(const std::string& prefix) const { return Group{router_, join_paths(prefix_, prefix), middleware_}; }

        Group& group(const std::function<void(Group&)>& callback)
        {
            callback(*this);
            return *this;
        }

        Route& get(const std::string& pattern, Handler handler) { return add_route("GET", pattern, std::move(handler)); }
        Route& post(const std::string& pattern, Handler handler) { return add_route("POST", pattern, std::move(handler)); }
        Route& put(const std::string& pattern, Handler handler) { return add_route("PUT", pattern, std::move(handler)); }
        Route& patch(const std::string& pattern, Handler handler) { return add_route("PATCH", pattern, std::move(handler)); }
        Route& delete_(const std::string& pattern, Handler handler) { return add_route("DELETE", pattern, std::move(handler)); }
        Route& options(const std::string& pattern, Handler handler) { return add_route("OPTIONS", pattern, std::move(handler)); }

        Route& add_route(const std::string& method, const std::string& pattern, Handler handler);

    private:
        Router& router_;
        std::string prefix_;
        std::vector<Middleware> middleware_;
    };

    Group group(const std::string& prefix = "", std::vector<Middleware> middleware = {})
    {
        return Group{*this, prefix, std::move(middleware)};
    }

    [[nodiscard]] std::optional<Handler> route(const Request& request) const override;

    // URL generation for named routes; empty when no route carries `name`.
    [[nodiscard]] std::string url_for(const std::string& name,
                                      const std::unordered_map<std::string, std::string>& params = {}) const;

    [[nodiscard]] std::size_t size() const { return routes_.size(); }

    static std::string normalize_path(const std::string& path);
    static std::string join_paths(const std::string& a, const std::string& b);

private:
    [[nodiscard]] static std::pair<std::vector<std::string>, std::string> compile_pattern(const std::string& pattern);

    // deque keeps Route& handed out by add_route valid across later registrations
    std::deque<Route> routes_;
};

} // namespace conduit::http
