#include <conduit/http/router.hpp>
#include <conduit/support/str.hpp>

namespace conduit::http {

namespace {

std::string normalize_request_path(const std::string& path)
{
    std::string normalized = path;
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (normalized.empty() || normalized.front() != '/') {
        normalized.insert(normalized.begin(), '/');
    }
    return normalized;
}

std::string escape_regex(const std::string& literal)
{
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

bool Router::Route::matches(const std::string& req_method, const std::string& path) const
{
    if (method != req_method) {
        return false;
    }
    return std::regex_match(normalize_request_path(path), pattern);
}

std::unordered_map<std::string, std::string> Router::Route::extract_params(const std::string& path) const
{
    std::unordered_map<std::string, std::string> params;
    const auto normalized = normalize_request_path(path);

    std::smatch matches;
    if (std::regex_match(normalized, matches, pattern)) {
        for (std::size_t i = 0; i < param_names.size() && i + 1 < matches.size(); ++i) {
            params[param_names[i]] = matches[i + 1].str();
        }
    }
    return params;
}

Router::Route& Router::add_route(const std::string& method, const std::string& pattern, Handler handler)
{
    auto [param_names, regex_pattern] = compile_pattern(pattern);

    routes_.push_back(Route{
        .method = method,
        .pattern_str = normalize_path(pattern),
        .pattern = std::regex(regex_pattern),
        .param_names = std::move(param_names),
        .handler = std::move(handler),
        .route_name = {},
        .middlewares = {},
    });
    return routes_.back();
}

Router::Route& Router::match(const std::vector<std::string>& methods, const std::string& pattern, Handler handler)
{
    if (methods.empty()) {
        return add_route("GET", pattern, std::move(handler));
    }
    Route& first = add_route(methods.front(), pattern, handler);
    for (std::size_t i = 1; i < methods.size(); ++i) {
        add_route(methods[i], pattern, handler);
    }
    return first;
}

Router::Route& Router::any(const std::string& pattern, Handler handler)
{
    return match({"GET", "POST", "PUT", "PATCH", "DELETE", "OPTIONS"}, pattern, std::move(handler));
}

Router::Route& Router::Group::add_route(const std::string& method, const std::string& pattern, Handler handler)
{
    auto& route = router_.add_route(method, join_paths(prefix_, pattern), std::move(handler));
    route.middlewares.insert(route.middlewares.begin(), middleware_.begin(), middleware_.end());
    return route;
}

std::optional<Handler> Router::route(const Request& request) const
{
    for (const auto& route : routes_) {
        if (!route.matches(request.method_name(), request.path())) {
            continue;
        }

        const Route* matched = &route;
        return Handler{[matched](const Request& req) {
            Request bound = req;
            for (const auto& [key, value] : matched->extract_params(req.path())) {
                bound.set_param(key, value);
            }

            if (matched->middlewares.empty()) {
                return matched->handler(bound);
            }
            MiddlewareChain chain;
            for (const auto& mw : matched->middlewares) {
                chain.add(mw);
            }
            return chain.run(bound, matched->handler);
        }};
    }
    return std::nullopt;
}

std::string Router::url_for(const std::string& name, const std::unordered_map<std::string, std::string>& params) const
{
    for (const auto& route : routes_) {
        if (route.route_name != name) {
            continue;
        }

        std::string out = route.pattern_str;
        for (const auto& [key, value] : params) {
            const std::string token = "{" + key + "}";
            std::size_t pos = 0;
            while ((pos = out.find(token, pos)) != std::string::npos) {
                out.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        if (out.size() > 1 && out.back() == '/') {
            out.pop_back();
        }
        return out;
    }
    return "";
}

std::string Router::normalize_path(const std::string& path)
{
    if (path.empty()) return "/";
    if (path.front() != '/') return "/" + path;
    return path;
}

std::string Router::join_paths(const std::string& a, const std::string& b)
{
    if (a.empty() || a == "/") return normalize_path(b);
    if (b.empty() || b == "/") return a;
    return a + normalize_path(b);
}

std::pair<std::vector<std::string>, std::string> Router::compile_pattern(const std::string& pattern)
{
    std::vector<std::string> param_names;
    std::string regex_pattern = "^";

    for (const auto& segment : support::str::split(pattern, '/')) {
        if (segment.empty()) continue;

        if (segment.front() == '{' && segment.back() == '}') {
            param_names.push_back(segment.substr(1, segment.size() - 2));
            regex_pattern += "/([^/]+)";
        } else {
            regex_pattern += "/" + escape_regex(segment);
        }
    }

    if (regex_pattern == "^") {
        regex_pattern = "^/$";
    } else {
        // trailing slash is optional for non-root patterns
        regex_pattern += "/?$";
    }
    return {param_names, regex_pattern};
}

} // namespace conduit::http
