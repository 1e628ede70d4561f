// include/conduit/http/request.hpp
#pragma once
#include <conduit/http/accept.hpp>
#include <conduit/http/headers.hpp>
#include <conduit/http/method.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace conduit::http {

class Request {
public:
    Request() = default;
    Request(Method method, std::string path);
    Request(std::string method, std::string path);

    // Method
    Method method() const { return method_; }
    const std::string& method_name() const { return method_name_; }
    void set_method(Method method);
    void set_method(std::string method);

    // Target
    const std::string& path() const { return path_; }
    const std::string& query_string() const { return query_string_; }
    void set_path(std::string path);
    void set_query_string(std::string query);
    std::string query(const std::string& key, std::string fallback = {}) const;

    // Headers
    const Headers& headers() const { return headers_; }
    void set_header(std::string name, std::string value);
    std::string header(std::string_view name, std::string fallback = {}) const;

    // Body
    const std::string& body() const { return body_; }
    void set_body(std::string body);

    nlohmann::json json() const;
    bool is_json() const;

    // Form fields from an urlencoded or JSON object body.
    const std::unordered_map<std::string, std::string>& form() const;
    std::optional<std::string> field(const std::string& name) const;
    void set_field(std::string name, std::string value);

    // Content negotiation
    AcceptList accept() const { return AcceptList::parse(header("accept")); }
    bool expects_json() const { return accept().prefers("json"); }

    // Path parameters (set by router)
    void set_param(const std::string& key, const std::string& value) { params_[key] = value; }
    std::string param(const std::string& key, std::string fallback = {}) const;
    const std::unordered_map<std::string, std::string>& params() const { return params_; }

private:
    void parse_form() const;

    Method method_ = Method::Get;
    std::string method_name_ = "GET";
    std::string path_ = "/";
    std::string query_string_;
    std::string body_;
    Headers headers_;

    std::unordered_map<std::string, std::string> explicit_fields_;
    mutable std::unordered_map<std::string, std::string> form_;
    mutable bool form_parsed_ = false;

    std::unordered_map<std::string, std::string> params_;
};

} // namespace conduit::http
