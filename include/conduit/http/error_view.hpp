#pragma once

#include <conduit/core/environment.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/http/status_code.hpp>
#include <conduit/support/view_engine.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <memory>
#include <string>

namespace conduit::http {

// Renders a failure as a markup document for clients that prefer HTML.
class ErrorView {
public:
    virtual ~ErrorView() = default;

    // `failure` is null when the thrown value was not a std::exception.
    virtual Response render(const std::exception* failure, StatusCode status, const Request& request) const = 0;
};

// Renders the "errors.error" template through a view engine, falling back to a
// built-in page when the engine has no such template.
class TemplateErrorView : public ErrorView {
public:
    TemplateErrorView(std::shared_ptr<support::ViewEngine> engine, core::Environment environment,
                      std::string template_name = "errors.error");

    Response render(const std::exception* failure, StatusCode status, const Request& request) const override;

    // Template context. Diagnostics are left out in production.
    static nlohmann::json context(const std::exception* failure, StatusCode status, const core::Environment& environment);

    static const char* default_template();

private:
    std::shared_ptr<support::ViewEngine> engine_;
    core::Environment environment_;
    std::string template_name_;
};

} // namespace conduit::http
