#include <conduit/conduit.hpp>

#include <stdexcept>

namespace {

// Example of a failure type carrying diagnostics but no HTTP status (reported as 500).
class UpstreamUnavailable : public std::runtime_error, public conduit::http::Debuggable {
public:
    explicit UpstreamUnavailable(std::string service)
        : std::runtime_error("upstream " + service + " unavailable"), service_(std::move(service)) {}

    std::string type_identifier() const override { return "UpstreamUnavailable"; }
    std::string reason() const override { return "The " + service_ + " service did not answer"; }
    std::string identifier() const override { return "timeout"; }
    std::vector<std::string> possible_causes() const override { return {"The service is down", "Network partition"}; }
    std::vector<std::string> suggested_fixes() const override { return {"Check the " + service_ + " health endpoint"}; }

private:
    std::string service_;
};

} // namespace

void register_api_routes(conduit::core::Application& app)
{
    using conduit::http::Abort;
    using conduit::http::Request;
    using conduit::http::Response;
    using conduit::http::StatusCode;

    auto api = app.router().group("/api");

    api.get("/status", [](const Request&) {
        return Response::json({{"status", "ok"}, {"version", "1.0.0"}});
    });

    api.get("/config", [&app](const Request&) {
        return Response::json({
            {"app_name", app.config().get("app.name")},
            {"env", app.environment().name()},
        });
    });

    api.post("/echo", [](const Request& req) {
        if (!req.is_json()) {
            throw Abort(StatusCode::UnsupportedMediaType, Abort::Details{
                .metadata = {{"expected", "application/json"}},
                .suggested_fixes = {"Send the body with Content-Type: application/json"},
            });
        }
        return Response::json(req.json());
    });

    api.get("/reports", [](const Request&) -> Response {
        throw UpstreamUnavailable("reporting");
    });
}
