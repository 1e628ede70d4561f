#include <conduit/conduit.hpp>

void register_web_routes(conduit::core::Application& app)
{
    using conduit::http::Abort;
    using conduit::http::Request;
    using conduit::http::Response;

    auto& router = app.router();

    router.get("/", [](const Request&) {
        return Response::text("Welcome to Conduit!");
    }).name("web.home");

    auto users = router.group("/users");
    users.get("/", [](const Request&) {
        return Response::text("User Index");
    }).name("users.index");

    users.get("/{id}", [](const Request& req) {
        const auto id = req.param("id");
        if (id.empty() || id.find_first_not_of("0123456789") != std::string::npos) {
            throw Abort::not_found("No user with id " + id);
        }
        return Response::text("User Profile: " + id);
    }).name("users.show");

    // HTML forms reach this through POST with _method=DELETE.
    users.delete_("/{id}", [](const Request& req) {
        return Response::text("Deleted user " + req.param("id"));
    });
}
