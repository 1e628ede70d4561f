#include <conduit/conduit.hpp>

#include <iostream>
#include <utility>

int main()
{
    conduit::core::Config config;
    config.set("app.env", "development");
    conduit::core::Application app(std::move(config));

    app.router().get("/", [](const conduit::http::Request&) {
        return conduit::http::Response::text("Hello from conduit");
    });
    app.boot();

    for (const auto* method : {"GET", "HEAD", "OPTIONS", "PROPFIND"}) {
        conduit::http::Request req(method, "/");
        std::cout << app.handle(req).to_string() << "\n\n";
    }

    conduit::http::Request missing("GET", "/missing");
    missing.set_header("Accept", "application/json");
    std::cout << app.handle(missing).to_string() << "\n";
    return 0;
}
