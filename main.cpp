#include <conduit/conduit.hpp>
#include "app/Providers/MiddlewareServiceProvider.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

// Route registration functions from routes/
void register_web_routes(conduit::core::Application& app);
void register_api_routes(conduit::core::Application& app);

int main(int argc, char** argv)
{
    conduit::core::Application app;

    app.register_provider<::app::Providers::MiddlewareServiceProvider>();

    register_web_routes(app);
    register_api_routes(app);

    int port = app.config().get_int("app.port", 8000);
    if (const auto env_port = conduit::support::Env::get("APP_PORT"); !env_port.empty()) {
        try {
            port = std::stoi(env_port);
        } catch (const std::logic_error&) {
            app.logger()->warn("Ignoring invalid APP_PORT '{}'", env_port);
        }
    }
    if (argc > 1) {
        try {
            port = std::stoi(argv[1]);
        } catch (const std::logic_error&) {
            std::cerr << "Invalid port: " << argv[1] << "\n";
            return 1;
        }
    }

    try {
        app.run(port);
    } catch (const std::exception& e) {
        app.logger()->critical("Server stopped: {}", e.what());
        return 1;
    }
    return 0;
}
