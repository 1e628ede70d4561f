#include <conduit/core/application.hpp>
#include <conduit/http/error_view.hpp>
#include <conduit/http/server.hpp>
#include <conduit/support/env.hpp>
#include <conduit/support/view.hpp>

#include <utility>

namespace conduit::core {

namespace {

// Environment variables win over config files, config files over defaults.
void resolve(Config& config, const std::string& key, const std::string& env_var, const std::string& fallback)
{
    const auto from_env = support::Env::get(env_var);
    if (!from_env.empty()) {
        config.set(key, from_env);
    } else if (!config.has(key)) {
        config.set(key, fallback);
    }
}

void apply_defaults(Config& config)
{
    resolve(config, "app.name", "APP_NAME", "Conduit Application");
    resolve(config, "app.env", "APP_ENV", "local");
    resolve(config, "app.url", "APP_URL", "http://localhost:8080");
    resolve(config, "app.host", "APP_HOST", "0.0.0.0");
    resolve(config, "log.level", "LOG_LEVEL", "info");
    resolve(config, "view.paths", "VIEW_PATHS", "resources/views");
}

} // namespace

Application::Application() : Application(Options{}) {}

Application::Application(Options options) : Application(load_configuration(options)) {}

Application::Application(Config config)
    : config_(std::move(config))
    , logger_(support::log::make_logger(config_.get("app.logger", "conduit"),
                                        support::log::level_from_string(config_.get("log.level", "info"))))
    , environment_(Environment::parse(config_.get("app.env")))
    , view_engine_(std::make_shared<support::View>(config_.get("view.paths", "resources/views")))
    , kernel_(router_,
              http::ErrorNormalizer(environment_, std::make_shared<http::TemplateErrorView>(view_engine_, environment_), logger_),
              logger_)
{
    for (const auto& error : config_.load_errors()) {
        logger_->error("Configuration not loaded: {}", error);
    }
}

Config Application::load_configuration(const Options& options)
{
    support::Env::load(options.env_file);

    Config config;
    config.load_from_path(options.config_path);
    apply_defaults(config);
    return config;
}

void Application::boot()
{
    if (booted_) {
        return;
    }
    for (auto& provider : service_providers_) {
        provider->boot();
    }
    kernel_.boot();
    booted_ = true;
}

void Application::run(int port)
{
    boot();

    const auto host = config_.get("app.host", "0.0.0.0");
    if (is_production()) {
        logger_->info("Production server started on http://{}:{}", host, port);
    } else {
        logger_->info("{} server started on http://{}:{}", environment_.name(), host, port);
    }

    http::Server server([this](http::Request req) { return handle(std::move(req)); }, logger_);
    server.listen(host, port);
}

} // namespace conduit::core
