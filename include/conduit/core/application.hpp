// include/conduit/core/application.hpp
#pragma once
#include <conduit/core/config.hpp>
#include <conduit/core/environment.hpp>
#include <conduit/core/kernel.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/http/router.hpp>
#include <conduit/support/log.hpp>
#include <conduit/support/view_engine.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace conduit::core {

class Application;

// Base service provider interface
class ServiceProvider {
public:
    explicit ServiceProvider(Application& app) : app_(app) {}
    virtual ~ServiceProvider() = default;

    virtual void register_services() = 0;
    virtual void boot() {}

protected:
    Application& app_;
};

class Application {
public:
    struct Options {
        std::filesystem::path config_path = "config";
        std::filesystem::path env_file = ".env";
    };

    Application();
    explicit Application(Options options);

    // Uses `config` as is: no .env or config directory is read.
    explicit Application(Config config);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    Config& config() { return config_; }
    const Config& config() const { return config_; }

    http::Router& router() { return router_; }
    const http::Router& router() const { return router_; }

    Kernel& kernel() { return kernel_; }
    const Kernel& kernel() const { return kernel_; }

    const Environment& environment() const { return environment_; }
    const support::log::Logger& logger() const { return logger_; }
    const std::shared_ptr<support::ViewEngine>& views() const { return view_engine_; }

    http::Response handle(http::Request request) const { return kernel_.handle(std::move(request)); }

    template<typename Provider>
    void register_provider()
    {
        auto provider = std::make_shared<Provider>(*this);
        provider->register_services();
        service_providers_.push_back(std::move(provider));
    }

    // Boots providers, then freezes the kernel's middleware chain.
    void boot();

    // Boots and serves until the process ends.
    void run(int port = 8080);

    bool is_production() const { return environment_.is_production(); }

private:
    static Config load_configuration(const Options& options);

    Config config_;
    support::log::Logger logger_;
    Environment environment_;
    http::Router router_;
    std::shared_ptr<support::ViewEngine> view_engine_;
    Kernel kernel_;
    std::vector<std::shared_ptr<ServiceProvider>> service_providers_;
    bool booted_ = false;
};

} // namespace conduit::core
