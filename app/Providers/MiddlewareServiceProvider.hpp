// app/Providers/MiddlewareServiceProvider.hpp
#pragma once

#include <conduit/core/application.hpp>
#include <app/Http/Middleware/RequestId.hpp>
#include <app/Http/Middleware/RequestLogger.hpp>

namespace app::Providers {

class MiddlewareServiceProvider : public conduit::core::ServiceProvider {
public:
    using conduit::core::ServiceProvider::ServiceProvider;

    void register_services() override
    {
        // Outermost first: the logger sees the final status, including X-Request-Id responses.
        auto& chain = app_.kernel().middleware();
        chain.add(app::Http::Middleware::RequestLogger(app_.logger()));
        chain.add(app::Http::Middleware::RequestId());
    }
};

} // namespace app::Providers
