#pragma once

#include <conduit/core/application.hpp>
#include <conduit/core/config.hpp>
#include <conduit/core/environment.hpp>
#include <conduit/core/kernel.hpp>

#include <conduit/http/abort.hpp>
#include <conduit/http/error_normalizer.hpp>
#include <conduit/http/error_view.hpp>
#include <conduit/http/fallback.hpp>
#include <conduit/http/middleware.hpp>
#include <conduit/http/protocol.hpp>
#include <conduit/http/request.hpp>
#include <conduit/http/response.hpp>
#include <conduit/http/route_resolver.hpp>
#include <conduit/http/router.hpp>
#include <conduit/http/server.hpp>

#include <conduit/support/env.hpp>
#include <conduit/support/log.hpp>
#include <conduit/support/str.hpp>
#include <conduit/support/view.hpp>
