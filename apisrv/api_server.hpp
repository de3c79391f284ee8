#ifndef APISRV_API_SERVER_HPP
#define APISRV_API_SERVER_HPP

// Server core
#include <apisrv/http/server/api_server.hpp>
#include <apisrv/http/server/server_options.hpp>
#include <apisrv/http/server/request_context.hpp>
#include <apisrv/http/server/response.hpp>
#include <apisrv/http/server/transport.hpp>

// Routing
#include <apisrv/http/server/routing/handler_registry.hpp>
#include <apisrv/http/server/routing/path_template.hpp>
#include <apisrv/http/server/routing/path_matcher.hpp>

// Common HTTP types needed by the server
#include <apisrv/http/common/http_request.hpp>
#include <apisrv/http/common/http_response.hpp>

// Logging
#include <apisrv/util/logger.hpp>

#endif // APISRV_API_SERVER_HPP
