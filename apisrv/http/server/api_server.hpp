#ifndef APISRV_HTTP_API_SERVER_HPP
#define APISRV_HTTP_API_SERVER_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include "routing/handler_registry.hpp"
#include "../common/http_request.hpp"
#include "request_context.hpp"
#include "request_error.hpp"
#include "response.hpp"
#include "server_options.hpp"
#include "transport.hpp"
#include "../../util/types.hpp"

namespace apisrv::http {

// Authentication gate: returns false to stop the request, after writing its own response if any
using auth_handler = callback<bool, request_context&, response&>;

// Protocol upgrade: receives the raw connection and the bytes already read past the headers
using upgrade_handler = callback<bool, request_context&, std::shared_ptr<connection>, const std::string&>;

/**
 * JSON API server core. It owns the handler registry and drives every request delivered by
 * the transport through body reading, content negotiation, route resolution,
 * authentication, parameter building and finally the handler.
 */
class api_server {
public:
    // method -> (path template -> handler)
    using handler_table = std::map<std::string, std::map<std::string, handler>>;

    api_server();
    explicit api_server(server_options options);
    api_server(server_options options, const handler_table& handlers);

    virtual ~api_server() = default;

    // Route registration
    void add(std::string_view method, const std::string& path, handler callback, handler_options options = {});
    bool remove(std::string_view method, const std::string& path);

    void get(const std::string& path, handler callback, handler_options options = {});
    void post(const std::string& path, handler callback, handler_options options = {});
    void put(const std::string& path, handler callback, handler_options options = {});
    void del(const std::string& path, handler callback, handler_options options = {});  // delete is keyword

    // Handler for requests not matching any route, replacing the 404/405 answers
    void set_fallback_handler(handler callback);

    void set_auth_handler(auth_handler callback);

    void set_upgrade_handler(upgrade_handler callback);

    // Options
    void set_body_read_timeout(std::chrono::milliseconds timeout);
    void set_max_body_size(size_t size);
    void set_pretty_print_json(bool pretty);
    const server_options& get_options() const { return options_; }

    handler_registry& get_registry() { return registry_; }
    const handler_registry& get_registry() const { return registry_; }

    /**
     * Processes one request: reads its body from the stream and writes exactly one
     * response to the sink, unless the authentication handler stops the request.
     */
    awaitable<void> handle(std::shared_ptr<http_request> request,
                           std::shared_ptr<body_stream> body,
                           std::shared_ptr<response_sink> sink);

    /**
     * Processes a protocol upgrade request. The connection is destroyed unless the request
     * is authenticated and an upgrade handler is installed. Returns the upgrade handler
     * result.
     */
    awaitable<bool> handle_upgrade(std::shared_ptr<http_request> request,
                                   std::shared_ptr<connection> socket,
                                   std::string head);

private:
    static void send_error(response& res, const request_error& error);

    handler_registry registry_;
    server_options options_;
    handler fallback_handler_;
    auth_handler auth_handler_;
    upgrade_handler upgrade_handler_;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_API_SERVER_HPP
