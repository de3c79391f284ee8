#include "api_server.hpp"
#include "body_reader.hpp"
#include "content_negotiator.hpp"
#include "param_pipeline.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http {

api_server::api_server() : api_server(server_options{}) {
}

api_server::api_server(server_options options) : options_(options) {
    options_.validate();
}

api_server::api_server(server_options options, const handler_table& handlers) : api_server(options) {
    for (const auto& [method_name, routes] : handlers) {
        for (const auto& [path, callback] : routes) {
            add(method_name, path, callback);
        }
    }
}

void api_server::add(std::string_view method, const std::string& path, handler callback, handler_options options) {
    registry_.add(method, path, std::move(callback), std::move(options));
}

bool api_server::remove(std::string_view method, const std::string& path) {
    return registry_.remove(method, path);
}

void api_server::get(const std::string& path, handler callback, handler_options options) {
    add("GET", path, std::move(callback), std::move(options));
}

void api_server::post(const std::string& path, handler callback, handler_options options) {
    add("POST", path, std::move(callback), std::move(options));
}

void api_server::put(const std::string& path, handler callback, handler_options options) {
    add("PUT", path, std::move(callback), std::move(options));
}

void api_server::del(const std::string& path, handler callback, handler_options options) {
    add("DELETE", path, std::move(callback), std::move(options));
}

void api_server::set_fallback_handler(handler callback) {
    fallback_handler_ = std::move(callback);
}

void api_server::set_auth_handler(auth_handler callback) {
    auth_handler_ = std::move(callback);
}

void api_server::set_upgrade_handler(upgrade_handler callback) {
    upgrade_handler_ = std::move(callback);
}

void api_server::set_body_read_timeout(std::chrono::milliseconds timeout) {
    server_options updated = options_;
    updated.body_read_timeout = timeout;
    updated.validate();
    options_ = updated;
}

void api_server::set_max_body_size(size_t size) {
    options_.max_body_size = size;
}

void api_server::set_pretty_print_json(bool pretty) {
    options_.pretty_print_json = pretty;
}

void api_server::send_error(response& res, const request_error& error) {
    if (res.has_responded()) return;
    res.error(error.status, error.detail);
}

awaitable<void> api_server::handle(std::shared_ptr<http_request> request,
                                   std::shared_ptr<body_stream> body,
                                   std::shared_ptr<response_sink> sink) {
    request->log("API SERVER REQUEST");

    auto res = std::make_shared<response>(std::move(sink), options_.pretty_print_json);

    // read the whole body under the size and time limits
    auto reader = std::make_shared<body_reader>(*request, options_.max_body_size, options_.body_read_timeout);
    auto payload = co_await reader->read(std::move(body), [res](const request_error& error) {
        send_error(*res, error);
    });
    if (!payload) co_return;

    content_negotiator negotiator(*request);
    if (auto error = negotiator.negotiate(*payload)) {
        send_error(*res, *error);
        co_return;
    }

    // resolve the route
    static const handler_options no_options{};
    const auto request_method = request->get_method();
    const auto path = request->get_path();

    auto match = registry_.lookup(request_method, path);
    const handler* target = nullptr;
    const handler_options* options = &no_options;
    nlohmann::json path_params = nlohmann::json::object();

    if (match) {
        target = &match->entry->callback;
        options = &match->entry->options;
        path_params = std::move(match->path_params);
    } else if (fallback_handler_) {
        LOG_DEBUG("no route for {} {}, using fallback handler", request->get_method_name(), path);
        target = &fallback_handler_;
    } else if (registry_.has_other_method_match(request_method, path)) {
        LOG_DEBUG("no route for {} {}, but other methods match", request->get_method_name(), path);
        res->error(http_response::status::not_allowed);
        co_return;
    } else {
        LOG_DEBUG("no route for {} {}", request->get_method_name(), path);
        res->error(http_response::status::not_found);
        co_return;
    }

    request_context context(request);

    // authentication runs before any parameter is parsed
    if (auth_handler_) {
        bool authenticated = false;
        std::optional<std::string> failure;
        try {
            authenticated = co_await auth_handler_.invoke(context, *res);
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        if (failure) {
            LOG_ERROR("authentication handler failed (resource: {}): {}", path, *failure);
            send_error(*res, {http_response::status::internal_server_error, ""});
            co_return;
        }
        if (!authenticated) {
            LOG_DEBUG("Authentication failed (resource: {})", path);
            co_return;
        }
    }

    param_pipeline pipeline(context, *options);
    if (auto error = co_await pipeline.run(std::move(path_params), negotiator, *payload)) {
        send_error(*res, *error);
        co_return;
    }

    std::optional<std::string> failure;
    try {
        co_await target->invoke(context, *res);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (failure) {
        LOG_ERROR("Request handler failed (resource: {}): {}", path, *failure);
        send_error(*res, {http_response::status::internal_server_error, "Request handler fails to execute."});
        co_return;
    }

    LOG_DEBUG("Request successfully processed (resource: {})", path);
}

awaitable<bool> api_server::handle_upgrade(std::shared_ptr<http_request> request,
                                           std::shared_ptr<connection> socket,
                                           std::string head) {
    request->log("API SERVER UPGRADE");

    request_context context(request);
    context.url_params = content_negotiator(*request).parse_url_params();
    context.params = nlohmann::json::object();
    context.assign_params(context.url_params, param_source::query);

    // upgrade requests have no response sink, the raw connection is the only channel
    response res(nullptr, options_.pretty_print_json);

    std::optional<std::string> failure;
    bool accepted = false;
    try {
        accepted = !auth_handler_ || co_await auth_handler_.invoke(context, res);
        if (accepted && upgrade_handler_) {
            accepted = co_await upgrade_handler_.invoke(context, socket, head);
            if (accepted) {
                LOG_DEBUG("Upgrade successfully processed (resource: {})", context.get_path());
            }
            co_return accepted;
        }
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    if (failure) {
        LOG_ERROR("upgrade failed (resource: {}): {}", context.get_path(), *failure);
    } else if (!accepted) {
        LOG_DEBUG("Authentication failed (resource: {})", context.get_path());
    } else {
        LOG_DEBUG("no upgrade handler installed (resource: {})", context.get_path());
    }

    socket->destroy();
    co_return false;
}

} // namespace apisrv::http
