#include "param_pipeline.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http {

param_pipeline::param_pipeline(request_context& context, const handler_options& options)
    : context_(context)
    , options_(options) {
}

awaitable<std::optional<request_error>> param_pipeline::apply_validator(const validator& check,
                                                                        nlohmann::json& params,
                                                                        const char* stage) {
    if (!check) {
        co_return std::nullopt;
    }

    nlohmann::json result;
    std::optional<std::string> failure;
    try {
        result = co_await check.invoke(params);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        // rejected without a message
        failure = "";
    }

    if (failure) {
        LOG_DEBUG("{} validator rejected the request: {}", stage, *failure);
        co_return request_error{http_response::status::bad_request, *failure};
    }

    if (!result.is_object()) {
        LOG_ERROR("{} validator returned a {} instead of an object", stage, result.type_name());
        co_return request_error{http_response::status::internal_server_error, ""};
    }

    params = std::move(result);
    co_return std::nullopt;
}

awaitable<std::optional<request_error>> param_pipeline::run(nlohmann::json path_params,
                                                            const content_negotiator& negotiator,
                                                            const std::string& body) {
    context_.path_params = path_params.is_object() ? std::move(path_params) : nlohmann::json::object();
    if (auto error = co_await apply_validator(options_.path_params_validator, context_.path_params, "path params")) {
        co_return error;
    }

    if (!options_.ignore_url_params) {
        context_.url_params = negotiator.parse_url_params();
        if (auto error = co_await apply_validator(options_.url_params_validator, context_.url_params, "url params")) {
            co_return error;
        }
    }

    const auto request_method = context_.get_method();
    if (request_method == method::POST || request_method == method::PUT) {
        if (auto error = negotiator.decode_body(body, context_.body_params)) {
            co_return error;
        }
        if (auto error = co_await apply_validator(options_.body_params_validator, context_.body_params, "body params")) {
            co_return error;
        }
    }

    context_.params = nlohmann::json::object();
    context_.assign_params(context_.body_params, param_source::body);
    context_.assign_params(context_.url_params, param_source::query);
    context_.assign_params(context_.path_params, param_source::path);
    LOG_TRACE("merged parameters: {}", context_.debug_parameters());

    if (auto error = co_await apply_validator(options_.params_validator, context_.params, "params")) {
        co_return error;
    }
    co_return std::nullopt;
}

} // namespace apisrv::http
