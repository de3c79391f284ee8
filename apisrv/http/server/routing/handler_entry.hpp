#ifndef APISRV_HTTP_HANDLER_ENTRY_HPP
#define APISRV_HTTP_HANDLER_ENTRY_HPP

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "callback.hpp"
#include "path_template.hpp"

namespace apisrv::http {

// Forward declarations
class request_context;
class response;

// Request handlers: void(request_context&, response&) or awaitable<void>(request_context&, response&)
using handler = callback<void, request_context&, response&>;

// Validators receive one parameter object and return its (possibly transformed) replacement,
// which must be a JSON object. Throwing rejects the request with 400 and the exception message.
using validator = callback<nlohmann::json, const nlohmann::json&>;

struct handler_options {
    validator path_params_validator;
    validator url_params_validator;
    validator body_params_validator;
    validator params_validator;
    // skip query string parsing entirely for this handler
    bool ignore_url_params = false;
};

struct handler_entry {
    handler_entry(const std::string& pattern, handler callback, handler_options options)
        : path(pattern), callback(std::move(callback)), options(std::move(options)) {}

    const path_template path;
    const handler callback;
    const handler_options options;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_HANDLER_ENTRY_HPP
