#ifndef APISRV_HTTP_PARAM_PIPELINE_HPP
#define APISRV_HTTP_PARAM_PIPELINE_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "routing/handler_entry.hpp"
#include "content_negotiator.hpp"
#include "request_context.hpp"
#include "request_error.hpp"
#include "../../util/types.hpp"

namespace apisrv::http {

/**
 * Builds the parameters of a routed request. Stages run strictly in sequence and the first
 * failure stops the pipeline:
 *  - path parameters and their validator
 *  - query string parameters and their validator, unless the handler ignores them
 *  - body parameters (POST and PUT) and their validator
 *  - merge body, then query, then path into params
 *  - validator for the merged params
 */
class param_pipeline {
public:
    param_pipeline(request_context& context, const handler_options& options);

    awaitable<std::optional<request_error>> run(nlohmann::json path_params,
                                                const content_negotiator& negotiator,
                                                const std::string& body);

    /**
     * Runs a validator on a parameter object and replaces the object with its result.
     * A thrown exception is a 400 carrying its message; a result that is not an object
     * is a 500.
     */
    static awaitable<std::optional<request_error>> apply_validator(const validator& check,
                                                                   nlohmann::json& params,
                                                                   const char* stage);

private:
    request_context& context_;
    const handler_options& options_;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_PARAM_PIPELINE_HPP
