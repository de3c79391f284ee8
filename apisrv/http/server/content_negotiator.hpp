#ifndef APISRV_HTTP_CONTENT_NEGOTIATOR_HPP
#define APISRV_HTTP_CONTENT_NEGOTIATOR_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/content_type.hpp"
#include "../common/http_request.hpp"
#include "request_error.hpp"

namespace apisrv::http {

    /**
     * Decides whether a fully read request can be processed given its method, content type
     * and query string placement, and decodes its query string and body into parameter
     * objects.
     */
    class content_negotiator {
    public:
        explicit content_negotiator(const http_request& request);

        /**
         * Checks run before routing: the Content-Type header must parse, GET and DELETE
         * must come without a body, POST and PUT must have no query string and a supported
         * media type. Any other method is refused with 405.
         */
        std::optional<request_error> negotiate(const std::string& body);

        /// query string parameters; always an object, empty for POST and PUT
        nlohmann::json parse_url_params() const;

        /// decodes a POST or PUT body into a JSON object according to the media type
        std::optional<request_error> decode_body(const std::string& body, nlohmann::json& params) const;

        const std::optional<content_type>& get_content_type() const { return content_type_; }

        static bool is_form_media_type(const std::string& media_type);

    private:
        const http_request& request_;
        std::optional<content_type> content_type_;
    };

}

#endif
