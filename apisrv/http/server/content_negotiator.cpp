#include "content_negotiator.hpp"
#include "../util/url.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http {

    namespace {
        const std::string JSON_MEDIA_TYPE = "application/json";
        const std::string FORM_MEDIA_TYPE = "application/x-www-form-urlencoded";
        const std::string LEGACY_FORM_MEDIA_TYPE = "application/www-form-urlencoded";
    }

    content_negotiator::content_negotiator(const http_request& request) : request_(request) {
    }

    bool content_negotiator::is_form_media_type(const std::string& media_type) {
        return media_type == FORM_MEDIA_TYPE || media_type == LEGACY_FORM_MEDIA_TYPE;
    }

    std::optional<request_error> content_negotiator::negotiate(const std::string& body) {
        const auto& header_value = request_.get_content_type();
        if (!header_value.empty()) {
            content_type_ = content_type::parse(header_value);
            if (!content_type_) {
                return request_error{http_response::status::bad_request, "Unable to parse content-type."};
            }
        }

        switch (request_.get_method()) {
            case method::GET:
            case method::DELETE:
                if (!body.empty()) {
                    return request_error{http_response::status::bad_request,
                                         "Empty body required for " + request_.get_method_name() + " requests."};
                }
                return std::nullopt;
            case method::POST:
            case method::PUT: {
                if (request_.has_query()) {
                    return request_error{http_response::status::bad_request,
                                         "URL for POST or PUT must not contain query parameters."};
                }
                const std::string media_type = content_type_ ? content_type_->get_media_type() : std::string{};
                if (is_form_media_type(media_type)) {
                    return std::nullopt;
                }
                if (media_type == JSON_MEDIA_TYPE) {
                    if (content_type_->has_parameter("charset") && content_type_->get_parameter("charset") != "utf-8") {
                        return request_error{http_response::status::bad_request, "Bad charset for JSON content type."};
                    }
                    return std::nullopt;
                }
                // multipart/form-data included
                return request_error{http_response::status::bad_request,
                                     "POST or PUT body must be in JSON or www-form-urlencoded format."};
            }
            default:
                return request_error{http_response::status::not_allowed, "Only GET, POST, PUT, and DELETE are allowed."};
        }
    }

    nlohmann::json content_negotiator::parse_url_params() const {
        return util::url::parse_url_encoded_object(request_.get_query());
    }

    std::optional<request_error> content_negotiator::decode_body(const std::string& body, nlohmann::json& params) const {
        if (content_type_ && is_form_media_type(content_type_->get_media_type())) {
            params = util::url::parse_url_encoded_object(body);
            return std::nullopt;
        }

        // invalid UTF-8 is a parse error too
        auto parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            LOG_DEBUG("rejected JSON body of {} bytes", body.size());
            return request_error{http_response::status::bad_request, "Unable to parse JSON request body."};
        }
        params = std::move(parsed);
        return std::nullopt;
    }

}
