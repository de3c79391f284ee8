#include "http_response.hpp"
#include "../../util/logger.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>

namespace apisrv::http{

    namespace reason_phrases{

        const std::string ok = "OK";
        const std::string created = "Created";
        const std::string accepted = "Accepted";
        const std::string no_content = "No Content";
        const std::string switching_protocols = "Switching Protocols";
        const std::string bad_request = "Bad Request";
        const std::string unauthorized = "Unauthorized";
        const std::string forbidden = "Forbidden";
        const std::string not_found = "Not Found";
        const std::string not_allowed = "Method Not Allowed";
        const std::string not_acceptable = "Not Acceptable";
        const std::string timed_out = "Request Timeout";
        const std::string conflict = "Conflict";
        const std::string payload_too_large = "Payload Too Large";
        const std::string unsupported_media_type = "Unsupported Media Type";
        const std::string too_many_requests = "Too Many Requests";
        const std::string internal_server_error = "Internal Server Error";
        const std::string not_implemented = "Not Implemented";
        const std::string service_unavailable = "Service Unavailable";
        const std::string unknown = "Error";

    }

    const std::string& http_response::get_reason_phrase(status status){
        switch(status){
            case status::ok:
                return reason_phrases::ok;
            case status::created:
                return reason_phrases::created;
            case status::accepted:
                return reason_phrases::accepted;
            case status::no_content:
                return reason_phrases::no_content;
            case status::switching_protocols:
                return reason_phrases::switching_protocols;
            case status::bad_request:
                return reason_phrases::bad_request;
            case status::unauthorized:
                return reason_phrases::unauthorized;
            case status::forbidden:
                return reason_phrases::forbidden;
            case status::not_found:
                return reason_phrases::not_found;
            case status::not_allowed:
                return reason_phrases::not_allowed;
            case status::not_acceptable:
                return reason_phrases::not_acceptable;
            case status::timed_out:
                return reason_phrases::timed_out;
            case status::conflict:
                return reason_phrases::conflict;
            case status::payload_too_large:
                return reason_phrases::payload_too_large;
            case status::unsupported_media_type:
                return reason_phrases::unsupported_media_type;
            case status::too_many_requests:
                return reason_phrases::too_many_requests;
            case status::internal_server_error:
                return reason_phrases::internal_server_error;
            case status::not_implemented:
                return reason_phrases::not_implemented;
            case status::service_unavailable:
                return reason_phrases::service_unavailable;
            default:
                return reason_phrases::unknown;
        }
    }

    const std::string& http_response::get_reason_phrase(int status_code){
        return get_reason_phrase(static_cast<status>(status_code));
    }

    std::shared_ptr<http_response> http_response::json_error(status status, const std::string& detail){
        std::string message = get_reason_phrase(status);
        if(status == status::bad_request){
            std::string trimmed = boost::algorithm::trim_copy(detail);
            boost::algorithm::trim_right_if(trimmed, boost::algorithm::is_any_of("."));
            if(!trimmed.empty()){
                message += " (" + trimmed + ")";
            }
        }

        nlohmann::json body;
        body["code"] = static_cast<int>(status);
        body["message"] = message;

        auto response = std::make_shared<http_response>();
        response->set_status(status);
        response->set_content(body.dump(), "application/json; charset=utf-8");
        return response;
    }

    void http_response::set_content(std::string content){
        content_ = std::move(content);
    }

    void http_response::set_content(std::string content, std::string content_type){
        content_ = std::move(content);
        set_header(std::string(header::content_type), std::move(content_type));
    }

    void http_response::set_content_type(const std::string& content_type){
        set_header(std::string(header::content_type), content_type);
    }

    void http_response::set_status(uint16_t status_code){
        status_code_ = status_code;
    }

    void http_response::set_status(status status_code){
        status_code_ = static_cast<int>(status_code);
    }

    const std::string& http_response::get_content() const{
        return content_;
    }

    size_t http_response::get_content_size() const{
        return content_.size();
    }

    http_response::status http_response::get_status() const{
        return static_cast<status>(status_code_);
    }

    int http_response::get_status_code() const{
        return status_code_;
    }

    bool http_response::is_ok() const{
        return status_code_ >= 200 && status_code_ < 300;
    }

    void http_response::log(const char* scope) const{
        LOG_INFO("[{}] {} {}", scope, status_code_, get_reason_phrase(status_code_));

        headers::log(scope);

        if(!content_.empty()){
            LOG_TRACE("Body: {} bytes", content_.size());
            // Limit body output to avoid flooding logs
            if(content_.size() <= 500) {
                LOG_TRACE("  {}", content_);
            } else {
                LOG_TRACE("  {} (truncated)", content_.substr(0, 500));
            }
        }
    }

}
