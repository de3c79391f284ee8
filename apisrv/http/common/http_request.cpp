#include "http_request.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http{

    namespace method_strings{
        const std::string get = "GET";
        const std::string post = "POST";
        const std::string put = "PUT";
        const std::string del = "DELETE";
        const std::string unknown = "UNKNOWN";
    }

    method get_method(std::string_view method){
        if(boost::iequals(method, method_strings::get)) return method::GET;
        if(boost::iequals(method, method_strings::post)) return method::POST;
        if(boost::iequals(method, method_strings::put)) return method::PUT;
        if(boost::iequals(method, method_strings::del)) return method::DELETE;
        return method::UNKNOWN;
    }

    const std::string& get_method(method method){
        switch(method){
            case method::GET:
                return method_strings::get;
            case method::POST:
                return method_strings::post;
            case method::PUT:
                return method_strings::put;
            case method::DELETE:
                return method_strings::del;
            default:
                return method_strings::unknown;
        }
    }

    http_request::http_request(std::string method, std::string uri) :
        method_(std::move(method)),
        uri_(std::move(uri))
    {

    }

    void http_request::set_method(std::string method){
        method_ = std::move(method);
    }

    method http_request::get_method() const{
        return http::get_method(method_);
    }

    const std::string& http_request::get_method_name() const{
        return method_;
    }

    void http_request::set_uri(std::string uri){
        uri_ = std::move(uri);
    }

    const std::string& http_request::get_uri() const{
        return uri_;
    }

    std::string_view http_request::get_path() const{
        std::string_view uri = uri_;
        return uri.substr(0, uri.find('?'));
    }

    std::string_view http_request::get_query() const{
        std::string_view uri = uri_;
        auto pos = uri.find('?');
        if(pos == std::string_view::npos) return {};
        return uri.substr(pos + 1);
    }

    bool http_request::has_query() const{
        return uri_.find('?') != std::string::npos;
    }

    void http_request::log(const char* scope) const{
        LOG_DEBUG("[{}] {} {}", scope, method_, uri_);
        headers::log(scope);
    }

}
