#ifndef APISRV_HTTP_REQUEST_HPP
#define APISRV_HTTP_REQUEST_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "headers.hpp"

namespace apisrv::http {

    enum class method {
        GET,
        POST,
        PUT,
        DELETE,
        UNKNOWN
    };

    /// case-insensitive verb lookup, UNKNOWN for anything outside the supported set
    method get_method(std::string_view method);

    const std::string& get_method(method method);

    /**
     * Already framed HTTP request as delivered by the transport: verb, raw request target
     * and headers. The body is not part of it; it is read separately from a body_stream.
     */
    class http_request : public headers {
    public:
        http_request() = default;
        http_request(std::string method, std::string uri);
        ~http_request() override = default;

        void set_method(std::string method);
        method get_method() const;
        const std::string& get_method_name() const;

        void set_uri(std::string uri);
        const std::string& get_uri() const;

        /// request target up to the first '?'
        std::string_view get_path() const;

        /// everything after the first '?', empty if there is none
        std::string_view get_query() const;

        bool has_query() const;

        void log(const char* scope) const;

    private:
        std::string method_;
        std::string uri_;
    };

}

#endif
