#ifndef APISRV_HTTP_RESPONSE_HPP
#define APISRV_HTTP_RESPONSE_HPP

#include <memory>
#include <string>
#include "headers.hpp"

namespace apisrv::http {

class http_response : public headers {

public:

    // the status of the http_response.
    enum class status {
        ok = 200,
        created = 201,
        accepted = 202,
        no_content = 204,
        switching_protocols = 101,
        bad_request = 400,
        unauthorized = 401,
        forbidden = 403,
        not_found = 404,
        not_allowed = 405,
        not_acceptable = 406,
        timed_out = 408,
        conflict = 409,
        payload_too_large = 413,
        unsupported_media_type = 415,
        too_many_requests = 429,
        internal_server_error = 500,
        not_implemented = 501,
        service_unavailable = 503
    };

    http_response() = default;
    ~http_response() override = default;

    // some setters
    void set_content(std::string content);
    void set_content(std::string content, std::string content_type);
    void set_content_type(const std::string& content_type);
    void set_status(uint16_t status_code);
    void set_status(status status_code);

    // some getters
    const std::string& get_content() const;
    size_t get_content_size() const;
    status get_status() const;
    int get_status_code() const;
    bool is_ok() const;

    // log
    void log(const char* scope) const;

    /// canonical reason phrase for a status code, "Error" when the code is not known
    static const std::string& get_reason_phrase(int status_code);
    static const std::string& get_reason_phrase(status status);

    /**
     * Framework error reply: {"code": <int>, "message": <reason phrase>}. For 400 a non-empty
     * detail is appended to the message as " (<detail>)", without trailing periods.
     */
    static std::shared_ptr<http_response> json_error(status status, const std::string& detail = "");

private:
    std::string content_;
    int status_code_ = static_cast<int>(status::ok);
};

}

#endif
