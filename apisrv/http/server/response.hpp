#ifndef APISRV_HTTP_SERVER_RESPONSE_HPP
#define APISRV_HTTP_SERVER_RESPONSE_HPP

#include "../common/http_response.hpp"
#include "transport.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace apisrv::http {

/**
 * Response writer handed to handlers. A response is written to the sink at most once;
 * any further attempt throws std::runtime_error.
 */
class response {
private:
    std::shared_ptr<response_sink> sink_;
    std::shared_ptr<http_response> response_;
    bool pretty_json_ = false;
    std::once_flag sent_;
    std::atomic<bool> responded_{false};

    void ensure_not_responded() const {
        if (responded_) {
            throw std::runtime_error("Response already sent");
        }
    }

    void prepare_response() {
        if (!response_) {
            response_ = std::make_shared<http_response>();
        }
    }

    void send_prepared_response();

public:
    explicit response(std::shared_ptr<response_sink> sink, bool pretty_json = false)
        : sink_(std::move(sink)), pretty_json_(pretty_json) {}

    response(const response&) = delete;
    response& operator=(const response&) = delete;

    /**
     * JSON response, pretty printed when the server is configured to. Unless no_cache is
     * false, headers are added to keep clients and proxies from caching it.
     */
    void json(const nlohmann::json& data,
              http_response::status status = http_response::status::ok,
              bool no_cache = true);

    // Text response
    void send(const std::string& text, const std::string& content_type = "text/plain");

    /// framework error body {"code", "message"}; the detail is only shown for 400
    void error(http_response::status status, const std::string& detail = "");

    // Set status code (for building custom responses)
    void status(http_response::status s) {
        ensure_not_responded();
        prepare_response();
        response_->set_status(s);
    }

    // Set header (for building custom responses)
    void header(const std::string& key, const std::string& value) {
        ensure_not_responded();
        prepare_response();
        response_->add_header(key, value);
    }

    // Send raw http_response object (for advanced use cases)
    void send_response(const std::shared_ptr<http_response>& response);

    // Check if response has been sent
    bool has_responded() const {
        return responded_;
    }

    bool is_pretty_json() const {
        return pretty_json_;
    }
};

} // namespace apisrv::http

#endif // APISRV_HTTP_SERVER_RESPONSE_HPP
