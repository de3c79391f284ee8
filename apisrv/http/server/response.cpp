#include "response.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http {

void response::send_prepared_response() {
    ensure_not_responded();
    prepare_response();

    bool written = false;
    std::call_once(sent_, [this, &written]() {
        responded_ = true;
        response_->log("SERVER RESPONSE");
        if (sink_) {
            sink_->write(response_);
        }
        written = true;
    });

    if (!written) {
        throw std::runtime_error("Response already sent");
    }
}

void response::json(const nlohmann::json& data, http_response::status status, bool no_cache) {
    ensure_not_responded();
    prepare_response();
    response_->set_status(status);
    if (no_cache) {
        response_->set_header(std::string(header::cache_control), "no-store, no-cache, must-revalidate, post-check=0, pre-check=0");
        response_->set_header(std::string(header::expires), "Wed, 01 Jan 2020 12:00:00 GMT");
        response_->set_header(std::string(header::pragma), "no-cache");
    }
    if (pretty_json_) {
        response_->set_content(data.dump(2) + "\n", "application/json; charset=utf-8");
    } else {
        response_->set_content(data.dump(), "application/json; charset=utf-8");
    }
    send_prepared_response();
}

void response::send(const std::string& text, const std::string& content_type) {
    ensure_not_responded();
    prepare_response();
    response_->set_content(text, content_type);
    send_prepared_response();
}

void response::error(http_response::status status, const std::string& detail) {
    ensure_not_responded();
    response_ = http_response::json_error(status, detail);
    send_prepared_response();
}

void response::send_response(const std::shared_ptr<http_response>& response) {
    ensure_not_responded();
    response_ = response;
    send_prepared_response();
}

} // namespace apisrv::http
